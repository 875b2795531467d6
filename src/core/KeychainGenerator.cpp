/**
 * @file KeychainGenerator.cpp
 * @brief Pipeline wiring: sanitize, resolve, lay out, synthesize, render
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "keychain_generator.hpp"
#include "NameSanitizer.hpp"
#include "FontCatalog.hpp"
#include "HoleLayout.hpp"
#include "ScadSceneWriter.hpp"
#include "RenderOrchestrator.hpp"
#include "Logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace keyforge {

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::InvalidInput: return "InvalidInput";
        case FailureKind::UnknownFont: return "UnknownFont";
        case FailureKind::MissingFontAsset: return "MissingFontAsset";
        case FailureKind::EngineExecutionFailed: return "EngineExecutionFailed";
        case FailureKind::ArtifactNotProduced: return "ArtifactNotProduced";
        case FailureKind::EngineTimedOut: return "EngineTimedOut";
        case FailureKind::UnhandledFault: return "UnhandledFault";
    }
    return "UnhandledFault";
}

bool is_client_error(FailureKind kind) {
    return kind == FailureKind::InvalidInput || kind == FailureKind::UnknownFont;
}

std::string GenerationResult::suggested_filename() const {
    return sanitized_name + "_" + font_display_name(font_key) + ".stl";
}

namespace {

void require_positive(const char* parameter, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << parameter << " must be a positive number, got " << value;
        throw GenerationError(FailureKind::InvalidInput, oss.str());
    }
}

std::string format_offset(double offset) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << offset;
    return oss.str();
}

} // namespace

class KeychainGenerator::Impl {
public:
    Impl(const KeychainConfig& config, const FontCatalog& catalog)
        : config_(config)
        , resolver_(catalog)
        , writer_(config.facet_count)
        , orchestrator_(EngineSettings::from_config(config))
        , logger_("KeychainGenerator")
    {
    }

    KeychainConfig config_;
    FontResolver resolver_;
    ScadSceneWriter writer_;
    RenderOrchestrator orchestrator_;
    Logger logger_;
};

KeychainGenerator::KeychainGenerator(const KeychainConfig& config, const FontCatalog& catalog)
    : impl_(std::make_unique<Impl>(config, catalog)) {
}

KeychainGenerator::~KeychainGenerator() = default;

const KeychainConfig& KeychainGenerator::get_config() const {
    return impl_->config_;
}

PreparedScene KeychainGenerator::prepare(const GenerationRequest& request) const {
    PreparedScene prepared;
    prepared.sanitized_name = NameSanitizer::sanitize(request.raw_name);
    prepared.font_key = request.font_key;

    impl_->logger_.info("Generating STL: name='" + prepared.sanitized_name +
                        "', font='" + request.font_key + "'");

    require_positive("textHeight", request.text_height);
    require_positive("borderThickness", request.border_thickness);
    require_positive("widthOption", request.width_option);

    prepared.font_file = impl_->resolver_.resolve(request.font_key);

    prepared.hole_offset = HoleLayout::hole_offset(prepared.sanitized_name.size(),
                                                   request.width_option,
                                                   request.border_thickness);
    impl_->logger_.detailed("Hole offset " + format_offset(prepared.hole_offset) +
                            " for " + std::to_string(prepared.sanitized_name.size()) + " characters");

    SceneParameters params;
    params.text = prepared.sanitized_name;
    params.font_file = prepared.font_file;
    params.text_height = request.text_height;
    params.border_thickness = request.border_thickness;
    params.font_size = request.width_option;
    params.hole_offset = prepared.hole_offset;
    prepared.scene = std::make_shared<const SceneDescription>(impl_->writer_.write(params));

    return prepared;
}

GenerationResult KeychainGenerator::generate(const GenerationRequest& request) const {
    const auto started = std::chrono::steady_clock::now();

    GenerationResult result;
    result.sanitized_name = NameSanitizer::sanitize(request.raw_name);
    result.font_key = request.font_key;

    try {
        PreparedScene prepared = prepare(request);
        result.hole_offset = prepared.hole_offset;
        result.outcome = impl_->orchestrator_.render(*prepared.scene);
    } catch (const GenerationError& e) {
        result.outcome = RenderOutcome::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        impl_->logger_.error(std::string("Unexpected error: ") + e.what());
        result.outcome = RenderOutcome::failure(FailureKind::UnhandledFault,
                                                "Unexpected internal error");
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.outcome.ok()) {
        impl_->logger_.info("Success! (len=" + std::to_string(result.sanitized_name.size()) +
                            ", offset=" + format_offset(result.hole_offset) +
                            ", bytes=" + std::to_string(result.outcome.artifact().size()) +
                            ", " + std::to_string(result.elapsed.count()) + "ms)");
    } else {
        const RenderFailure& failure = result.outcome.failure();
        impl_->logger_.detailed(std::string("Generation failed: ") +
                                failure_kind_name(failure.kind));
    }
    impl_->logger_.flush();

    return result;
}

} // namespace keyforge
