#pragma once

/**
 * @file keychain_generator.hpp
 * @brief Main header for the KeyForge keychain generator
 *
 * Turns a short text label and a few geometric parameters into an OpenSCAD
 * scene, renders it with the OpenSCAD command-line engine inside a private
 * temporary workspace, and hands back the binary STL bytes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace keyforge {

class FontCatalog;
class SceneDescription;

/// Catalog key used when a request does not name a font
inline constexpr const char* kDefaultFontKey = "Pacifico:style=Regular";

/// Label used when a request carries no usable name
inline constexpr const char* kDefaultLabel = "Keychain";

// ============================================================================
// Failure taxonomy
// ============================================================================

/**
 * @brief Classes of pipeline failure
 *
 * InvalidInput and UnknownFont are caller errors; everything else is a
 * server-side fault.
 */
enum class FailureKind {
    InvalidInput,
    UnknownFont,
    MissingFontAsset,
    EngineExecutionFailed,
    ArtifactNotProduced,
    EngineTimedOut,
    UnhandledFault
};

/**
 * @brief Stable name of a failure kind ("UnknownFont", ...)
 */
const char* failure_kind_name(FailureKind kind);

/**
 * @brief True for failures caused by the request rather than the server
 */
bool is_client_error(FailureKind kind);

/**
 * @brief Exception raised by pipeline stages for classified failures
 *
 * Only KeychainGenerator::generate() catches it; callers of the pipeline
 * see a RenderOutcome instead.
 */
class GenerationError : public std::runtime_error {
public:
    GenerationError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Service configuration
 *
 * Built once at startup (defaults, then JSON config file, then command-line
 * overrides) and treated as read-only afterwards.
 */
struct KeychainConfig {
    // Font catalog
    std::string fonts_dir = "fonts";
    std::map<std::string, std::string> fonts = {
        {"Pacifico:style=Regular", "Pacifico-Regular.ttf"},
        {"Lobster:style=Regular", "Lobster-Regular.ttf"}
    };
    std::string default_font = kDefaultFontKey;

    // Render engine
    std::string openscad_path = "openscad";
    std::string work_dir;              ///< Parent of per-request workspaces; empty = system temp dir
    int facet_count = 12;              ///< OpenSCAD $fn
    int render_timeout_seconds = 0;    ///< 0 = wait for the engine indefinitely

    // HTTP service
    std::string host = "0.0.0.0";
    int port = 5000;

    // Logging
    std::string log_level = "3";
    std::optional<std::string> log_file;
};

// ============================================================================
// Request and outcome types
// ============================================================================

/**
 * @brief One keychain generation request
 *
 * Numeric values are millimetres. width_option is the OpenSCAD text size.
 */
struct GenerationRequest {
    std::string raw_name = kDefaultLabel;
    std::string font_key = kDefaultFontKey;
    double text_height = 3.0;
    double border_thickness = 2.0;
    double width_option = 15.0;
};

/**
 * @brief Classified failure with a human-readable detail string
 */
struct RenderFailure {
    FailureKind kind = FailureKind::UnhandledFault;
    std::string detail;
};

/**
 * @brief Either the rendered mesh bytes or a classified failure
 */
class RenderOutcome {
public:
    static RenderOutcome success(std::vector<std::uint8_t> artifact) {
        return RenderOutcome(std::move(artifact));
    }

    static RenderOutcome failure(FailureKind kind, std::string detail) {
        return RenderOutcome(RenderFailure{kind, std::move(detail)});
    }

    bool ok() const { return std::holds_alternative<std::vector<std::uint8_t>>(value_); }

    /// Mesh bytes; only valid when ok()
    const std::vector<std::uint8_t>& artifact() const {
        return std::get<std::vector<std::uint8_t>>(value_);
    }

    /// Failure description; only valid when !ok()
    const RenderFailure& failure() const { return std::get<RenderFailure>(value_); }

private:
    explicit RenderOutcome(std::vector<std::uint8_t> artifact) : value_(std::move(artifact)) {}
    explicit RenderOutcome(RenderFailure failure) : value_(std::move(failure)) {}

    std::variant<std::vector<std::uint8_t>, RenderFailure> value_;
};

/**
 * @brief Everything a front end needs to answer one request
 */
struct GenerationResult {
    std::string sanitized_name;
    std::string font_key;
    double hole_offset = 0.0;
    RenderOutcome outcome = RenderOutcome::failure(FailureKind::UnhandledFault, "");
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief Download name: "<sanitized name>_<font display name>.stl"
     */
    std::string suggested_filename() const;
};

/**
 * @brief Scene synthesized for a request, before rendering
 */
struct PreparedScene {
    std::string sanitized_name;
    std::string font_key;
    std::string font_file;
    double hole_offset = 0.0;
    std::shared_ptr<const SceneDescription> scene;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Runs the full generation pipeline for independent requests
 *
 * Sanitize name -> resolve font -> compute hole offset -> write scene ->
 * render in a scoped workspace. Holds no per-request state, so one instance
 * serves concurrent requests.
 */
class KeychainGenerator {
public:
    /**
     * @brief Construct the pipeline
     * @param config Service configuration (copied)
     * @param catalog Font catalog; must outlive the generator
     */
    KeychainGenerator(const KeychainConfig& config, const FontCatalog& catalog);
    ~KeychainGenerator();

    KeychainGenerator(const KeychainGenerator&) = delete;
    KeychainGenerator& operator=(const KeychainGenerator&) = delete;

    /**
     * @brief Run every stage up to (not including) rendering
     * @throws GenerationError for InvalidInput, UnknownFont, MissingFontAsset
     */
    PreparedScene prepare(const GenerationRequest& request) const;

    /**
     * @brief Run the whole pipeline; never throws
     */
    GenerationResult generate(const GenerationRequest& request) const;

    const KeychainConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace keyforge
