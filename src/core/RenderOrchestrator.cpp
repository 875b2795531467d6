/**
 * @file RenderOrchestrator.cpp
 * @brief Implementation of engine invocation and outcome classification
 */

#include "RenderOrchestrator.hpp"
#include "ScopedWorkspace.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace keyforge {

namespace {

std::string join_command(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

} // namespace

EngineSettings EngineSettings::from_config(const KeychainConfig& config) {
    EngineSettings settings;
    settings.executable = config.openscad_path;
    settings.work_dir = config.work_dir;
    if (!config.fonts_dir.empty()) {
        settings.font_dir = std::filesystem::absolute(config.fonts_dir).lexically_normal();
    }
    settings.timeout = std::chrono::seconds(config.render_timeout_seconds);
    return settings;
}

RenderOrchestrator::RenderOrchestrator(EngineSettings settings)
    : settings_(std::move(settings))
    , logger_("RenderOrchestrator")
{
}

std::vector<std::string> RenderOrchestrator::build_command(
    const std::filesystem::path& scene_file,
    const std::filesystem::path& mesh_file) const {
    return {
        settings_.executable,
        "-o", mesh_file.string(),
        scene_file.string(),
        "--export-format", "binstl",
        "--quiet"
    };
}

RenderOutcome RenderOrchestrator::render(const SceneDescription& scene) const {
    ScopedWorkspace workspace(settings_.work_dir);

    const auto scene_file = workspace.file(kSceneFileName);
    const auto mesh_file = workspace.file(kMeshFileName);

    {
        std::ofstream out(scene_file, std::ios::binary);
        out << scene.source();
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to write scene file " + scene_file.string());
        }
    }
    logger_.trace("Scene (" + std::to_string(scene.size()) + " bytes):\n" + scene.source());

    ProcessSpec spec;
    spec.argv = build_command(scene_file, mesh_file);
    spec.timeout = settings_.timeout;
    if (!settings_.font_dir.empty()) {
        spec.extra_env.emplace_back("OPENSCAD_FONT_PATH", settings_.font_dir.string());
    }

    logger_.debug("Running: " + join_command(spec.argv));
    const ProcessResult result = runner_.run(spec);
    logger_.detailed("Engine finished in " + std::to_string(result.duration.count()) +
                     "ms with exit code " + std::to_string(result.exit_code));

    return classify(result, mesh_file);
}

RenderOutcome RenderOrchestrator::classify(const ProcessResult& result,
                                           const std::filesystem::path& mesh_file) const {
    if (result.timed_out) {
        logger_.error("OpenSCAD did not finish within " +
                      std::to_string(settings_.timeout.count()) + "s and was killed");
        return RenderOutcome::failure(
            FailureKind::EngineTimedOut,
            "Rendering exceeded " + std::to_string(settings_.timeout.count()) + " seconds");
    }

    if (result.exit_code != 0) {
        const std::string& diagnostics = result.stderr_text.empty()
            ? result.stdout_text
            : result.stderr_text;
        logger_.error("OpenSCAD failed:");
        logger_.error("  Return code: " + std::to_string(result.exit_code));
        logger_.error("  Error: " + diagnostics);
        return RenderOutcome::failure(FailureKind::EngineExecutionFailed, diagnostics);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(mesh_file, ec)) {
        logger_.error("OpenSCAD exited cleanly but " + std::string(kMeshFileName) + " was not created");
        return RenderOutcome::failure(FailureKind::ArtifactNotProduced, "STL file not generated");
    }

    std::ifstream in(mesh_file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open rendered mesh " + mesh_file.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Failed to read rendered mesh " + mesh_file.string());
    }

    logger_.detailed("Read " + std::to_string(bytes.size()) + " bytes of STL");
    return RenderOutcome::success(std::move(bytes));
}

} // namespace keyforge
