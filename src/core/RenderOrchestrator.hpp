/**
 * @file RenderOrchestrator.hpp
 * @brief Renders a scene with the OpenSCAD command-line engine
 *
 * Each call acquires its own ScopedWorkspace, writes the scene file, runs
 * the engine once, classifies the result and removes the workspace before
 * returning:
 *
 *   Idle -> WorkspaceCreated -> Invoked -> {Succeeded | Failed} -> Cleaned
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keychain_generator.hpp"
#include "ScadSceneWriter.hpp"
#include "ProcessRunner.hpp"
#include "Logger.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace keyforge {

/**
 * @brief Engine invocation settings
 */
struct EngineSettings {
    std::string executable = "openscad";
    std::filesystem::path work_dir;            ///< Workspace parent; empty = system temp dir
    std::filesystem::path font_dir;            ///< Exported to the engine as OPENSCAD_FONT_PATH; empty = not set
    std::chrono::seconds timeout{0};           ///< 0 = wait indefinitely

    static EngineSettings from_config(const KeychainConfig& config);
};

/**
 * @brief Scene file -> engine -> STL bytes
 */
class RenderOrchestrator {
public:
    static constexpr const char* kSceneFileName = "keychain.scad";
    static constexpr const char* kMeshFileName = "keychain.stl";

    explicit RenderOrchestrator(EngineSettings settings);

    /**
     * @brief Render one scene; never throws for engine-level failures
     *
     * @return Mesh bytes, or EngineExecutionFailed / ArtifactNotProduced /
     *         EngineTimedOut
     * @throws std::runtime_error when the workspace or scene file cannot be
     *         created or the process cannot be spawned (workspace still removed)
     */
    RenderOutcome render(const SceneDescription& scene) const;

    /**
     * @brief argv for rendering scene_file into mesh_file
     */
    std::vector<std::string> build_command(const std::filesystem::path& scene_file,
                                           const std::filesystem::path& mesh_file) const;

    const EngineSettings& settings() const { return settings_; }

private:
    EngineSettings settings_;
    ProcessRunner runner_;
    Logger logger_;

    RenderOutcome classify(const ProcessResult& result,
                           const std::filesystem::path& mesh_file) const;
};

} // namespace keyforge
