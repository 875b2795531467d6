/**
 * @file ScopedWorkspace.hpp
 * @brief Private temporary directory removed when the owner goes out of scope
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <filesystem>
#include <string>

namespace keyforge {

/**
 * @brief RAII temporary directory
 *
 * The directory is created with mkdtemp (mode 0700, unique name) under a
 * parent directory and removed recursively on destruction, whichever way the
 * owning scope is left. Never shared between requests.
 */
class ScopedWorkspace {
public:
    /**
     * @brief Create a fresh workspace
     * @param parent Directory to create it in; empty means the system temp dir
     * @param prefix Directory name prefix; six random characters are appended
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit ScopedWorkspace(const std::filesystem::path& parent,
                             const std::string& prefix = "keyforge-");

    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;
    ScopedWorkspace(ScopedWorkspace&&) = delete;
    ScopedWorkspace& operator=(ScopedWorkspace&&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Path of a file inside the workspace
     */
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

    /**
     * @brief Remove the directory now instead of at destruction
     * @return true if it no longer exists
     */
    bool release();

private:
    std::filesystem::path path_;
    bool released_ = false;
    Logger logger_;
};

} // namespace keyforge
