/**
 * @file ScopedWorkspace.cpp
 * @brief Implementation of the RAII temporary workspace
 */

#include "ScopedWorkspace.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <stdlib.h>
#include <vector>

namespace keyforge {

ScopedWorkspace::ScopedWorkspace(const std::filesystem::path& parent, const std::string& prefix)
    : logger_("ScopedWorkspace")
{
    const std::filesystem::path base = parent.empty()
        ? std::filesystem::temp_directory_path()
        : parent;

    const std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Cannot create workspace under " + base.string() + ": " +
                                 std::strerror(errno));
    }

    path_ = buffer.data();
    logger_.debug("Created workspace " + path_.string());
}

ScopedWorkspace::~ScopedWorkspace() {
    release();
}

bool ScopedWorkspace::release() {
    if (released_) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        logger_.warning("Failed to remove workspace " + path_.string() + ": " + ec.message());
        return false;
    }

    released_ = true;
    logger_.debug("Removed workspace " + path_.string());
    return true;
}

} // namespace keyforge
