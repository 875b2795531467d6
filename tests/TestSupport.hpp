/**
 * @file TestSupport.hpp
 * @brief PASS/FAIL counters and scratch-directory helpers for the test executables
 */

#pragma once

#include "ScopedWorkspace.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <sys/stat.h>

namespace keyforge::test {

inline int g_pass = 0;
inline int g_fail = 0;

inline bool require(bool cond, const std::string& label) {
    if (cond) {
        std::cout << "  PASS: " << label << "\n";
        ++g_pass;
    } else {
        std::cout << "  FAIL: " << label << "\n";
        ++g_fail;
    }
    return cond;
}

inline void section(const std::string& name) {
    std::cout << "\n[" << name << "]\n";
}

/// Print the totals; use as main()'s return value
inline int summary(const std::string& suite) {
    std::cout << "\n" << suite << ": " << g_pass << " passed, " << g_fail << " failed\n";
    return g_fail == 0 ? 0 : 1;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/**
 * @brief Write an executable /bin/sh script standing in for the render engine
 *
 * The engine is invoked as: <script> -o <mesh> <scene> --export-format binstl --quiet
 * so inside the script $2 is the mesh path and $3 the scene path.
 */
inline std::filesystem::path write_engine(const std::filesystem::path& dir,
                                          const std::string& name,
                                          const std::string& body) {
    const auto path = dir / name;
    write_file(path, "#!/bin/sh\n" + body + "\n");
    ::chmod(path.c_str(), 0755);
    return path;
}

inline bool directory_is_empty(const std::filesystem::path& dir) {
    return std::filesystem::is_directory(dir) && std::filesystem::is_empty(dir);
}

} // namespace keyforge::test
