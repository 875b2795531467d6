/**
 * @file ProcessRunner.hpp
 * @brief Runs an external command to completion with captured output
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace keyforge {

/**
 * @brief What to run
 */
struct ProcessSpec {
    std::vector<std::string> argv;   ///< argv[0] is looked up in PATH when it has no '/'
    std::vector<std::pair<std::string, std::string>> extra_env;  ///< Added to (or replacing in) the inherited environment
    std::chrono::milliseconds timeout{0};  ///< 0 = no limit
};

/**
 * @brief How it ended
 */
struct ProcessResult {
    int exit_code = -1;      ///< Exit status, or 128 + signal number when killed by a signal
    int term_signal = 0;     ///< Terminating signal, 0 if the process exited normally
    bool timed_out = false;  ///< Killed because the timeout expired
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief fork/exec wrapper
 *
 * stdin is /dev/null; stdout and stderr are drained concurrently so a chatty
 * child cannot block on a full pipe. A command that cannot be executed ends
 * with exit code 127 and an explanation on its captured stderr.
 */
class ProcessRunner {
public:
    /// Exit status reported when exec itself fails
    static constexpr int kExecFailedStatus = 127;

    /**
     * @brief Run and wait
     * @throws std::runtime_error if pipes cannot be created or fork fails
     */
    ProcessResult run(const ProcessSpec& spec) const;
};

} // namespace keyforge
