/**
 * @file process_runner.hpp
 * @brief Runs external programs with an explicit environment and a timeout.
 *
 * Arguments are passed as a vector, never through a shell. Credentials for a tool are
 * given in the environment overlay, which only the child process sees.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct ProcessRequest {
    std::string program;                              ///< Executable name or path (looked up in PATH).
    std::vector<std::string> args;                    ///< Arguments, without argv[0].
    std::map<std::string, std::string> environment;   ///< Variables added to the inherited environment.
    std::filesystem::path workingDirectory;           ///< Child working directory; empty keeps the current one.
    std::chrono::seconds timeout{std::chrono::hours(6)}; ///< Wall-clock limit.
};

struct ProcessResult {
    int exitCode = -1;   ///< Exit status, or -1 when the child was killed by a signal.
    bool timedOut = false;
    std::string output;  ///< Combined stdout and stderr.
};

/**
 * @brief Runs a program to completion and captures its combined output.
 *
 * When the timeout expires the child's whole process group is killed and the result is
 * returned with timedOut set.
 *
 * @return std::expected<ProcessResult, std::string> The result, or an error if the program
 * could not be started.
 */
std::expected<ProcessResult, std::string> runProcess(const ProcessRequest& request);

/**
 * @brief Counts " error:" markers in tool output, case-insensitively.
 */
std::size_t countErrorMarkers(std::string_view output);

/**
 * @brief Renders a command line for logs, with values of "-p<secret>" arguments masked.
 */
std::string describeCommand(const ProcessRequest& request);

#endif // PROCESS_RUNNER_HPP
