/**
 * @file process_runner.hpp
 * @brief Process-spawning capability used by the Executor.
 *
 * The Executor never starts processes itself; it calls through this interface so that
 * tests can substitute canned outcomes for the real rsync/scp/ssh binaries.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <filesystem>
#include "transfer_error.hpp"

/**
 * @brief Termination status of a child process.
 */
struct ProcessResult {
    int exitCode = 0;                      ///< Exit status, or 128 + signal number.
    std::optional<int> terminatingSignal;  ///< Set when the child was killed by a signal.
    std::optional<std::string> diagnostic; ///< Last non-empty line the child wrote to stderr.
};

/**
 * @brief Interface for running an external program to completion.
 */
class ProcessRunner {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a program and waits for it to exit.
     *
     * @param argv Program name (looked up in PATH) followed by its arguments.
     * @param workingDirectory Directory to run in; the current one when absent.
     * @return std::expected<ProcessResult, TransferError> Termination status, or SpawnFailed
     *         if the program could not be located or started.
     */
    virtual std::expected<ProcessResult, TransferError> run(
        const std::vector<std::string>& argv,
        const std::optional<std::filesystem::path>& workingDirectory = std::nullopt) = 0;
};

/**
 * @brief ProcessRunner based on fork/execvp.
 *
 * The child's stdout is inherited. Its stderr is relayed to ours as it arrives, and the
 * last line is kept as the diagnostic. SIGINT, SIGTERM and SIGHUP received while the
 * child runs are forwarded to it; the child is always reaped before run() returns.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<ProcessResult, TransferError> run(
        const std::vector<std::string>& argv,
        const std::optional<std::filesystem::path>& workingDirectory = std::nullopt) override;
};

#endif // PROCESS_RUNNER_HPP
