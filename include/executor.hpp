/**
 * @file executor.hpp
 * @brief Runs built invocations and interprets their exit status.
 */

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <string>
#include <optional>
#include <expected>
#include "command_builder.hpp"
#include "process_runner.hpp"

/**
 * @brief Result of one mechanism run.
 */
struct TransferOutcome {
    Strategy strategy = Strategy::SingleFileCopy; ///< Strategy the invocation was built for.
    int exitCode = 0;                          ///< Mechanism exit code (128 + signal if killed).
    bool succeeded = false;                    ///< True only for exit code 0.
    std::optional<std::string> classification; ///< Best-effort meaning of a non-zero exit code.
    std::optional<std::string> diagnostic;     ///< Last stderr line of the mechanism.
};

/**
 * @brief Runs invocations through a ProcessRunner.
 *
 * Blocks until the child exits. Never retries.
 */
class Executor {
public:
    /**
     * @brief Constructs an executor.
     *
     * @param runner Process-spawning capability; must outlive the executor.
     */
    explicit Executor(ProcessRunner& runner);

    /**
     * @brief Runs an invocation to completion.
     *
     * @param strategy Strategy the invocation was built for.
     * @param argv Invocation from CommandBuilder::build().
     * @return std::expected<TransferOutcome, TransferError> Outcome (successful or not), or
     *         SpawnFailed if the mechanism could not be started.
     */
    std::expected<TransferOutcome, TransferError> run(Strategy strategy, const ArgumentVector& argv);

    /**
     * @brief Classifies a non-zero exit code of a mechanism.
     *
     * Uses the documented exit codes of rsync, and the ssh convention of 255 for
     * connection or authentication failures. The meaning of codes varies between
     * versions and distributions, so the result is informational only.
     *
     * @param program Mechanism name or path ("rsync", "/usr/bin/scp", ...).
     * @param exitCode Non-zero exit code.
     * @param signal Terminating signal, if the mechanism was killed.
     * @return std::optional<std::string> Classification, or nullopt for unrecognized codes.
     */
    static std::optional<std::string> classifyExitCode(const std::string& program, int exitCode,
                                                       std::optional<int> signal = std::nullopt);

private:
    ProcessRunner& runner; ///< Process-spawning capability.
};

#endif // EXECUTOR_HPP
