#include "executor.hpp"
#include <filesystem>
#include <map>
#include <cstring>
#include <format>

Executor::Executor(ProcessRunner& runner) : runner(runner) {}

std::expected<TransferOutcome, TransferError> Executor::run(Strategy strategy, const ArgumentVector& argv) {
    auto result = runner.run(argv);
    if (!result) {
        return std::unexpected(result.error());
    }

    TransferOutcome outcome;
    outcome.strategy = strategy;
    outcome.exitCode = result->exitCode;
    outcome.succeeded = result->exitCode == 0 && !result->terminatingSignal;
    outcome.diagnostic = result->diagnostic;
    if (!outcome.succeeded) {
        outcome.classification = classifyExitCode(argv.front(), result->exitCode, result->terminatingSignal);
    }
    return outcome;
}

std::optional<std::string> Executor::classifyExitCode(const std::string& program, int exitCode,
                                                      std::optional<int> signal) {
    if (signal) {
        const char* name = strsignal(*signal);
        return name ? std::format("interrupted by signal {} ({})", *signal, name)
                    : std::format("interrupted by signal {}", *signal);
    }

    std::string family = std::filesystem::path(program).filename().string();

    if (family == "rsync") {
        static const std::map<int, const char*> rsyncCodes = {
            {1, "usage error"},
            {2, "protocol incompatibility"},
            {3, "file selection error"},
            {4, "requested action not supported"},
            {5, "error starting client-server protocol"},
            {10, "socket I/O error"},
            {11, "file I/O error"},
            {12, "protocol data stream error"},
            {13, "program diagnostics error"},
            {14, "IPC error"},
            {20, "interrupted"},
            {21, "waitpid error"},
            {22, "memory allocation error"},
            {23, "partial transfer due to error"},
            {24, "partial transfer, source files vanished"},
            {25, "max-delete limit reached"},
            {30, "timeout in data send/receive"},
            {35, "timeout waiting for daemon connection"},
            {255, "connection or authentication failure"},
        };
        auto it = rsyncCodes.find(exitCode);
        if (it != rsyncCodes.end()) {
            return std::string(it->second);
        }
        return std::nullopt;
    }

    if (family == "scp") {
        if (exitCode == 1) {
            return std::string("transfer failed");
        }
        if (exitCode == 255) {
            return std::string("connection or authentication failure");
        }
        return std::nullopt;
    }

    if (family == "ssh") {
        switch (exitCode) {
            case 255: return std::string("connection or authentication failure");
            case 2: return std::string("remote path not accessible");
            case 1: return std::string("remote listing incomplete");
            default: return std::nullopt;
        }
    }
    return std::nullopt;
}
