#include "transfer_error.hpp"
#include <format>
#include <utility>

TransferError::TransferError(ErrorKind kind, std::string message)
    : kind(kind), message(std::move(message)) {}

TransferError TransferError::mechanism(const std::string& program, int exitCode,
                                       std::optional<std::string> classification,
                                       const std::optional<std::string>& diagnostic) {
    std::string msg = std::format("{} exited with code {}", program, exitCode);
    if (classification) {
        msg += std::format(" ({})", *classification);
    }
    if (diagnostic && !diagnostic->empty()) {
        msg += std::format(": {}", *diagnostic);
    }
    TransferError error(ErrorKind::MechanismFailure, std::move(msg));
    error.exitCode = exitCode;
    error.classification = std::move(classification);
    return error;
}

std::string TransferError::describe() const {
    return std::format("{}: {}", errorKindName(kind), message);
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage: return "Usage";
        case ErrorKind::UnknownAlias: return "UnknownAlias";
        case ErrorKind::DuplicateAlias: return "DuplicateAlias";
        case ErrorKind::InvalidProfile: return "InvalidProfile";
        case ErrorKind::InvalidTarget: return "InvalidTarget";
        case ErrorKind::AmbiguousRequest: return "AmbiguousRequest";
        case ErrorKind::StoreCorrupt: return "StoreCorrupt";
        case ErrorKind::StoreUnavailable: return "StoreUnavailable";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::MechanismFailure: return "MechanismFailure";
    }
    return "Unknown";
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailed:
        case ErrorKind::MechanismFailure:
            return 2;
        case ErrorKind::StoreCorrupt:
        case ErrorKind::StoreUnavailable:
            return 3;
        default:
            return 1;
    }
}
