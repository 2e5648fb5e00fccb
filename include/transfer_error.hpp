/**
 * @file transfer_error.hpp
 * @brief Error taxonomy shared by every xfer component.
 *
 * All fallible operations return std::expected<T, TransferError>. The error kind decides
 * the process exit code reported by the CLI; the message names the offending alias or path.
 */

#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <string>
#include <optional>

/**
 * @brief Kinds of failure an xfer request can end with.
 */
enum class ErrorKind {
    Usage,            ///< Malformed command line.
    UnknownAlias,     ///< Alias not present in the profile store.
    DuplicateAlias,   ///< Alias already present in the profile store.
    InvalidProfile,   ///< Profile fails validation or references a missing key file.
    InvalidTarget,    ///< Malformed `alias:path` expression or wrong transfer direction.
    AmbiguousRequest, ///< Request has no remote side (or two remote sides).
    StoreCorrupt,     ///< Store file exists but cannot be parsed or holds invalid entries.
    StoreUnavailable, ///< Store file, lock or temp file cannot be read or written.
    SpawnFailed,      ///< External executable could not be located or started.
    MechanismFailure  ///< External executable ran and exited non-zero.
};

/**
 * @brief Typed error record.
 *
 * exitCode and classification are only meaningful for ErrorKind::MechanismFailure.
 */
struct TransferError {
    ErrorKind kind;
    std::string message;
    int exitCode = 0;
    std::optional<std::string> classification;

    TransferError(ErrorKind kind, std::string message);

    /**
     * @brief Builds a MechanismFailure error.
     *
     * @param program Name of the external mechanism (e.g., "rsync").
     * @param exitCode Exit code reported by the mechanism.
     * @param classification Best-effort classification of the exit code, if any.
     * @param diagnostic Last diagnostic line written by the mechanism, if any.
     */
    static TransferError mechanism(const std::string& program, int exitCode,
                                   std::optional<std::string> classification,
                                   const std::optional<std::string>& diagnostic);

    /**
     * @brief Renders the single-line diagnostic shown to the user.
     */
    std::string describe() const;
};

/**
 * @brief Stable name of an error kind, as shown in diagnostics.
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Maps an error kind to the CLI exit code.
 *
 * 1 for usage and validation errors, 2 for mechanism errors, 3 for store errors.
 */
int exitCodeFor(ErrorKind kind);

#endif // TRANSFER_ERROR_HPP
