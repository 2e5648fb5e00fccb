/**
 * @file transfer_api.hpp
 * @brief High-level entry points for the xfer transfer commands.
 *
 * Wires one request through resolution, strategy selection, command construction and
 * execution. Every validation step runs before anything is spawned.
 */

#ifndef TRANSFER_API_HPP
#define TRANSFER_API_HPP

#include <string>
#include <optional>
#include <expected>
#include "xfer_config.hpp"
#include "profile_store.hpp"
#include "file_system.hpp"
#include "process_runner.hpp"
#include "executor.hpp"

/**
 * @brief Transfer commands of the CLI.
 */
enum class TransferMode {
    Send, ///< local source, remote destination
    Get,  ///< remote source, local destination
    Sync  ///< either direction, always directory-sync
};

/**
 * @brief Orchestrates transfer and listing requests.
 *
 * Holds references only; the configuration, store and capabilities must outlive it.
 */
class TransferAPI {
public:
    TransferAPI(const XferConfig& config, const ProfileStore& store,
                const FileSystem& fileSystem, ProcessRunner& runner);

    /**
     * @brief Runs a send, get or sync request.
     *
     * @param source Source expression ("./dist" or "alias:/path").
     * @param destination Destination expression.
     * @param mode Command that was invoked.
     * @param recursive Explicit -r on send/get; implied by Sync.
     * @return std::expected<TransferOutcome, TransferError> Successful outcome, a validation
     *         error, SpawnFailed, or MechanismFailure carrying the exit code.
     */
    std::expected<TransferOutcome, TransferError> transfer(const std::string& source,
                                                           const std::string& destination,
                                                           TransferMode mode, bool recursive = false);

    /**
     * @brief Lists a remote directory.
     *
     * @param location "alias:/path"; the default server's default path when absent.
     * @return std::expected<TransferOutcome, TransferError> Same contract as transfer().
     */
    std::expected<TransferOutcome, TransferError> list(const std::optional<std::string>& location);

private:
    std::expected<TransferOutcome, TransferError> dispatch(const TransferRequest& request);

    const XferConfig& config;
    const ProfileStore& store;
    const FileSystem& fileSystem;
    ProcessRunner& runner;
};

#endif // TRANSFER_API_HPP
