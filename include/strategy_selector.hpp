/**
 * @file strategy_selector.hpp
 * @brief Structural choice of the transfer mechanism for a request.
 *
 * The decision only looks at the shape of the request (which sides are remote, whether
 * a destination exists, whether recursion is requested), never at file contents.
 */

#ifndef STRATEGY_SELECTOR_HPP
#define STRATEGY_SELECTOR_HPP

#include <optional>
#include <expected>
#include "target_resolver.hpp"
#include "file_system.hpp"

/**
 * @brief Transfer strategies, each bound to one external mechanism.
 */
enum class Strategy {
    SingleFileCopy, ///< scp
    DirectorySync,  ///< rsync over ssh
    RemoteList      ///< ssh running ls
};

/**
 * @brief Stable display name of a strategy ("single-file-copy", ...).
 */
const char* strategyName(Strategy strategy);

/**
 * @brief A transfer (or listing) request after target resolution.
 */
struct TransferRequest {
    Endpoint source;                    ///< Where data comes from (or what to list).
    std::optional<Endpoint> destination;///< Absent for listings.
    bool recursive = false;             ///< Directory semantics, explicit or inferred.
};

/**
 * @brief Builds a request, inferring recursion from the source shape.
 *
 * recursive is set when forceSync is given or when the source is a local directory.
 *
 * @param source Resolved source endpoint.
 * @param destination Resolved destination endpoint, absent for listings.
 * @param forceSync True for `sync` and for `-r` on send/get.
 * @param fileSystem Filesystem used to inspect a local source.
 */
TransferRequest makeTransferRequest(Endpoint source, std::optional<Endpoint> destination,
                                    bool forceSync, const FileSystem& fileSystem);

/**
 * @brief Selects the strategy for a request.
 *
 * First match wins:
 * | Condition                                    | Result            |
 * |----------------------------------------------|-------------------|
 * | no remote side                               | AmbiguousRequest  |
 * | both sides remote                            | AmbiguousRequest  |
 * | recursive, with a destination                | DirectorySync     |
 * | no destination, remote source                | RemoteList        |
 * | otherwise                                    | SingleFileCopy    |
 *
 * @param request Request to classify.
 * @return std::expected<Strategy, TransferError> Strategy or AmbiguousRequest.
 */
std::expected<Strategy, TransferError> selectStrategy(const TransferRequest& request);

#endif // STRATEGY_SELECTOR_HPP
