/**
 * @file target_resolver.hpp
 * @brief Resolution of `alias:path` expressions into transfer endpoints.
 *
 * An expression whose first ':' comes before any '/' names a remote location through a
 * stored alias; anything else is a local filesystem path.
 */

#ifndef TARGET_RESOLVER_HPP
#define TARGET_RESOLVER_HPP

#include <string>
#include <expected>
#include "profile_store.hpp"

/**
 * @brief One side of a transfer.
 *
 * The profile is borrowed from the ProfileStore and is null for local endpoints.
 */
struct Endpoint {
    bool isRemote = false;                  ///< True when the path lives on a stored server.
    const ServerProfile* profile = nullptr; ///< Borrowed profile of the remote server.
    std::string path;                       ///< Path on whichever side.
};

/**
 * @brief Parses user-supplied location expressions against a profile store.
 */
class TargetResolver {
public:
    /**
     * @brief Constructs a resolver reading from the given store.
     *
     * @param store Loaded profile store; must outlive the resolver and its endpoints.
     */
    explicit TargetResolver(const ProfileStore& store);

    /**
     * @brief Resolves an expression into an endpoint.
     *
     * Splits on the first ':' only, so remote paths may contain further colons. For a
     * profile with a default remote path, an empty path resolves to that directory and a
     * relative path is anchored under it; otherwise the path is passed through unchanged.
     *
     * @param expr Expression such as "staging:/var/www" or "./build/app.tar".
     * @return std::expected<Endpoint, TransferError> Endpoint, InvalidTarget for an empty
     *         expression or alias, or UnknownAlias.
     */
    std::expected<Endpoint, TransferError> resolve(const std::string& expr) const;

private:
    const ProfileStore& store; ///< Store the aliases are looked up in.
};

#endif // TARGET_RESOLVER_HPP
