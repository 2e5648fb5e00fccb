/**
 * @file profile_store.hpp
 * @brief Persistent registry of server profiles.
 *
 * The store owns every ServerProfile for the lifetime of the process. Other components
 * borrow const pointers for the duration of one request. The collection is persisted as
 * JSON with atomic replace semantics, and mutations are serialized across concurrent
 * xfer processes with an exclusive lock on a sibling lock file.
 *
 * @note Store file layout:
 * { "version": 1, "default_server": "<alias>", "servers": [ { "alias": ..., "host": ... } ] }
 * The servers array keeps insertion order.
 */

#ifndef PROFILE_STORE_HPP
#define PROFILE_STORE_HPP

#include <string>
#include <vector>
#include <span>
#include <optional>
#include <expected>
#include <filesystem>
#include "server_profile.hpp"

/**
 * @brief Scoped exclusive lock on the store's lock file.
 *
 * Acquired before a mutation re-reads and rewrites the store; released by the destructor
 * on every exit path.
 */
class StoreLock {
public:
    /**
     * @brief Blocks until the exclusive lock on lockFile is held.
     *
     * @param lockFile Lock file path, created if missing.
     * @return std::expected<StoreLock, TransferError> Held lock or a StoreUnavailable error.
     */
    static std::expected<StoreLock, TransferError> acquire(const std::filesystem::path& lockFile);

    StoreLock(StoreLock&& other) noexcept;
    StoreLock& operator=(StoreLock&& other) noexcept;
    StoreLock(const StoreLock&) = delete;
    StoreLock& operator=(const StoreLock&) = delete;
    ~StoreLock();

private:
    explicit StoreLock(int fd);

    int fd; ///< Locked file descriptor, -1 once released.
};

/**
 * @brief Alias to profile registry backed by a JSON file.
 */
class ProfileStore {
public:
    /**
     * @brief Constructs an empty store bound to a file.
     *
     * Nothing is read until load() is called.
     *
     * @param storeFile Path of the persisted store (e.g., ~/.config/xfer/servers.json).
     */
    explicit ProfileStore(std::filesystem::path storeFile);

    /**
     * @brief Loads the persisted collection, replacing the in-memory one.
     *
     * A missing file yields an empty store.
     *
     * @return std::expected<void, TransferError> Success, StoreCorrupt if the file cannot be
     *         parsed or holds invalid entries, or StoreUnavailable if it cannot be read.
     */
    std::expected<void, TransferError> load();

    /**
     * @brief Writes the whole collection back atomically.
     *
     * Writes a temporary sibling file, syncs it and renames it over the store file.
     * Creates the parent directory if needed.
     *
     * @return std::expected<void, TransferError> Success or a StoreUnavailable error.
     */
    std::expected<void, TransferError> save() const;

    /**
     * @brief Adds a new profile and persists the store.
     *
     * @param profile Profile to add.
     * @param makeDefault Also make the profile the default server, in the same locked update.
     * @return std::expected<void, TransferError> Success, InvalidProfile or DuplicateAlias.
     */
    std::expected<void, TransferError> add(const ServerProfile& profile, bool makeDefault = false);

    /**
     * @brief Replaces the profile with the same alias and persists the store.
     *
     * @param profile Complete replacement profile.
     * @return std::expected<void, TransferError> Success, InvalidProfile or UnknownAlias.
     */
    std::expected<void, TransferError> replace(const ServerProfile& profile);

    /**
     * @brief Removes a profile and persists the store.
     *
     * Clears the default server if it named the removed alias.
     *
     * @param alias Alias to remove.
     * @return std::expected<void, TransferError> Success or UnknownAlias.
     */
    std::expected<void, TransferError> remove(const std::string& alias);

    /**
     * @brief Marks an existing alias as the default server and persists the store.
     *
     * @param alias Alias to mark.
     * @return std::expected<void, TransferError> Success or UnknownAlias.
     */
    std::expected<void, TransferError> setDefault(const std::string& alias);

    /**
     * @brief Looks up a profile.
     *
     * The pointer stays valid until the next mutation of the store.
     *
     * @param alias Alias to look up.
     * @return std::expected<const ServerProfile*, TransferError> Profile or UnknownAlias.
     */
    std::expected<const ServerProfile*, TransferError> get(const std::string& alias) const;

    /**
     * @brief Returns the profiles in insertion order.
     *
     * The view does not copy; iterating it again starts from the first profile.
     */
    std::span<const ServerProfile> list() const;

    std::optional<std::string> defaultAlias() const { return defaultServer; }
    bool empty() const { return profiles.empty(); }
    const std::filesystem::path& path() const { return storeFile; }

private:
    template <typename Mutation>
    std::expected<void, TransferError> mutate(Mutation&& mutation);

    std::expected<void, TransferError> readFromDisk(std::vector<ServerProfile>& outProfiles,
                                                    std::optional<std::string>& outDefault) const;

    std::vector<ServerProfile>::iterator find(const std::string& alias);
    std::vector<ServerProfile>::const_iterator find(const std::string& alias) const;

    std::filesystem::path storeFile;            ///< Persisted store file.
    std::vector<ServerProfile> profiles;        ///< Profiles in insertion order.
    std::optional<std::string> defaultServer;   ///< Alias used when a command omits one.
};

#endif // PROFILE_STORE_HPP
