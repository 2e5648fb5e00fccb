/**
 * @file server_profile.hpp
 * @brief Connection profile stored for one server alias.
 *
 * Defines the profile record, its validation rules and its JSON representation in the
 * profile store file.
 */

#ifndef SERVER_PROFILE_HPP
#define SERVER_PROFILE_HPP

#include <string>
#include <optional>
#include <expected>
#include <json/json.h>
#include "transfer_error.hpp"

/**
 * @brief Connection metadata for one alias.
 */
struct ServerProfile {
    std::string alias;                               ///< Unique short name (e.g., "staging").
    std::string host;                                ///< Hostname or IP address.
    std::optional<std::string> user;                 ///< Remote login; local login name when absent.
    std::optional<int> port;                         ///< SSH port; mechanism default (22) when absent.
    std::optional<std::string> keyPath;              ///< Private key passed as identity file.
    std::optional<std::string> defaultRemotePath;    ///< Anchor for relative remote paths.

    bool operator==(const ServerProfile&) const = default;
};

/**
 * @brief Checks the profile invariants.
 *
 * The alias must be non-empty without whitespace, ':' or '/', and the host non-empty
 * without whitespace or '@'. Neither alias, host nor user may start with '-', so none
 * of them can be mistaken for an option by ssh, scp or rsync. The port, when present,
 * must be within 1-65535 and the default remote path, when present, must be absolute.
 *
 * @param profile Profile to validate.
 * @return std::expected<void, TransferError> Success or an InvalidProfile error.
 */
std::expected<void, TransferError> validateProfile(const ServerProfile& profile);

/**
 * @brief Parses a port given as text (prompt answer or command line flag).
 *
 * @param text Decimal port number.
 * @return std::expected<int, TransferError> Port or an InvalidProfile error.
 */
std::expected<int, TransferError> parsePort(const std::string& text);

/**
 * @brief Serializes a profile to its store representation.
 *
 * Optional fields that are absent are omitted.
 */
Json::Value profileToJson(const ServerProfile& profile);

/**
 * @brief Reads a profile from its store representation.
 *
 * Only checks field types; invariants are checked separately by validateProfile().
 *
 * @param value JSON object read from the store file.
 * @return std::expected<ServerProfile, TransferError> Profile or a StoreCorrupt error.
 */
std::expected<ServerProfile, TransferError> profileFromJson(const Json::Value& value);

#endif // SERVER_PROFILE_HPP
