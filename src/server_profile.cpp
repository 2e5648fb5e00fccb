#include "server_profile.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace {

bool hasWhitespace(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

std::unexpected<TransferError> invalid(const std::string& alias, const std::string& reason) {
    return std::unexpected(TransferError(ErrorKind::InvalidProfile,
                                         std::format("profile '{}': {}", alias, reason)));
}

std::expected<std::optional<std::string>, TransferError> optionalString(const Json::Value& value,
                                                                         const char* key) {
    if (!value.isMember(key) || value[key].isNull()) {
        return std::optional<std::string>{};
    }
    if (!value[key].isString()) {
        return std::unexpected(TransferError(ErrorKind::StoreCorrupt,
                                             std::format("field '{}' must be a string", key)));
    }
    return std::optional<std::string>(value[key].asString());
}

} // namespace

std::expected<void, TransferError> validateProfile(const ServerProfile& profile) {
    const auto& alias = profile.alias;
    if (alias.empty()) {
        return invalid(alias, "alias must not be empty");
    }
    if (hasWhitespace(alias) || alias.find_first_of(":/") != std::string::npos) {
        return invalid(alias, "alias must not contain whitespace, ':' or '/'");
    }
    if (alias.front() == '-') {
        return invalid(alias, "alias must not start with '-'");
    }

    if (profile.host.empty()) {
        return invalid(alias, "host must not be empty");
    }
    if (hasWhitespace(profile.host) || profile.host.find('@') != std::string::npos) {
        return invalid(alias, "host must not contain whitespace or '@'");
    }
    if (profile.host.front() == '-') {
        return invalid(alias, "host must not start with '-'");
    }

    if (profile.user) {
        const auto& user = *profile.user;
        if (user.empty()) {
            return invalid(alias, "user must not be empty when given");
        }
        if (hasWhitespace(user) || user.find_first_of("@:") != std::string::npos || user.front() == '-') {
            return invalid(alias, "user must not contain whitespace, '@' or ':' and must not start with '-'");
        }
    }

    if (profile.port && (*profile.port < 1 || *profile.port > 65535)) {
        return invalid(alias, std::format("port {} is outside 1-65535", *profile.port));
    }

    if (profile.keyPath && profile.keyPath->empty()) {
        return invalid(alias, "key path must not be empty when given");
    }

    if (profile.defaultRemotePath) {
        const auto& path = *profile.defaultRemotePath;
        if (path.empty() || path.front() != '/') {
            return invalid(alias, "default remote path must be absolute");
        }
    }
    return {};
}

std::expected<int, TransferError> parsePort(const std::string& text) {
    int port = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::unexpected(TransferError(ErrorKind::InvalidProfile, std::format("invalid port: '{}'", text)));
    }
    if (port < 1 || port > 65535) {
        return std::unexpected(TransferError(ErrorKind::InvalidProfile,
                                             std::format("port {} is outside 1-65535", text)));
    }
    return port;
}

Json::Value profileToJson(const ServerProfile& profile) {
    Json::Value value(Json::objectValue);
    value["alias"] = profile.alias;
    value["host"] = profile.host;
    if (profile.user) {
        value["user"] = *profile.user;
    }
    if (profile.port) {
        value["port"] = *profile.port;
    }
    if (profile.keyPath) {
        value["key_path"] = *profile.keyPath;
    }
    if (profile.defaultRemotePath) {
        value["default_remote_path"] = *profile.defaultRemotePath;
    }
    return value;
}

std::expected<ServerProfile, TransferError> profileFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        return std::unexpected(TransferError(ErrorKind::StoreCorrupt, "server entry must be an object"));
    }
    if (!value["alias"].isString() || !value["host"].isString()) {
        return std::unexpected(TransferError(ErrorKind::StoreCorrupt,
                                             "server entry requires string fields 'alias' and 'host'"));
    }

    ServerProfile profile;
    profile.alias = value["alias"].asString();
    profile.host = value["host"].asString();

    auto user = optionalString(value, "user");
    if (!user) {
        return std::unexpected(user.error());
    }
    profile.user = *user;

    auto keyPath = optionalString(value, "key_path");
    if (!keyPath) {
        return std::unexpected(keyPath.error());
    }
    profile.keyPath = *keyPath;

    auto remotePath = optionalString(value, "default_remote_path");
    if (!remotePath) {
        return std::unexpected(remotePath.error());
    }
    profile.defaultRemotePath = *remotePath;

    if (value.isMember("port") && !value["port"].isNull()) {
        if (!value["port"].isInt()) {
            return std::unexpected(TransferError(ErrorKind::StoreCorrupt,
                                                 std::format("server '{}': port must be an integer", profile.alias)));
        }
        profile.port = value["port"].asInt();
    }
    return profile;
}
