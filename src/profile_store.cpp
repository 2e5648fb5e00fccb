#include "profile_store.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kStoreVersion = 1;

std::unexpected<TransferError> unavailable(const std::string& what, const fs::path& path, int err) {
    return std::unexpected(TransferError(ErrorKind::StoreUnavailable,
                                         std::format("{} {}: {}", what, path.string(), std::strerror(err))));
}

std::unexpected<TransferError> corrupt(const fs::path& path, const std::string& reason) {
    return std::unexpected(TransferError(ErrorKind::StoreCorrupt, std::format("{}: {}", path.string(), reason)));
}

fs::path siblingPath(const fs::path& file, const std::string& suffix) {
    fs::path sibling = file;
    sibling += suffix;
    return sibling;
}

bool writeAll(int fd, const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::expected<StoreLock, TransferError> StoreLock::acquire(const fs::path& lockFile) {
    int fd = ::open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return unavailable("Failed to open lock file", lockFile, errno);
    }
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd);
        return unavailable("Failed to lock", lockFile, err);
    }
    return StoreLock(fd);
}

StoreLock::StoreLock(int fd) : fd(fd) {}

StoreLock::StoreLock(StoreLock&& other) noexcept : fd(std::exchange(other.fd, -1)) {}

StoreLock& StoreLock::operator=(StoreLock&& other) noexcept {
    if (this != &other) {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
        fd = std::exchange(other.fd, -1);
    }
    return *this;
}

StoreLock::~StoreLock() {
    if (fd >= 0) {
        ::flock(fd, LOCK_UN);
        ::close(fd);
    }
}

ProfileStore::ProfileStore(fs::path storeFile) : storeFile(std::move(storeFile)) {}

std::expected<void, TransferError> ProfileStore::load() {
    std::vector<ServerProfile> loaded;
    std::optional<std::string> loadedDefault;
    auto result = readFromDisk(loaded, loadedDefault);
    if (!result) {
        return result;
    }
    profiles = std::move(loaded);
    defaultServer = std::move(loadedDefault);
    return {};
}

std::expected<void, TransferError> ProfileStore::readFromDisk(std::vector<ServerProfile>& outProfiles,
                                                              std::optional<std::string>& outDefault) const {
    outProfiles.clear();
    outDefault.reset();

    std::error_code ec;
    if (!fs::exists(storeFile, ec)) {
        if (ec) {
            return unavailable("Failed to access store file", storeFile, ec.value());
        }
        return {};
    }

    std::ifstream file(storeFile);
    if (!file.is_open()) {
        return unavailable("Failed to open store file", storeFile, errno);
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, file, &root, &errs)) {
        std::string firstLine = errs.substr(0, errs.find('\n'));
        return corrupt(storeFile, std::format("invalid JSON: {}", firstLine));
    }
    if (!root.isObject()) {
        return corrupt(storeFile, "top level must be an object");
    }
    if (root.isMember("version") && (!root["version"].isInt() || root["version"].asInt() != kStoreVersion)) {
        return corrupt(storeFile, "unsupported store version");
    }

    const Json::Value& servers = root["servers"];
    if (!servers.isNull() && !servers.isArray()) {
        return corrupt(storeFile, "'servers' must be an array");
    }
    for (const auto& entry : servers) {
        auto profile = profileFromJson(entry);
        if (!profile) {
            return corrupt(storeFile, profile.error().message);
        }
        if (auto valid = validateProfile(*profile); !valid) {
            return corrupt(storeFile, valid.error().message);
        }
        bool duplicate = std::any_of(outProfiles.begin(), outProfiles.end(),
                                     [&](const ServerProfile& p) { return p.alias == profile->alias; });
        if (duplicate) {
            return corrupt(storeFile, std::format("duplicate alias '{}'", profile->alias));
        }
        outProfiles.push_back(std::move(*profile));
    }

    const Json::Value& def = root["default_server"];
    if (!def.isNull()) {
        if (!def.isString()) {
            return corrupt(storeFile, "'default_server' must be a string");
        }
        std::string alias = def.asString();
        bool known = std::any_of(outProfiles.begin(), outProfiles.end(),
                                 [&](const ServerProfile& p) { return p.alias == alias; });
        if (!known) {
            return corrupt(storeFile, std::format("default server '{}' is not a configured alias", alias));
        }
        outDefault = alias;
    }
    return {};
}

std::expected<void, TransferError> ProfileStore::save() const {
    std::error_code ec;
    if (storeFile.has_parent_path()) {
        fs::create_directories(storeFile.parent_path(), ec);
        if (ec) {
            return unavailable("Failed to create directory", storeFile.parent_path(), ec.value());
        }
    }

    Json::Value root(Json::objectValue);
    root["version"] = kStoreVersion;
    if (defaultServer) {
        root["default_server"] = *defaultServer;
    }
    Json::Value servers(Json::arrayValue);
    for (const auto& profile : profiles) {
        servers.append(profileToJson(profile));
    }
    root["servers"] = servers;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream out;
    writer->write(root, &out);
    out << '\n';

    fs::path tempFile = siblingPath(storeFile, std::format(".tmp.{}", ::getpid()));
    int fd = ::open(tempFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return unavailable("Failed to create temporary store file", tempFile, errno);
    }
    if (!writeAll(fd, out.str()) || ::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        fs::remove(tempFile, ec);
        return unavailable("Failed to write temporary store file", tempFile, err);
    }
    if (::close(fd) != 0) {
        int err = errno;
        fs::remove(tempFile, ec);
        return unavailable("Failed to close temporary store file", tempFile, err);
    }
    if (::rename(tempFile.c_str(), storeFile.c_str()) != 0) {
        int err = errno;
        fs::remove(tempFile, ec);
        return unavailable("Failed to replace store file", storeFile, err);
    }
    return {};
}

// Runs a mutation against the on-disk state under the store lock, then persists it.
// The in-memory collection is left as it was whenever the mutation or the save fails.
template <typename Mutation>
std::expected<void, TransferError> ProfileStore::mutate(Mutation&& mutation) {
    std::error_code ec;
    if (storeFile.has_parent_path()) {
        fs::create_directories(storeFile.parent_path(), ec);
        if (ec) {
            return unavailable("Failed to create directory", storeFile.parent_path(), ec.value());
        }
    }
    auto lock = StoreLock::acquire(siblingPath(storeFile, ".lock"));
    if (!lock) {
        return std::unexpected(lock.error());
    }

    std::vector<ServerProfile> current;
    std::optional<std::string> currentDefault;
    if (auto read = readFromDisk(current, currentDefault); !read) {
        return read;
    }

    auto previousProfiles = std::exchange(profiles, std::move(current));
    auto previousDefault = std::exchange(defaultServer, std::move(currentDefault));

    auto result = mutation();
    if (result) {
        result = save();
    }
    if (!result) {
        profiles = std::move(previousProfiles);
        defaultServer = std::move(previousDefault);
    }
    return result;
}

std::expected<void, TransferError> ProfileStore::add(const ServerProfile& profile, bool makeDefault) {
    if (auto valid = validateProfile(profile); !valid) {
        return valid;
    }
    return mutate([&]() -> std::expected<void, TransferError> {
        if (find(profile.alias) != profiles.end()) {
            return std::unexpected(TransferError(ErrorKind::DuplicateAlias,
                                                 std::format("alias '{}' already exists", profile.alias)));
        }
        profiles.push_back(profile);
        if (makeDefault) {
            defaultServer = profile.alias;
        }
        return {};
    });
}

std::expected<void, TransferError> ProfileStore::replace(const ServerProfile& profile) {
    if (auto valid = validateProfile(profile); !valid) {
        return valid;
    }
    return mutate([&]() -> std::expected<void, TransferError> {
        auto it = find(profile.alias);
        if (it == profiles.end()) {
            return std::unexpected(TransferError(ErrorKind::UnknownAlias,
                                                 std::format("unknown server alias '{}'", profile.alias)));
        }
        *it = profile;
        return {};
    });
}

std::expected<void, TransferError> ProfileStore::remove(const std::string& alias) {
    return mutate([&]() -> std::expected<void, TransferError> {
        auto it = find(alias);
        if (it == profiles.end()) {
            return std::unexpected(TransferError(ErrorKind::UnknownAlias,
                                                 std::format("unknown server alias '{}'", alias)));
        }
        profiles.erase(it);
        if (defaultServer == alias) {
            defaultServer.reset();
        }
        return {};
    });
}

std::expected<void, TransferError> ProfileStore::setDefault(const std::string& alias) {
    return mutate([&]() -> std::expected<void, TransferError> {
        if (find(alias) == profiles.end()) {
            return std::unexpected(TransferError(ErrorKind::UnknownAlias,
                                                 std::format("unknown server alias '{}'", alias)));
        }
        defaultServer = alias;
        return {};
    });
}

std::expected<const ServerProfile*, TransferError> ProfileStore::get(const std::string& alias) const {
    auto it = find(alias);
    if (it == profiles.end()) {
        return std::unexpected(TransferError(ErrorKind::UnknownAlias,
                                             std::format("unknown server alias '{}'", alias)));
    }
    return &*it;
}

std::span<const ServerProfile> ProfileStore::list() const {
    return profiles;
}

std::vector<ServerProfile>::iterator ProfileStore::find(const std::string& alias) {
    return std::find_if(profiles.begin(), profiles.end(),
                        [&](const ServerProfile& p) { return p.alias == alias; });
}

std::vector<ServerProfile>::const_iterator ProfileStore::find(const std::string& alias) const {
    return std::find_if(profiles.begin(), profiles.end(),
                        [&](const ServerProfile& p) { return p.alias == alias; });
}
