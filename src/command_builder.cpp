#include "command_builder.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <utility>

namespace {

bool isSafeShellChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '@' || c == '%' || c == '+' || c == '=' || c == ':' ||
           c == ',' || c == '.' || c == '/' || c == '-';
}

bool needsQuoting(const std::string& word) {
    return word.empty() || !std::all_of(word.begin(), word.end(), isSafeShellChar);
}

std::string expandHome(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

// rsync splits the -e value on spaces itself and honors single and double quotes,
// but not backslashes.
std::expected<std::string, TransferError> quoteForRsync(const std::string& alias, const std::string& word) {
    if (!needsQuoting(word)) {
        return word;
    }
    if (word.find('\'') == std::string::npos) {
        return "'" + word + "'";
    }
    if (word.find('"') == std::string::npos) {
        return "\"" + word + "\"";
    }
    return std::unexpected(TransferError(ErrorKind::InvalidProfile,
        std::format("profile '{}': key path contains both quote characters and cannot be passed to rsync", alias)));
}

// ssh takes a bare IPv6 literal as its destination; only scp and rsync addresses need brackets.
std::string bareHost(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

// Quotes a listing path for the remote shell, leaving a leading "~" or "~/" unquoted so
// the remote shell still expands it to the login directory.
std::string remoteShellPath(const std::string& path) {
    if (path == "~" || path == "~/") {
        return path;
    }
    if (path.rfind("~/", 0) == 0) {
        return "~/" + CommandBuilder::shellQuote(path.substr(2));
    }
    return CommandBuilder::shellQuote(path);
}

} // namespace

CommandBuilder::CommandBuilder(const FileSystem& fileSystem, std::string localUser)
    : fileSystem(fileSystem), localUser(std::move(localUser)) {}

const char* CommandBuilder::programFor(Strategy strategy) {
    switch (strategy) {
        case Strategy::DirectorySync: return "rsync";
        case Strategy::SingleFileCopy: return "scp";
        case Strategy::RemoteList: return "ssh";
    }
    return "ssh";
}

std::expected<ArgumentVector, TransferError> CommandBuilder::build(Strategy strategy,
                                                                   const TransferRequest& request) const {
    if (!request.source.isRemote && !(request.destination && request.destination->isRemote)) {
        return std::unexpected(TransferError(ErrorKind::AmbiguousRequest,
            std::format("no remote side in request for '{}'", request.source.path)));
    }
    const Endpoint& remote = request.source.isRemote ? request.source : *request.destination;
    const ServerProfile& profile = *remote.profile;

    auto key = identityFile(profile);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (strategy != Strategy::RemoteList && !request.destination) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget,
            std::format("{} of '{}' needs a destination", strategyName(strategy), request.source.path)));
    }

    ArgumentVector argv{programFor(strategy)};

    switch (strategy) {
        case Strategy::DirectorySync: {
            argv.insert(argv.end(), {"-avz", "--progress", "--protect-args"});
            if (profile.port || !key->empty()) {
                std::string sshCommand = "ssh";
                if (profile.port) {
                    sshCommand += std::format(" -p {}", *profile.port);
                }
                if (!key->empty()) {
                    auto quoted = quoteForRsync(profile.alias, *key);
                    if (!quoted) {
                        return std::unexpected(quoted.error());
                    }
                    sshCommand += std::format(" -i {}", *quoted);
                }
                argv.push_back("-e");
                argv.push_back(sshCommand);
            }
            argv.push_back("--");

            std::string source = request.source.isRemote ? remoteAddress(request.source) : request.source.path;
            // A trailing slash makes rsync copy the directory's contents rather than the directory itself.
            if (!request.source.isRemote && fileSystem.isDirectory(request.source.path) && source.back() != '/') {
                source += '/';
            }
            argv.push_back(source);
            argv.push_back(request.destination->isRemote ? remoteAddress(*request.destination)
                                                         : request.destination->path);
            break;
        }
        case Strategy::SingleFileCopy: {
            if (profile.port) {
                argv.push_back("-P");
                argv.push_back(std::to_string(*profile.port));
            }
            if (!key->empty()) {
                argv.push_back("-i");
                argv.push_back(*key);
            }
            argv.push_back("--");
            argv.push_back(request.source.isRemote ? remoteAddress(request.source) : request.source.path);
            argv.push_back(request.destination->isRemote ? remoteAddress(*request.destination)
                                                         : request.destination->path);
            break;
        }
        case Strategy::RemoteList: {
            if (profile.port) {
                argv.push_back("-p");
                argv.push_back(std::to_string(*profile.port));
            }
            if (!key->empty()) {
                argv.push_back("-i");
                argv.push_back(*key);
            }
            argv.push_back("--");
            argv.push_back(std::format("{}@{}", loginFor(profile), bareHost(profile.host)));
            // ssh hands the command words to the remote shell joined by spaces, so the
            // path is the one value that has to be quoted for that shell.
            argv.insert(argv.end(), {"ls", "-la", "--"});
            if (!remote.path.empty()) {
                argv.push_back(remoteShellPath(remote.path));
            }
            break;
        }
    }
    return argv;
}

std::expected<std::string, TransferError> CommandBuilder::identityFile(const ServerProfile& profile) const {
    if (!profile.keyPath) {
        return std::string();
    }
    std::string key = expandHome(*profile.keyPath);
    if (!fileSystem.exists(key)) {
        return std::unexpected(TransferError(ErrorKind::InvalidProfile,
            std::format("profile '{}': key file {} does not exist", profile.alias, key)));
    }
    return key;
}

std::string CommandBuilder::loginFor(const ServerProfile& profile) const {
    return profile.user ? *profile.user : localUser;
}

std::string CommandBuilder::remoteAddress(const Endpoint& endpoint) const {
    const ServerProfile& profile = *endpoint.profile;
    std::string host = profile.host;
    // scp and rsync need IPv6 literals bracketed to tell the address from the path.
    if (host.find(':') != std::string::npos && host.front() != '[') {
        host = std::format("[{}]", host);
    }
    return std::format("{}@{}:{}", loginFor(profile), host, endpoint.path);
}

std::string CommandBuilder::renderCommand(const ArgumentVector& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += needsQuoting(arg) ? shellQuote(arg) : arg;
    }
    return line;
}

std::string CommandBuilder::shellQuote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
