// main.cpp - CLI entry for xfer
#include <cstdio>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <stdexcept>
#include <utility>
#include "xfer_config.hpp"
#include "profile_store.hpp"
#include "profile_prompt.hpp"
#include "file_system.hpp"
#include "process_runner.hpp"
#include "transfer_api.hpp"

namespace {

constexpr int kUsageExit = 1;
constexpr int kStoreExit = 3;

struct Palette {
    const char* reset;
    const char* bold;
    const char* green;
    const char* yellow;
    const char* cyan;
};

Palette paletteFor(bool color) {
    if (color) {
        return {"\x1b[0m", "\x1b[1m", "\x1b[32m", "\x1b[33m", "\x1b[36m"};
    }
    return {"", "", "", "", ""};
}

void printUsage(std::FILE* out) {
    std::print(out, "Usage: xfer [--config <dir>] [--verbose|-v] [--dry-run|-n] [--no-color] <command>\n"
           "Commands:\n"
           "  send <local> <alias:remote> [-r]   Push a file or directory\n"
           "  get <alias:remote> <local> [-r]    Pull a file (or a directory with -r)\n"
           "  sync <src> <dst>                   Synchronize a directory with rsync\n"
           "  list [alias:remote]                List a remote directory (default server if omitted)\n"
           "  server add [--alias A --host H [--user U] [--port P] [--key K] [--path D] [--default]]\n"
           "  server list\n"
           "  server remove <alias>\n"
           "  server update <alias> [--host H] [--user U] [--port P] [--key K] [--path D]\n"
           "  server default <alias>\n");
}

int fail(const XferConfig& config, const TransferError& error) {
    config.logError(error.describe());
    return exitCodeFor(error.kind);
}

int usageError(const XferConfig& config, const std::string& message) {
    return fail(config, TransferError(ErrorKind::Usage, message));
}

/**
 * @brief Profile fields given as flags to `server add` / `server update`.
 */
struct ProfileFlags {
    std::optional<std::string> alias;
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<std::string> port;
    std::optional<std::string> key;
    std::optional<std::string> path;
    bool makeDefault = false;
    bool any = false;
};

std::expected<ProfileFlags, TransferError> parseProfileFlags(const std::vector<std::string>& args, size_t first) {
    ProfileFlags flags;
    for (size_t i = first; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--default") {
            flags.makeDefault = true;
            flags.any = true;
            continue;
        }
        std::optional<std::string>* target = nullptr;
        if (a == "--alias") target = &flags.alias;
        else if (a == "--host") target = &flags.host;
        else if (a == "--user") target = &flags.user;
        else if (a == "--port") target = &flags.port;
        else if (a == "--key") target = &flags.key;
        else if (a == "--path") target = &flags.path;
        if (!target) {
            return std::unexpected(TransferError(ErrorKind::Usage, std::format("unexpected argument: {}", a)));
        }
        if (i + 1 >= args.size()) {
            return std::unexpected(TransferError(ErrorKind::Usage, std::format("{} requires a value", a)));
        }
        *target = args[++i];
        flags.any = true;
    }
    return flags;
}

// Applies flags on top of a profile; empty values clear optional fields.
std::expected<void, TransferError> applyFlags(const ProfileFlags& flags, ServerProfile& profile) {
    auto optionalValue = [](const std::string& v) -> std::optional<std::string> {
        if (v.empty()) return std::nullopt;
        return v;
    };
    if (flags.host) profile.host = *flags.host;
    if (flags.user) profile.user = optionalValue(*flags.user);
    if (flags.key) profile.keyPath = optionalValue(*flags.key);
    if (flags.path) profile.defaultRemotePath = optionalValue(*flags.path);
    if (flags.port) {
        if (flags.port->empty()) {
            profile.port.reset();
        } else {
            auto port = parsePort(*flags.port);
            if (!port) {
                return std::unexpected(port.error());
            }
            profile.port = *port;
        }
    }
    return {};
}

int serverAdd(XferConfig& config, ProfileStore& store, const std::vector<std::string>& args) {
    auto flags = parseProfileFlags(args, 2);
    if (!flags) {
        return fail(config, flags.error());
    }

    ProfileDraft draft;
    if (!flags->any) {
        Palette c = paletteFor(config.color);
        std::println("{}{}Adding a new server configuration{}", c.green, c.bold, c.reset);
        ConsolePrompt prompt(std::cin, std::cout);
        auto entered = promptForProfile(prompt, !store.defaultAlias());
        if (!entered) {
            return fail(config, entered.error());
        }
        draft = std::move(*entered);
    } else {
        if (!flags->alias || !flags->host) {
            return usageError(config, "server add needs both --alias and --host (or no flags for interactive entry)");
        }
        draft.profile.alias = *flags->alias;
        if (auto applied = applyFlags(*flags, draft.profile); !applied) {
            return fail(config, applied.error());
        }
        draft.makeDefault = flags->makeDefault;
    }

    if (auto added = store.add(draft.profile, draft.makeDefault); !added) {
        return fail(config, added.error());
    }
    config.logMessage(std::format("Added server '{}' ({})", draft.profile.alias, draft.profile.host));
    if (draft.makeDefault) {
        config.logMessage(std::format("Default server set to '{}'", draft.profile.alias));
    }
    Palette c = paletteFor(config.color);
    std::println("{}Server configuration '{}' added.{}", c.green, draft.profile.alias, c.reset);
    return 0;
}

int serverUpdate(XferConfig& config, ProfileStore& store, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return usageError(config, "server update requires an alias");
    }
    auto flags = parseProfileFlags(args, 3);
    if (!flags) {
        return fail(config, flags.error());
    }
    if (flags->alias || flags->makeDefault) {
        return usageError(config, "server update does not accept --alias or --default");
    }
    auto existing = store.get(args[2]);
    if (!existing) {
        return fail(config, existing.error());
    }
    ServerProfile updated = **existing;
    if (auto applied = applyFlags(*flags, updated); !applied) {
        return fail(config, applied.error());
    }
    if (auto replaced = store.replace(updated); !replaced) {
        return fail(config, replaced.error());
    }
    config.logMessage(std::format("Updated server '{}'", updated.alias));
    std::println("Server configuration '{}' updated.", updated.alias);
    return 0;
}

int serverList(const XferConfig& config, const ProfileStore& store) {
    Palette c = paletteFor(config.color);
    if (store.empty()) {
        std::println("No server configurations found. Add one with 'xfer server add'.");
        return 0;
    }
    auto defaultAlias = store.defaultAlias();
    std::println("{}{}Configured Servers:{}", c.green, c.bold, c.reset);
    for (const auto& profile : store.list()) {
        std::string line = std::format("  {}{}{} - {}{}@{}{}", c.yellow, profile.alias, c.reset, c.cyan,
                                       profile.user.value_or(XferConfig::localUserName()), profile.host, c.reset);
        if (profile.port) {
            line += std::format(" port {}", *profile.port);
        }
        if (defaultAlias == profile.alias) {
            line += std::format(" {}DEFAULT{}", c.green, c.reset);
        }
        std::println("{}", line);
        if (profile.keyPath) {
            std::println("    key: {}", *profile.keyPath);
        }
        if (profile.defaultRemotePath) {
            std::println("    path: {}", *profile.defaultRemotePath);
        }
    }
    return 0;
}

int serverCommand(XferConfig& config, ProfileStore& store, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return usageError(config, "server requires a subcommand: add, list, remove, update, default");
    }
    const std::string& sub = args[1];
    if (sub == "add") {
        return serverAdd(config, store, args);
    }
    if (sub == "list") {
        if (args.size() != 2) {
            return usageError(config, "server list takes no arguments");
        }
        return serverList(config, store);
    }
    if (sub == "update") {
        return serverUpdate(config, store, args);
    }
    if (sub == "remove" || sub == "default") {
        if (args.size() != 3) {
            return usageError(config, std::format("server {} requires exactly one alias", sub));
        }
        const std::string& alias = args[2];
        auto result = sub == "remove" ? store.remove(alias) : store.setDefault(alias);
        if (!result) {
            return fail(config, result.error());
        }
        if (sub == "remove") {
            config.logMessage(std::format("Removed server '{}'", alias));
            std::println("Server configuration '{}' removed.", alias);
        } else {
            config.logMessage(std::format("Default server set to '{}'", alias));
            std::println("Default server set to '{}'.", alias);
        }
        return 0;
    }
    return usageError(config, std::format("unknown server subcommand: {}", sub));
}

int transferCommand(XferConfig& config, ProfileStore& store, const std::vector<std::string>& args) {
    const std::string& command = args[0];
    bool recursive = false;
    std::vector<std::string> operands;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "-r" || args[i] == "--recursive") {
            recursive = true;
        } else {
            operands.push_back(args[i]);
        }
    }
    if (recursive && command != "send" && command != "get") {
        return usageError(config, std::format("{} does not accept -r", command));
    }

    LocalFileSystem fileSystem;
    PosixProcessRunner runner;
    TransferAPI api(config, store, fileSystem, runner);
    Palette c = paletteFor(config.color);

    if (store.empty()) {
        std::println(stderr, "No server configurations found. Add one with 'xfer server add'.");
    }

    std::expected<TransferOutcome, TransferError> outcome = std::unexpected(
        TransferError(ErrorKind::Usage, std::format("unknown command: {}", command)));
    if (command == "list") {
        if (operands.size() > 1) {
            return usageError(config, "list takes at most one location");
        }
        std::optional<std::string> location;
        if (!operands.empty()) location = operands[0];
        if (!config.dryRun) {
            std::println("{}Listing{} {}", c.green, c.reset, location.value_or("default server"));
        }
        outcome = api.list(location);
    } else if (command == "send" || command == "get" || command == "sync") {
        if (operands.size() != 2) {
            return usageError(config, std::format("{} requires a source and a destination", command));
        }
        TransferMode mode = command == "send" ? TransferMode::Send
                          : command == "get"  ? TransferMode::Get
                                              : TransferMode::Sync;
        const char* verb = command == "send" ? "Sending" : command == "get" ? "Getting" : "Syncing";
        if (!config.dryRun) {
            std::println("{}{}{} {} {}to{} {}", c.green, verb, c.reset, operands[0], c.green, c.reset, operands[1]);
        }
        outcome = api.transfer(operands[0], operands[1], mode, recursive);
    }

    if (!outcome) {
        return fail(config, outcome.error());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> configDir;
    bool verbose = false;
    bool dryRun = false;
    bool noColor = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (!args.empty()) {
            args.emplace_back(a);
            continue;
        }
        if (a == "--help" || a == "-h") { printUsage(stdout); return 0; }
        if (a == "--verbose" || a == "-v") { verbose = true; continue; }
        if (a == "--dry-run" || a == "-n") { dryRun = true; continue; }
        if (a == "--no-color") { noColor = true; continue; }
        if (a == "--config") {
            if (i + 1 >= argc) { std::println(stderr, "Error: --config requires a directory"); return kUsageExit; }
            configDir = argv[++i];
            continue;
        }
        if (a.size() > 1 && a.front() == '-') {
            std::println(stderr, "Error: Usage: unknown option: {}", a);
            printUsage(stderr);
            return kUsageExit;
        }
        args.emplace_back(a);
    }
    if (args.empty()) {
        printUsage(stderr);
        return kUsageExit;
    }

    std::optional<XferConfig> config;
    try {
        config.emplace(configDir);
    } catch (const std::exception& e) {
        std::println(stderr, "Error: StoreUnavailable: {}", e.what());
        return kStoreExit;
    }
    config->verbose = verbose;
    config->dryRun = dryRun;
    if (noColor) {
        config->color = false;
    }

    ProfileStore store(config->storeFile);
    if (auto loaded = store.load(); !loaded) {
        return fail(*config, loaded.error());
    }

    if (args[0] == "server") {
        return serverCommand(*config, store, args);
    }
    if (args[0] == "send" || args[0] == "get" || args[0] == "sync" || args[0] == "list") {
        return transferCommand(*config, store, args);
    }
    printUsage(stderr);
    return usageError(*config, std::format("unknown command: {}", args[0]));
}
