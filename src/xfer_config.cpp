#include "xfer_config.hpp"
#include <fstream>
#include <format>
#include <print>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> envValue(const char* name) {
    const char* v = std::getenv(name);
    if (v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

} // namespace

XferConfig::XferConfig(const std::optional<std::string>& configDirOverride) {
    if (configDirOverride && !configDirOverride->empty()) {
        configDir = *configDirOverride;
    } else if (auto dir = envValue("XFER_CONFIG_DIR")) {
        configDir = *dir;
    } else if (auto xdg = envValue("XDG_CONFIG_HOME")) {
        configDir = fs::path(*xdg) / "xfer";
    } else if (auto home = envValue("HOME")) {
        configDir = fs::path(*home) / ".config" / "xfer";
    } else {
        throw std::runtime_error("Cannot determine configuration directory: HOME is not set");
    }

    storeFile = configDir / "servers.json";
    logFile = configDir / "xfer.log";
    color = isatty(STDOUT_FILENO) && !envValue("NO_COLOR");
}

void XferConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);
    if (verbose) {
        std::println("{}", logEntry);
    }
    appendToLog(logEntry);
}

void XferConfig::logError(const std::string& message) const {
    std::println(stderr, "Error: {}", message);
    appendToLog(std::format("[{}] ERROR: {}", timestamp(), message));
}

// The log is best effort: a read-only or missing config directory never fails a transfer.
void XferConfig::appendToLog(const std::string& entry) const {
    std::error_code ec;
    if (!fs::is_directory(configDir, ec)) {
        return;
    }
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    }
}

std::string XferConfig::localUserName() {
    if (auto user = envValue("USER")) {
        return *user;
    }
    struct passwd* pwd = getpwuid(getuid());
    if (pwd && pwd->pw_name) {
        return pwd->pw_name;
    }
    return "root";
}
