/**
 * @file xfer_config.hpp
 * @brief Runtime configuration and logging for xfer.
 *
 * Resolves the user-scoped configuration directory holding the server profile store,
 * its lock file and the log file, and carries the switches set on the command line.
 *
 * @note The directory is chosen in this order: --config flag, XFER_CONFIG_DIR,
 * XDG_CONFIG_HOME/xfer, HOME/.config/xfer.
 */

#ifndef XFER_CONFIG_HPP
#define XFER_CONFIG_HPP

#include <string>
#include <optional>
#include <filesystem>

/**
 * @brief Configuration class for the xfer command line tool.
 *
 * Derives every persisted path from the configuration directory and provides the
 * timestamped logging used by the transfer orchestration.
 */
class XferConfig {
public:
    /**
     * @brief Constructs a configuration instance.
     *
     * @param configDirOverride Directory given with --config, if any.
     * @throws std::runtime_error If no configuration directory can be determined
     *         (no override, no XFER_CONFIG_DIR, XDG_CONFIG_HOME or HOME).
     */
    explicit XferConfig(const std::optional<std::string>& configDirOverride = std::nullopt);

    /**
     * @brief Logs an informational message.
     *
     * Appends a timestamped entry to the log file. The entry is echoed to stdout only
     * when verbose is set.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error.
     *
     * Appends a timestamped entry to the log file and always prints the message as a
     * single line on stderr.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Returns the name of the local login user.
     *
     * Uses $USER, falling back to the passwd entry of the real user id.
     *
     * @return std::string Login name, or "root" if none can be determined.
     */
    static std::string localUserName();

    std::filesystem::path configDir;   ///< Directory holding all xfer state.
    std::filesystem::path storeFile;   ///< Server profile store (servers.json).
    std::filesystem::path logFile;     ///< Log file (xfer.log).
    bool verbose = false;              ///< Echo informational log entries.
    bool dryRun = false;               ///< Print commands instead of running them.
    bool color = false;                ///< Colorize console output.

private:
    void appendToLog(const std::string& entry) const;
};

#endif // XFER_CONFIG_HPP
