/**
 * @file command_builder.hpp
 * @brief Construction of argument vectors for the external transfer mechanisms.
 *
 * Each strategy maps to a fixed program: directory sync to rsync, single-file copy to
 * scp, remote listing to ssh. Credentials stored in the profile (port, identity file)
 * are injected as flags. The result is always an argument vector handed to exec
 * directly; no local shell ever parses user-controlled text.
 */

#ifndef COMMAND_BUILDER_HPP
#define COMMAND_BUILDER_HPP

#include <string>
#include <vector>
#include <expected>
#include "strategy_selector.hpp"
#include "file_system.hpp"

/// Program name followed by its arguments, one element per argv entry.
using ArgumentVector = std::vector<std::string>;

/**
 * @brief Builds mechanism invocations for resolved requests.
 */
class CommandBuilder {
public:
    /**
     * @brief Constructs a builder.
     *
     * @param fileSystem Filesystem used for the identity-file pre-flight and to detect
     *        local directory sources.
     * @param localUser Login used for profiles without a user (see XferConfig::localUserName()).
     */
    CommandBuilder(const FileSystem& fileSystem, std::string localUser);

    /**
     * @brief Builds the invocation for a request.
     *
     * Shapes produced:
     * - DirectorySync:  rsync -avz --progress --protect-args [-e "ssh -p P -i KEY"] -- SRC DST
     * - SingleFileCopy: scp [-P P] [-i KEY] -- SRC DST
     * - RemoteList:     ssh [-p P] [-i KEY] -- USER@HOST ls -la -- 'PATH'
     *
     * The listing path is quoted for the remote shell except for a leading "~/", which
     * stays unquoted so it still names the login directory. IPv6 hosts are bracketed in
     * scp/rsync addresses and passed bare to ssh.
     *
     * @param strategy Strategy chosen by selectStrategy().
     * @param request Request the strategy was chosen for.
     * @return std::expected<ArgumentVector, TransferError> Argument vector, InvalidProfile
     *         if the identity file does not exist or cannot be passed safely, or
     *         InvalidTarget if a copy has no destination.
     */
    std::expected<ArgumentVector, TransferError> build(Strategy strategy, const TransferRequest& request) const;

    /**
     * @brief Program run for a strategy ("rsync", "scp" or "ssh").
     */
    static const char* programFor(Strategy strategy);

    /**
     * @brief Renders an argument vector for display (dry runs, logs).
     *
     * Arguments containing characters outside a conservative safe set are single-quoted.
     * The result is never executed.
     */
    static std::string renderCommand(const ArgumentVector& argv);

    /**
     * @brief Quotes a word for a POSIX shell.
     *
     * The word is wrapped in single quotes, with embedded single quotes written as '\''.
     */
    static std::string shellQuote(const std::string& word);

private:
    std::expected<std::string, TransferError> identityFile(const ServerProfile& profile) const;
    std::string remoteAddress(const Endpoint& endpoint) const;
    std::string loginFor(const ServerProfile& profile) const;

    const FileSystem& fileSystem; ///< Filesystem queries.
    std::string localUser;        ///< Fallback remote login.
};

#endif // COMMAND_BUILDER_HPP
