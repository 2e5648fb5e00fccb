/**
 * @file profile_prompt.hpp
 * @brief Interactive entry of a server profile for `xfer server add`.
 *
 * The questions are asked through an input capability so the flow can be driven by
 * scripted answers in tests. Validation of the collected profile stays in the store.
 */

#ifndef PROFILE_PROMPT_HPP
#define PROFILE_PROMPT_HPP

#include <string>
#include <optional>
#include <expected>
#include <istream>
#include <ostream>
#include "server_profile.hpp"

/**
 * @brief Interface for asking the user one line of input.
 */
class InputPrompt {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~InputPrompt() = default;

    /**
     * @brief Asks a question and reads the answer.
     *
     * @param question Text shown before the cursor.
     * @return std::optional<std::string> Answer without the line terminator, or nullopt
     *         at end of input.
     */
    virtual std::optional<std::string> ask(const std::string& question) = 0;
};

/**
 * @brief InputPrompt reading lines from a stream (stdin by default).
 */
class ConsolePrompt : public InputPrompt {
public:
    ConsolePrompt(std::istream& in, std::ostream& out);

    std::optional<std::string> ask(const std::string& question) override;

private:
    std::istream& in;
    std::ostream& out;
};

/**
 * @brief Profile collected by the prompt flow.
 */
struct ProfileDraft {
    ServerProfile profile;
    bool makeDefault = false; ///< User asked for this alias to become the default server.
};

/**
 * @brief Asks for every profile field.
 *
 * Answers are trimmed; blank answers leave optional fields unset. The default-server
 * question is only asked when offerDefault is set.
 *
 * @param prompt Input capability.
 * @param offerDefault Whether to offer making the new alias the default server.
 * @return std::expected<ProfileDraft, TransferError> Draft, InvalidProfile for a
 *         non-numeric port, or Usage if input ends early.
 */
std::expected<ProfileDraft, TransferError> promptForProfile(InputPrompt& prompt, bool offerDefault);

#endif // PROFILE_PROMPT_HPP
