#include "profile_prompt.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string();
}

std::expected<std::string, TransferError> askTrimmed(InputPrompt& prompt, const std::string& question) {
    auto answer = prompt.ask(question);
    if (!answer) {
        return std::unexpected(TransferError(ErrorKind::Usage, "input ended before the profile was complete"));
    }
    return trim(*answer);
}

std::optional<std::string> nonEmpty(std::string value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out) : in(in), out(out) {}

std::optional<std::string> ConsolePrompt::ask(const std::string& question) {
    out << question << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return line;
}

std::expected<ProfileDraft, TransferError> promptForProfile(InputPrompt& prompt, bool offerDefault) {
    ProfileDraft draft;

    auto alias = askTrimmed(prompt, "Server alias (e.g., 'gcp', 'aws-ec2'): ");
    if (!alias) return std::unexpected(alias.error());
    draft.profile.alias = *alias;

    auto host = askTrimmed(prompt, "Host address (e.g., 'example.com', '10.0.0.1'): ");
    if (!host) return std::unexpected(host.error());
    draft.profile.host = *host;

    auto user = askTrimmed(prompt, "Username (optional, leave blank for your local login): ");
    if (!user) return std::unexpected(user.error());
    draft.profile.user = nonEmpty(*user);

    auto key = askTrimmed(prompt, "SSH key path (optional, leave blank for none): ");
    if (!key) return std::unexpected(key.error());
    draft.profile.keyPath = nonEmpty(*key);

    auto port = askTrimmed(prompt, "SSH port (optional, default is 22): ");
    if (!port) return std::unexpected(port.error());
    if (!port->empty()) {
        auto parsed = parsePort(*port);
        if (!parsed) return std::unexpected(parsed.error());
        draft.profile.port = *parsed;
    }

    auto remotePath = askTrimmed(prompt, "Default remote path (optional): ");
    if (!remotePath) return std::unexpected(remotePath.error());
    draft.profile.defaultRemotePath = nonEmpty(*remotePath);

    if (offerDefault) {
        auto answer = askTrimmed(prompt, "Set as default server? (y/n): ");
        if (!answer) return std::unexpected(answer.error());
        draft.makeDefault = *answer == "y" || *answer == "Y" || *answer == "yes";
    }
    return draft;
}
