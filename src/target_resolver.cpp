#include "target_resolver.hpp"
#include <format>

namespace {

std::string anchorRemotePath(const ServerProfile& profile, const std::string& path) {
    if (!profile.defaultRemotePath || (!path.empty() && (path.front() == '/' || path.front() == '~'))) {
        return path;
    }
    std::string base = *profile.defaultRemotePath;
    if (path.empty()) {
        return base;
    }
    if (base.back() != '/') {
        base += '/';
    }
    return base + path;
}

} // namespace

TargetResolver::TargetResolver(const ProfileStore& store) : store(store) {}

std::expected<Endpoint, TransferError> TargetResolver::resolve(const std::string& expr) const {
    if (expr.empty()) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget, "empty location"));
    }

    auto colon = expr.find(':');
    auto slash = expr.find('/');
    if (colon == std::string::npos || (slash != std::string::npos && slash < colon)) {
        return Endpoint{false, nullptr, expr};
    }

    std::string alias = expr.substr(0, colon);
    if (alias.empty()) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget,
                                             std::format("missing server alias in '{}'", expr)));
    }

    auto profile = store.get(alias);
    if (!profile) {
        return std::unexpected(profile.error());
    }
    return Endpoint{true, *profile, anchorRemotePath(**profile, expr.substr(colon + 1))};
}
