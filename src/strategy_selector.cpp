#include "strategy_selector.hpp"
#include <format>
#include <utility>

const char* strategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::SingleFileCopy: return "single-file-copy";
        case Strategy::DirectorySync: return "directory-sync";
        case Strategy::RemoteList: return "remote-list";
    }
    return "unknown";
}

TransferRequest makeTransferRequest(Endpoint source, std::optional<Endpoint> destination,
                                    bool forceSync, const FileSystem& fileSystem) {
    TransferRequest request;
    request.recursive = forceSync || (!source.isRemote && fileSystem.isDirectory(source.path));
    request.source = std::move(source);
    request.destination = std::move(destination);
    return request;
}

std::expected<Strategy, TransferError> selectStrategy(const TransferRequest& request) {
    const bool sourceRemote = request.source.isRemote;
    const bool destRemote = request.destination && request.destination->isRemote;

    if (!sourceRemote && !destRemote) {
        return std::unexpected(TransferError(ErrorKind::AmbiguousRequest,
            std::format("no remote side in request for '{}'; use alias:path for the server side",
                        request.source.path)));
    }
    if (sourceRemote && destRemote) {
        return std::unexpected(TransferError(ErrorKind::AmbiguousRequest,
            std::format("remote-to-remote transfers are not supported ('{}' to '{}')",
                        request.source.profile->alias, request.destination->profile->alias)));
    }
    if (request.recursive && request.destination) {
        return Strategy::DirectorySync;
    }
    if (!request.destination) {
        return Strategy::RemoteList;
    }
    return Strategy::SingleFileCopy;
}
