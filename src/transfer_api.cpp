#include "transfer_api.hpp"
#include "target_resolver.hpp"
#include "strategy_selector.hpp"
#include "command_builder.hpp"
#include <format>
#include <print>

TransferAPI::TransferAPI(const XferConfig& config, const ProfileStore& store,
                         const FileSystem& fileSystem, ProcessRunner& runner)
    : config(config), store(store), fileSystem(fileSystem), runner(runner) {}

std::expected<TransferOutcome, TransferError> TransferAPI::transfer(const std::string& source,
                                                                    const std::string& destination,
                                                                    TransferMode mode, bool recursive) {
    TargetResolver resolver(store);
    auto from = resolver.resolve(source);
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = resolver.resolve(destination);
    if (!to) {
        return std::unexpected(to.error());
    }

    if (mode == TransferMode::Send && (from->isRemote || !to->isRemote)) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget,
            std::format("send expects a local source and an alias:path destination, got '{}' -> '{}'",
                        source, destination)));
    }
    if (mode == TransferMode::Get && (!from->isRemote || to->isRemote)) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget,
            std::format("get expects an alias:path source and a local destination, got '{}' -> '{}'",
                        source, destination)));
    }
    if (!from->isRemote && !fileSystem.exists(from->path)) {
        return std::unexpected(TransferError(ErrorKind::InvalidTarget,
            std::format("local source '{}' does not exist", from->path)));
    }

    bool forceSync = recursive || mode == TransferMode::Sync;
    auto request = makeTransferRequest(std::move(*from), std::move(*to), forceSync, fileSystem);
    return dispatch(request);
}

std::expected<TransferOutcome, TransferError> TransferAPI::list(const std::optional<std::string>& location) {
    std::string expr;
    if (location) {
        expr = *location;
    } else if (auto alias = store.defaultAlias()) {
        expr = std::format("{}:", *alias);
    } else {
        return std::unexpected(TransferError(ErrorKind::Usage,
            "no location given and no default server configured (see 'xfer server default')"));
    }

    TargetResolver resolver(store);
    auto endpoint = resolver.resolve(expr);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }
    auto request = makeTransferRequest(std::move(*endpoint), std::nullopt, false, fileSystem);
    return dispatch(request);
}

std::expected<TransferOutcome, TransferError> TransferAPI::dispatch(const TransferRequest& request) {
    auto strategy = selectStrategy(request);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }

    CommandBuilder builder(fileSystem, XferConfig::localUserName());
    auto argv = builder.build(*strategy, request);
    if (!argv) {
        return std::unexpected(argv.error());
    }
    std::string rendered = CommandBuilder::renderCommand(*argv);

    if (config.dryRun) {
        config.logMessage(std::format("Dry run ({}): {}", strategyName(*strategy), rendered));
        std::println("{}", rendered);
        return TransferOutcome{*strategy, 0, true, std::nullopt, std::nullopt};
    }

    config.logMessage(std::format("Running {}: {}", strategyName(*strategy), rendered));
    Executor executor(runner);
    auto outcome = executor.run(*strategy, *argv);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (!outcome->succeeded) {
        return std::unexpected(TransferError::mechanism(argv->front(), outcome->exitCode,
                                                        outcome->classification, outcome->diagnostic));
    }
    config.logMessage(std::format("{} completed: {}", strategyName(*strategy), rendered));
    return *outcome;
}
