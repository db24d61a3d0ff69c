#include "infrastructure/ipc/ShutdownCoordinator.hpp"

#include "core/types/InstanceError.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace linkrelay::infra {

ShutdownCoordinator::ShutdownCoordinator(AsioContext& context,
                                         std::shared_ptr<ConnectionServer> server,
                                         const core::ILocalPlatform& platform)
    : context_(context), server_(std::move(server)), platform_(platform) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    cancelSignals();
}

void ShutdownCoordinator::watchSignals(ShutdownCallback onShutdown) {
    std::lock_guard lock(signalsMutex_);
    if (signals_) {
        return;
    }

    onShutdown_ = std::move(onShutdown);
    signals_.emplace(context_.getContext(), SIGINT, SIGTERM);
    signals_->async_wait([this](const asio::error_code& ec, int signalNumber) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        onSignal(ec, signalNumber);
    });
    spdlog::debug("Watching for termination signals");
}

void ShutdownCoordinator::onSignal(const asio::error_code& ec, int signalNumber) {
    if (ec) {
        spdlog::warn("Signal wait failed: {}", ec.message());
        return;
    }

    spdlog::info("Received signal {}, shutting down", signalNumber);
    if (shutdown() && onShutdown_) {
        onShutdown_();
    }
}

void ShutdownCoordinator::recordBoundArtifact() {
    std::lock_guard lock(artifactMutex_);
    boundArtifact_ = platform_.artifactIdentity(server_->endpoint().socketPath);
}

bool ShutdownCoordinator::shutdown() {
    if (shutdown_.exchange(true)) {
        spdlog::debug("Shutdown already performed");
        return false;
    }

    const auto& endpoint = server_->endpoint();
    if (endpoint.socketPath.empty()) {
        server_->stop();
        return true;
    }

    // A launch must not bind between closing the listener and unlinking it
    std::unique_ptr<core::IClaimLock> claim;
    try {
        claim = platform_.acquireClaimLock(endpoint.lockPath());
    } catch (const core::InstanceError& e) {
        spdlog::warn("Leaving rendezvous artifact {} in place: {}", endpoint.toString(),
                     e.what());
        server_->stop();
        return true;
    }

    server_->stop();

    std::optional<core::ArtifactIdentity> owned;
    {
        std::lock_guard lock(artifactMutex_);
        owned = boundArtifact_;
    }
    auto current = platform_.artifactIdentity(endpoint.socketPath);
    if (owned && current && *current != *owned) {
        spdlog::info("Rendezvous artifact {} belongs to another instance, leaving it",
                     endpoint.toString());
        return true;
    }

    std::error_code ec;
    if (platform_.removeArtifact(endpoint.socketPath, ec)) {
        spdlog::info("Removed rendezvous artifact {}", endpoint.toString());
    } else {
        spdlog::warn("Failed to remove rendezvous artifact {}: {}", endpoint.toString(),
                     ec.message());
    }

    return true;
}

void ShutdownCoordinator::cancelSignals() {
    std::lock_guard lock(signalsMutex_);
    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
        signals_.reset();
    }
}

} // namespace linkrelay::infra
