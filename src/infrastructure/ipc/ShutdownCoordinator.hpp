#pragma once

#include "core/services/ILocalPlatform.hpp"
#include "infrastructure/ipc/ConnectionServer.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace linkrelay::infra {

/**
 * @brief Releases the rendezvous endpoint when the leader goes away.
 *
 * Triggered by SIGINT/SIGTERM or by an explicit shutdown() on the normal
 * exit path. Closes the listener first, which ends the accept loop, then
 * removes the socket file so the next launch finds no stale state. Both steps
 * run under the endpoint's claim lock, and a socket file that another launch
 * has since bound at the same path is left alone. Cleanup runs at most once
 * however many triggers arrive.
 */
class ShutdownCoordinator {
public:
    using ShutdownCallback = std::function<void()>;

    /**
     * @brief Constructs a ShutdownCoordinator.
     * @param context AsioContext on which signals are awaited.
     * @param server Server owning the listening handle.
     * @param platform Platform used to remove the socket file.
     */
    ShutdownCoordinator(AsioContext& context, std::shared_ptr<ConnectionServer> server,
                        const core::ILocalPlatform& platform);

    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /**
     * @brief Starts waiting for SIGINT and SIGTERM.
     * @param onShutdown Invoked once after a signal-triggered cleanup.
     */
    void watchSignals(ShutdownCallback onShutdown = {});

    /**
     * @brief Remembers the socket file the server just bound as ours.
     *
     * Once recorded, shutdown() only removes that exact file.
     */
    void recordBoundArtifact();

    /**
     * @brief Closes the listener and removes the socket file.
     * @return True if this call performed the cleanup, false if it already ran.
     */
    bool shutdown();

    bool hasShutdown() const { return shutdown_.load(); }

private:
    void onSignal(const asio::error_code& ec, int signalNumber);
    void cancelSignals();

    AsioContext& context_;
    std::shared_ptr<ConnectionServer> server_;
    const core::ILocalPlatform& platform_;

    std::optional<core::ArtifactIdentity> boundArtifact_;
    std::mutex artifactMutex_;

    std::optional<asio::signal_set> signals_;
    ShutdownCallback onShutdown_;
    std::mutex signalsMutex_;
    std::atomic<bool> shutdown_{false};
};

} // namespace linkrelay::infra
