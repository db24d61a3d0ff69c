#pragma once

#include "core/services/IEventSink.hpp"
#include "core/services/ILocalPlatform.hpp"
#include "core/types/InstanceRole.hpp"
#include "core/types/RendezvousEndpoint.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/ipc/ConnectionServer.hpp"
#include "infrastructure/ipc/EventDispatcher.hpp"
#include "infrastructure/ipc/InstanceProbe.hpp"
#include "infrastructure/ipc/RelayConnection.hpp"
#include "infrastructure/ipc/ShutdownCoordinator.hpp"
#include "infrastructure/ipc/UnixLocalPlatform.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace linkrelay::app {

/**
 * @brief Makes sure only one process of an application serves deep links.
 *
 * The first launch becomes the leader: it binds the rendezvous endpoint and
 * serves relayed links until shutdown. Every later launch becomes a follower:
 * it forwards its arguments to the leader and is expected to exit.
 *
 * Typical use:
 * @code
 * InstanceCoordinator coordinator(config.instance, asio);
 * if (coordinator.decide(args) == core::InstanceRole::Follower) {
 *     return 0;
 * }
 * coordinator.setEventSink(sink);
 * coordinator.startServing();
 * @endcode
 */
class InstanceCoordinator {
public:
    /**
     * @brief Constructs the coordinator and resolves the endpoint.
     * @param config Instance settings; binaryName must be set.
     * @param context AsioContext that will run the leader's server.
     * @param platform Platform adapter.
     * @throws core::InstanceError (Environment) if the endpoint cannot be resolved.
     */
    InstanceCoordinator(infra::InstanceConfig config, infra::AsioContext& context,
                        std::shared_ptr<core::ILocalPlatform> platform =
                            std::make_shared<infra::UnixLocalPlatform>());

    /**
     * @brief Destructor. A leader releases the endpoint if still held.
     */
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator&) = delete;
    InstanceCoordinator& operator=(const InstanceCoordinator&) = delete;

    /**
     * @brief Decides whether this process leads or follows.
     *
     * A follower has already delivered @p args to the leader when this
     * returns. Later calls return the recorded role without side effects.
     *
     * @param args Launch arguments, excluding the program name.
     * @return The role of this process.
     * @throws core::InstanceError (Environment) if the endpoint cannot be probed or bound.
     * @throws core::InstanceError (Transmission) if the leader could not be reached.
     */
    core::InstanceRole decide(const std::vector<std::string>& args);

    std::optional<core::InstanceRole> role() const;

    const core::RendezvousEndpoint& endpoint() const { return endpoint_; }

    /**
     * @brief Sets the sink receiving deep-link events.
     * @param sink Sink held weakly by the dispatcher.
     */
    void setEventSink(std::weak_ptr<core::IEventSink> sink);

    /**
     * @brief Starts accepting relayed links and watching termination signals.
     *
     * Only valid for the leader. The AsioContext must be running.
     *
     * @param onShutdown Invoked once after a signal-triggered shutdown.
     */
    void startServing(infra::ShutdownCoordinator::ShutdownCallback onShutdown = {});

    /**
     * @brief Dispatches the leader's own URL arguments.
     * @param args Launch arguments, excluding the program name.
     * @return Number of events dispatched.
     */
    size_t dispatchLaunchArguments(const std::vector<std::string>& args);

    /**
     * @brief Releases the endpoint. Runs at most once and only for the leader.
     * @return True if this call performed the cleanup.
     */
    bool shutdown();

    infra::ConnectionServer& server() { return *server_; }
    infra::EventDispatcher& dispatcher() { return *dispatcher_; }
    const core::ILocalPlatform& platform() const { return *platform_; }

private:
    void relay(infra::RelayConnection& connection, const std::vector<std::string>& args);

    infra::InstanceConfig config_;
    infra::AsioContext& context_;
    std::shared_ptr<core::ILocalPlatform> platform_;
    core::RendezvousEndpoint endpoint_;
    infra::InstanceProbe probe_;

    std::shared_ptr<infra::EventDispatcher> dispatcher_;
    std::shared_ptr<infra::ConnectionServer> server_;
    std::unique_ptr<infra::ShutdownCoordinator> shutdown_;

    mutable std::mutex mutex_;
    std::optional<core::InstanceRole> role_;
};

} // namespace linkrelay::app
