#pragma once

#include "core/types/DeepLinkEvent.hpp"
#include "core/types/RendezvousEndpoint.hpp"
#include "infrastructure/ipc/EventDispatcher.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <array>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace linkrelay::infra {

/**
 * @brief Bounds applied to each relay connection.
 */
struct ServerLimits {
    std::chrono::milliseconds readTimeout{5000}; ///< Zero waits for the peer indefinitely
    size_t maxPayloadBytes{65536};               ///< Larger payloads abandon the connection
};

/**
 * @brief Counters describing the server's activity.
 */
struct ServerStatistics {
    uint64_t connectionsAccepted{0};  ///< Connections accepted from followers
    uint64_t connectionsAbandoned{0}; ///< Connections dropped on error, timeout or size
    uint64_t eventsDispatched{0};     ///< Links handed to the dispatcher
    uint64_t fragmentsRejected{0};    ///< Payload entries that were not valid URLs
};

/**
 * @brief Leader-side relay server on the rendezvous endpoint.
 *
 * Holds the listening socket, which is the leader's exclusive claim on the
 * endpoint. Connections are accepted asynchronously for the lifetime of the
 * process. Each connection is read until the follower closes it, the payload
 * is split into arguments, and every argument that parses as a URL is
 * dispatched as a DeepLinkEvent in payload order. Connections are served
 * concurrently, so a stalled follower never delays the next accept.
 *
 * @note Must be owned by a std::shared_ptr. This class is non-copyable.
 */
class ConnectionServer : public std::enable_shared_from_this<ConnectionServer> {
public:
    /**
     * @brief Constructs a ConnectionServer.
     * @param context AsioContext running the accept loop and reads.
     * @param dispatcher Dispatcher receiving parsed links.
     * @param limits Per-connection bounds.
     */
    ConnectionServer(AsioContext& context, std::shared_ptr<EventDispatcher> dispatcher,
                     ServerLimits limits = {});

    /**
     * @brief Destructor. Closes the listener if still open.
     */
    ~ConnectionServer();

    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    /**
     * @brief Binds and listens on the endpoint, acquiring the listening handle.
     *
     * Fails with "address in use" when another process owns the endpoint.
     *
     * @param endpoint Endpoint to bind.
     * @return Empty on success, otherwise the open, bind or listen error.
     */
    asio::error_code bind(const core::RendezvousEndpoint& endpoint);

    /**
     * @brief Starts the accept loop. Requires a successful bind().
     */
    void start();

    /**
     * @brief Closes the listening handle, ending the accept loop.
     *
     * In-flight connections finish on their own. The socket file is left for
     * the caller to remove. Safe to call repeatedly.
     */
    void stop();

    bool isBound() const;
    bool isRunning() const { return running_.load(); }

    const core::RendezvousEndpoint& endpoint() const { return endpoint_; }

    /**
     * @brief Parses arguments as URLs and dispatches the valid ones in order.
     * @param args Argument strings; empty entries are ignored.
     * @param origin Provenance recorded on each event.
     * @return Number of events dispatched.
     */
    size_t dispatchArguments(const std::vector<std::string>& args, core::LinkOrigin origin);

    ServerStatistics statistics() const;

private:
    struct Session;

    void startAccept();
    void onAccept(const asio::error_code& ec, std::shared_ptr<Session> session);
    void beginRead(std::shared_ptr<Session> session);
    void readChunk(std::shared_ptr<Session> session);
    void finishSession(const std::shared_ptr<Session>& session);
    void abandonSession(const std::shared_ptr<Session>& session, const std::string& reason);

    AsioContext& context_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    ServerLimits limits_;
    core::RendezvousEndpoint endpoint_;

    std::unique_ptr<asio::local::stream_protocol::acceptor> acceptor_;
    asio::steady_timer retryTimer_;
    mutable std::mutex acceptorMutex_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> connectionsAccepted_{0};
    std::atomic<uint64_t> connectionsAbandoned_{0};
    std::atomic<uint64_t> eventsDispatched_{0};
    std::atomic<uint64_t> fragmentsRejected_{0};
};

} // namespace linkrelay::infra
