#pragma once

#include "core/types/RendezvousEndpoint.hpp"

#include <asio.hpp>
#include <chrono>
#include <string>

namespace linkrelay::infra {

/**
 * @brief Client side of the relay channel, used for probing and forwarding.
 *
 * Owns a private I/O context so that it can be used on the synchronous
 * startup path before any worker thread exists.
 */
class RelayConnection {
public:
    RelayConnection();
    ~RelayConnection();

    RelayConnection(const RelayConnection&) = delete;
    RelayConnection& operator=(const RelayConnection&) = delete;

    /**
     * @brief Connects to the endpoint, giving up after a timeout.
     * @param endpoint Endpoint to connect to.
     * @param timeout Maximum time to wait for the connection.
     * @return Empty on success; asio::error::timed_out if the timeout elapsed.
     */
    asio::error_code connect(const core::RendezvousEndpoint& endpoint,
                             std::chrono::milliseconds timeout);

    /**
     * @brief Writes a whole payload and closes the connection.
     *
     * Closing marks the end of the payload for the leader.
     *
     * @param payload Bytes to send.
     * @return Empty on success, otherwise the write or shutdown error.
     */
    asio::error_code sendAndClose(const std::string& payload);

    /**
     * @brief Closes the connection without sending anything.
     */
    void close();

    bool isOpen() const { return socket_.is_open(); }

private:
    asio::io_context ioContext_;
    asio::local::stream_protocol::socket socket_;
};

} // namespace linkrelay::infra
