#include "infrastructure/ipc/RelayConnection.hpp"

#include <optional>

namespace linkrelay::infra {

RelayConnection::RelayConnection() : socket_(ioContext_) {}

RelayConnection::~RelayConnection() {
    close();
}

asio::error_code RelayConnection::connect(const core::RendezvousEndpoint& endpoint,
                                          std::chrono::milliseconds timeout) {
    std::optional<asio::error_code> result;

    socket_.async_connect(asio::local::stream_protocol::endpoint(endpoint.toString()),
                          [&result](const asio::error_code& ec) { result = ec; });

    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!result) {
        // Cancel the pending connect and let its handler run
        close();
        ioContext_.restart();
        ioContext_.run();
        return asio::error::timed_out;
    }

    if (*result) {
        close();
    }
    return *result;
}

asio::error_code RelayConnection::sendAndClose(const std::string& payload) {
    asio::error_code ec;
    if (!socket_.is_open()) {
        return asio::error::not_connected;
    }

    if (!payload.empty()) {
        asio::write(socket_, asio::buffer(payload), ec);
    }
    if (!ec) {
        socket_.shutdown(asio::local::stream_protocol::socket::shutdown_send, ec);
    }

    close();
    return ec;
}

void RelayConnection::close() {
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.close(ec);
    }
}

} // namespace linkrelay::infra
