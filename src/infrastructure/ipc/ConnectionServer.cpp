#include "infrastructure/ipc/ConnectionServer.hpp"

#include "core/types/Url.hpp"
#include "infrastructure/ipc/PayloadCodec.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace linkrelay::infra {

struct ConnectionServer::Session {
    explicit Session(asio::io_context& io)
        : strand(asio::make_strand(io)), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::local::stream_protocol::socket socket;
    asio::steady_timer timer;
    std::string payload;
    std::array<char, 4096> chunk{};
    bool finished{false};
};

ConnectionServer::ConnectionServer(AsioContext& context,
                                   std::shared_ptr<EventDispatcher> dispatcher,
                                   ServerLimits limits)
    : context_(context), dispatcher_(std::move(dispatcher)), limits_(limits),
      retryTimer_(context.getContext()) {}

ConnectionServer::~ConnectionServer() {
    stop();
}

asio::error_code ConnectionServer::bind(const core::RendezvousEndpoint& endpoint) {
    std::lock_guard lock(acceptorMutex_);
    if (acceptor_ && acceptor_->is_open()) {
        return asio::error::already_open;
    }

    auto acceptor = std::make_unique<asio::local::stream_protocol::acceptor>(context_.getContext());
    asio::local::stream_protocol::endpoint localEndpoint(endpoint.toString());
    asio::error_code ec;

    acceptor->open(localEndpoint.protocol(), ec);
    if (ec) {
        return ec;
    }

    acceptor->bind(localEndpoint, ec);
    if (ec) {
        asio::error_code closeEc;
        acceptor->close(closeEc);
        return ec;
    }

    acceptor->listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        asio::error_code closeEc;
        acceptor->close(closeEc);
        // bind() created the socket file; it must not outlive the failed claim
        std::error_code removeEc;
        std::filesystem::remove(endpoint.socketPath, removeEc);
        return ec;
    }

    std::error_code permEc;
    std::filesystem::permissions(endpoint.socketPath,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 permEc);
    if (permEc) {
        spdlog::warn("Cannot restrict permissions of {}: {}", endpoint.toString(),
                     permEc.message());
    }

    acceptor_ = std::move(acceptor);
    endpoint_ = endpoint;
    spdlog::info("Listening for relayed links on {}", endpoint_.toString());
    return {};
}

bool ConnectionServer::isBound() const {
    std::lock_guard lock(acceptorMutex_);
    return acceptor_ && acceptor_->is_open();
}

void ConnectionServer::start() {
    {
        std::lock_guard lock(acceptorMutex_);
        if (!acceptor_ || !acceptor_->is_open()) {
            spdlog::error("Relay server cannot start: endpoint is not bound");
            return;
        }
    }

    if (running_.exchange(true)) {
        return;
    }

    startAccept();
    spdlog::info("Relay server started");
}

void ConnectionServer::stop() {
    std::lock_guard lock(acceptorMutex_);
    bool wasRunning = running_.exchange(false);

    if (acceptor_ && acceptor_->is_open()) {
        asio::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            spdlog::warn("Error closing relay listener: {}", ec.message());
        }
        retryTimer_.cancel();
        spdlog::info("Relay listener on {} closed", endpoint_.toString());
    } else if (wasRunning) {
        spdlog::debug("Relay server stopped");
    }
}

void ConnectionServer::startAccept() {
    auto session = std::make_shared<Session>(context_.getContext());
    auto self = shared_from_this();

    std::lock_guard lock(acceptorMutex_);
    if (!running_.load() || !acceptor_ || !acceptor_->is_open()) {
        return;
    }

    acceptor_->async_accept(session->socket,
                            [self, session](const asio::error_code& ec) {
                                self->onAccept(ec, session);
                            });
}

void ConnectionServer::onAccept(const asio::error_code& ec, std::shared_ptr<Session> session) {
    if (ec == asio::error::operation_aborted || !running_.load()) {
        // The listener was closed: normal end of the accept loop
        spdlog::debug("Relay accept loop finished");
        return;
    }

    if (ec) {
        spdlog::warn("Failed to accept relay connection: {}", ec.message());
        // Back off briefly so a persistent error (e.g. descriptor exhaustion) does not spin
        auto self = shared_from_this();
        std::lock_guard lock(acceptorMutex_);
        if (!running_.load()) {
            return;
        }
        retryTimer_.expires_after(std::chrono::milliseconds(100));
        retryTimer_.async_wait([self](const asio::error_code& timerEc) {
            if (!timerEc) {
                self->startAccept();
            }
        });
        return;
    }

    ++connectionsAccepted_;
    spdlog::debug("Accepted relay connection");

    startAccept();
    beginRead(std::move(session));
}

void ConnectionServer::beginRead(std::shared_ptr<Session> session) {
    asio::dispatch(session->strand, [self = shared_from_this(), session]() {
        if (self->limits_.readTimeout.count() > 0) {
            session->timer.expires_after(self->limits_.readTimeout);
            session->timer.async_wait([self, session](const asio::error_code& ec) {
                if (ec || session->finished) {
                    return;
                }
                self->abandonSession(session, "peer did not close the connection in time");
            });
        }
        self->readChunk(session);
    });
}

void ConnectionServer::readChunk(std::shared_ptr<Session> session) {
    auto self = shared_from_this();
    session->socket.async_read_some(
        asio::buffer(session->chunk),
        [self, session](const asio::error_code& ec, std::size_t bytesRead) {
            if (session->finished) {
                return;
            }

            if (bytesRead > 0) {
                session->payload.append(session->chunk.data(), bytesRead);
                if (session->payload.size() > self->limits_.maxPayloadBytes) {
                    self->abandonSession(session, "payload exceeds " +
                                                      std::to_string(self->limits_.maxPayloadBytes) +
                                                      " bytes");
                    return;
                }
            }

            if (ec == asio::error::eof) {
                self->finishSession(session);
                return;
            }
            if (ec) {
                self->abandonSession(session, "read failed: " + ec.message());
                return;
            }

            self->readChunk(session);
        });
}

void ConnectionServer::finishSession(const std::shared_ptr<Session>& session) {
    session->finished = true;
    session->timer.cancel();

    asio::error_code ec;
    session->socket.close(ec);

    if (ec) {
        spdlog::debug("Error closing relay connection: {}", ec.message());
    }

    auto args = PayloadCodec::decode(session->payload);
    spdlog::debug("Relay payload of {} bytes with {} argument(s)", session->payload.size(),
                  args.size());
    dispatchArguments(args, core::LinkOrigin::Relay);
}

void ConnectionServer::abandonSession(const std::shared_ptr<Session>& session,
                                      const std::string& reason) {
    session->finished = true;
    session->timer.cancel();

    asio::error_code ec;
    session->socket.close(ec);

    ++connectionsAbandoned_;
    spdlog::warn("Abandoned relay connection: {}", reason);
}

size_t ConnectionServer::dispatchArguments(const std::vector<std::string>& args,
                                           core::LinkOrigin origin) {
    size_t dispatched = 0;

    for (const auto& arg : args) {
        if (arg.empty()) {
            continue;
        }

        auto url = core::Url::parse(arg);
        if (!url) {
            ++fragmentsRejected_;
            spdlog::warn("Ignoring malformed deep link: \"{}\"", arg);
            continue;
        }

        core::DeepLinkEvent event;
        event.url = std::move(*url);
        event.origin = origin;
        event.receivedAt = std::chrono::system_clock::now();

        dispatcher_->dispatch(std::move(event));
        ++eventsDispatched_;
        ++dispatched;
    }

    return dispatched;
}

ServerStatistics ConnectionServer::statistics() const {
    ServerStatistics stats;
    stats.connectionsAccepted = connectionsAccepted_.load();
    stats.connectionsAbandoned = connectionsAbandoned_.load();
    stats.eventsDispatched = eventsDispatched_.load();
    stats.fragmentsRejected = fragmentsRejected_.load();
    return stats;
}

} // namespace linkrelay::infra
