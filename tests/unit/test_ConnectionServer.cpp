#include <catch2/catch_test_macros.hpp>

#include "infrastructure/ipc/ConnectionServer.hpp"
#include "support/TestSupport.hpp"

using namespace linkrelay;
using namespace std::chrono_literals;

namespace {

struct ServerFixture {
    explicit ServerFixture(infra::ServerLimits limits = {})
        : dir("server"), context(2), sink(std::make_shared<test::RecordingSink>()),
          dispatcher(std::make_shared<infra::EventDispatcher>(context, sink)),
          server(std::make_shared<infra::ConnectionServer>(context, dispatcher, limits)),
          endpoint{dir.path() / "app.sock"} {
        context.start();
    }

    ~ServerFixture() {
        server->stop();
        context.stop();
    }

    test::TestDir dir;
    infra::AsioContext context;
    std::shared_ptr<test::RecordingSink> sink;
    std::shared_ptr<infra::EventDispatcher> dispatcher;
    std::shared_ptr<infra::ConnectionServer> server;
    core::RendezvousEndpoint endpoint;
};

} // namespace

TEST_CASE("ConnectionServer binds the endpoint", "[ConnectionServer]") {
    ServerFixture fx;

    SECTION("Bind creates an owner-only socket file") {
        REQUIRE_FALSE(fx.server->bind(fx.endpoint));
        REQUIRE(fx.server->isBound());
        REQUIRE(std::filesystem::is_socket(fx.endpoint.socketPath));

        auto perms = std::filesystem::status(fx.endpoint.socketPath).permissions();
        REQUIRE((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none);
        REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
    }

    SECTION("Second bind on the same endpoint reports address in use") {
        REQUIRE_FALSE(fx.server->bind(fx.endpoint));

        auto other = std::make_shared<infra::ConnectionServer>(fx.context, fx.dispatcher);
        auto ec = other->bind(fx.endpoint);

        REQUIRE(ec);
        REQUIRE(test::TestPlatform(fx.dir.path()).isAddressInUse(ec));
        REQUIRE_FALSE(other->isBound());
    }

    SECTION("Start without bind does not run") {
        fx.server->start();
        REQUIRE_FALSE(fx.server->isRunning());
    }

    SECTION("Stop closes the listener but leaves the file") {
        REQUIRE_FALSE(fx.server->bind(fx.endpoint));
        fx.server->start();
        REQUIRE(fx.server->isRunning());

        fx.server->stop();
        fx.server->stop();

        REQUIRE_FALSE(fx.server->isRunning());
        REQUIRE_FALSE(fx.server->isBound());
        REQUIRE(std::filesystem::exists(fx.endpoint.socketPath));
    }
}

TEST_CASE("ConnectionServer relays payloads", "[ConnectionServer]") {
    ServerFixture fx;
    REQUIRE_FALSE(fx.server->bind(fx.endpoint));
    fx.server->start();

    SECTION("A single link becomes one event") {
        test::sendPayload(fx.endpoint.socketPath, "https://app/open?id=1");

        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 1; }));
        auto event = fx.sink->events().front();
        REQUIRE(event.url.text == "https://app/open?id=1");
        REQUIRE(event.url.query == "id=1");
        REQUIRE(event.origin == core::LinkOrigin::Relay);
    }

    SECTION("Malformed entries do not affect their siblings") {
        test::sendPayload(fx.endpoint.socketPath, "not a url\nhttps://ok/1\n");

        REQUIRE(test::waitFor([&]() { return fx.server->statistics().fragmentsRejected == 1; }));
        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 1; }));
        REQUIRE(fx.sink->urls() == std::vector<std::string>{"https://ok/1"});
    }

    SECTION("Payload order is preserved") {
        test::sendPayload(fx.endpoint.socketPath, "myapp://1\nmyapp://2\nmyapp://3");

        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 3; }));
        REQUIRE(fx.sink->urls() ==
                std::vector<std::string>{"myapp://1", "myapp://2", "myapp://3"});
    }

    SECTION("An empty payload dispatches nothing") {
        test::sendPayload(fx.endpoint.socketPath, "");

        REQUIRE(test::waitFor([&]() { return fx.server->statistics().connectionsAccepted == 1; }));
        std::this_thread::sleep_for(100ms);
        REQUIRE(fx.sink->count() == 0);
        REQUIRE(fx.server->statistics().connectionsAbandoned == 0);
    }

    SECTION("Payloads larger than one read are assembled") {
        std::string longPath(10000, 'a');
        test::sendPayload(fx.endpoint.socketPath, "myapp://host/" + longPath);

        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 1; }));
        REQUIRE(fx.sink->events().front().url.path == "/" + longPath);
    }

    SECTION("Many connections are all served") {
        for (int i = 0; i < 20; ++i) {
            test::sendPayload(fx.endpoint.socketPath, "myapp://n/" + std::to_string(i));
        }

        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 20; }));
        REQUIRE(fx.server->statistics().connectionsAccepted == 20);
    }
}

TEST_CASE("ConnectionServer keeps accepting while a peer stalls", "[ConnectionServer]") {
    infra::ServerLimits limits;
    limits.readTimeout = 0ms;
    ServerFixture fx(limits);
    REQUIRE_FALSE(fx.server->bind(fx.endpoint));
    fx.server->start();

    asio::io_context io;
    asio::local::stream_protocol::socket stalled(io);
    stalled.connect(asio::local::stream_protocol::endpoint(fx.endpoint.toString()));
    asio::write(stalled, asio::buffer(std::string("myapp://stalled")));

    test::sendPayload(fx.endpoint.socketPath, "myapp://second");

    REQUIRE(test::waitFor([&]() { return fx.sink->count() == 1; }));
    REQUIRE(fx.sink->urls() == std::vector<std::string>{"myapp://second"});

    // Closing the stalled peer completes its payload
    stalled.shutdown(asio::local::stream_protocol::socket::shutdown_send);
    stalled.close();

    REQUIRE(test::waitFor([&]() { return fx.sink->count() == 2; }));
    REQUIRE(fx.sink->urls().back() == "myapp://stalled");
}

TEST_CASE("ConnectionServer abandons misbehaving peers", "[ConnectionServer]") {
    SECTION("Peer exceeding the read timeout") {
        infra::ServerLimits limits;
        limits.readTimeout = 100ms;
        ServerFixture fx(limits);
        REQUIRE_FALSE(fx.server->bind(fx.endpoint));
        fx.server->start();

        asio::io_context io;
        asio::local::stream_protocol::socket slow(io);
        slow.connect(asio::local::stream_protocol::endpoint(fx.endpoint.toString()));
        asio::write(slow, asio::buffer(std::string("myapp://slow")));

        REQUIRE(test::waitFor([&]() { return fx.server->statistics().connectionsAbandoned == 1; }));
        REQUIRE(fx.sink->count() == 0);

        // The server still serves well-behaved peers
        test::sendPayload(fx.endpoint.socketPath, "myapp://ok");
        REQUIRE(test::waitFor([&]() { return fx.sink->count() == 1; }));
    }

    SECTION("Peer sending too much data") {
        infra::ServerLimits limits;
        limits.maxPayloadBytes = 64;
        ServerFixture fx(limits);
        REQUIRE_FALSE(fx.server->bind(fx.endpoint));
        fx.server->start();

        asio::io_context io;
        asio::local::stream_protocol::socket peer(io);
        peer.connect(asio::local::stream_protocol::endpoint(fx.endpoint.toString()));
        asio::error_code ec;
        asio::write(peer, asio::buffer("myapp://x/" + std::string(200, 'z')), ec);

        REQUIRE(test::waitFor([&]() { return fx.server->statistics().connectionsAbandoned == 1; }));
        REQUIRE(fx.sink->count() == 0);
    }
}

TEST_CASE("ConnectionServer dispatches launch arguments", "[ConnectionServer]") {
    ServerFixture fx;

    auto dispatched = fx.server->dispatchArguments({"myapp://a", "", "bogus", "myapp://b"},
                                                   core::LinkOrigin::LaunchArguments);

    REQUIRE(dispatched == 2);
    REQUIRE(test::waitFor([&]() { return fx.sink->count() == 2; }));
    for (const auto& event : fx.sink->events()) {
        REQUIRE(event.origin == core::LinkOrigin::LaunchArguments);
    }
    REQUIRE(fx.server->statistics().fragmentsRejected == 1);
}
