/**
 * @file test_relay_workflow.cpp
 * @brief Integration tests for the complete leader/follower lifecycle.
 *
 * Drives several coordinators against one rendezvous directory the way
 * successive launches of the application would.
 */

#include <catch2/catch_test_macros.hpp>

#include "app/InstanceCoordinator.hpp"
#include "core/types/InstanceError.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/ipc/InstanceProbe.hpp"
#include "support/TestSupport.hpp"

#include <csignal>

using namespace linkrelay;
using namespace std::chrono_literals;

namespace {

/**
 * @brief One simulated launch of the application.
 */
class Launch {
public:
    Launch(const infra::InstanceConfig& config, const std::filesystem::path& dir)
        : context_(static_cast<size_t>(config.workerThreads)),
          coordinator_(config, context_, std::make_shared<test::TestPlatform>(dir)),
          sink_(std::make_shared<test::RecordingSink>()) {}

    ~Launch() {
        coordinator_.shutdown();
        context_.stop();
    }

    core::InstanceRole start(const std::vector<std::string>& args,
                             std::function<void()> onShutdown = {}) {
        auto role = coordinator_.decide(args);
        if (role == core::InstanceRole::Leader) {
            context_.start();
            coordinator_.setEventSink(sink_);
            coordinator_.startServing(std::move(onShutdown));
            coordinator_.dispatchLaunchArguments(args);
        }
        return role;
    }

    app::InstanceCoordinator& coordinator() { return coordinator_; }
    test::RecordingSink& sink() { return *sink_; }

    void dropSink() { sink_.reset(); }

private:
    infra::AsioContext context_;
    app::InstanceCoordinator coordinator_;
    std::shared_ptr<test::RecordingSink> sink_;
};

infra::InstanceConfig loadConfig(const std::filesystem::path& configDir,
                                 const std::filesystem::path& socketDir) {
    infra::ConfigManager manager(configDir);
    manager.config().instance.binaryName = "relayapp";
    manager.config().instance.socketDirectory = socketDir.string();
    manager.config().instance.readTimeoutMs = 1000;
    REQUIRE(manager.save());

    infra::ConfigManager reloaded(configDir);
    REQUIRE(reloaded.load());
    return reloaded.config().instance;
}

} // namespace

TEST_CASE("Successive launches hand their links to the first one", "[integration][relay]") {
    test::TestDir dir("flow");
    auto config = loadConfig(dir.path() / "config", dir.path());

    Launch first(config, dir.path());
    REQUIRE(first.start({"relayapp://boot"}) == core::InstanceRole::Leader);
    REQUIRE(test::waitFor([&]() { return first.sink().count() == 1; }));
    REQUIRE(first.sink().events().front().origin == core::LinkOrigin::LaunchArguments);

    for (int i = 0; i < 5; ++i) {
        Launch follower(config, dir.path());
        REQUIRE(follower.start({"relayapp://open?id=" + std::to_string(i), "junk entry"}) ==
                core::InstanceRole::Follower);
        REQUIRE(follower.sink().count() == 0);
    }

    REQUIRE(test::waitFor([&]() { return first.sink().count() == 6; }));

    auto events = first.sink().events();
    for (size_t i = 1; i < events.size(); ++i) {
        REQUIRE(events[i].origin == core::LinkOrigin::Relay);
        REQUIRE(events[i].url.scheme == "relayapp");
    }

    auto stats = first.coordinator().server().statistics();
    REQUIRE(stats.connectionsAccepted == 5);
    REQUIRE(stats.fragmentsRejected == 5);
    REQUIRE(stats.connectionsAbandoned == 0);
}

TEST_CASE("Leadership passes on after shutdown", "[integration][relay]") {
    test::TestDir dir("flow");
    auto config = loadConfig(dir.path() / "config", dir.path());
    auto endpoint = core::RendezvousEndpoint{dir.path() / "relayapp.sock"};

    {
        Launch first(config, dir.path());
        REQUIRE(first.start({}) == core::InstanceRole::Leader);
        REQUIRE(first.coordinator().endpoint() == endpoint);
    }

    test::TestPlatform platform(dir.path());
    infra::InstanceProbe probe(platform, 500ms);
    REQUIRE(probe.probe(endpoint).result == core::ProbeResult::Absent);

    Launch second(config, dir.path());
    REQUIRE(second.start({}) == core::InstanceRole::Leader);

    Launch third(config, dir.path());
    REQUIRE(third.start({"relayapp://to-second"}) == core::InstanceRole::Follower);
    REQUIRE(test::waitFor([&]() { return second.sink().count() == 1; }));
}

TEST_CASE("Termination signal releases the endpoint", "[integration][relay]") {
    test::TestDir dir("flow");
    auto config = loadConfig(dir.path() / "config", dir.path());

    std::atomic<bool> quitRequested{false};
    Launch leader(config, dir.path());
    REQUIRE(leader.start({}, [&]() { quitRequested = true; }) == core::InstanceRole::Leader);

    REQUIRE(std::raise(SIGINT) == 0);

    REQUIRE(test::waitFor([&]() { return quitRequested.load(); }));
    REQUIRE_FALSE(std::filesystem::exists(leader.coordinator().endpoint().socketPath));
    REQUIRE_FALSE(leader.coordinator().server().isRunning());

    Launch next(config, dir.path());
    REQUIRE(next.start({}) == core::InstanceRole::Leader);
}

TEST_CASE("Crashed leader is replaced by the next launch", "[integration][relay]") {
    test::TestDir dir("flow");
    auto config = loadConfig(dir.path() / "config", dir.path());

    test::createStaleSocket(dir.path() / "relayapp.sock");

    Launch leader(config, dir.path());
    REQUIRE(leader.start({"relayapp://recovered"}) == core::InstanceRole::Leader);
    REQUIRE(test::waitFor([&]() { return leader.sink().count() == 1; }));

    Launch follower(config, dir.path());
    REQUIRE(follower.start({"relayapp://relayed"}) == core::InstanceRole::Follower);
    REQUIRE(test::waitFor([&]() { return leader.sink().count() == 2; }));
}

TEST_CASE("Links are dropped once the application sink is gone", "[integration][relay]") {
    test::TestDir dir("flow");
    auto config = loadConfig(dir.path() / "config", dir.path());

    Launch leader(config, dir.path());
    REQUIRE(leader.start({}) == core::InstanceRole::Leader);
    leader.dropSink();

    Launch follower(config, dir.path());
    REQUIRE(follower.start({"relayapp://late"}) == core::InstanceRole::Follower);

    REQUIRE(test::waitFor([&]() { return leader.coordinator().dispatcher().droppedCount() == 1; }));
    REQUIRE(leader.coordinator().dispatcher().deliveredCount() == 0);
}
