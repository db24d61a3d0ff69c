#include <catch2/catch_test_macros.hpp>

#include "infrastructure/ipc/EventDispatcher.hpp"
#include "support/TestSupport.hpp"

#include <stdexcept>

using namespace linkrelay;

namespace {

core::DeepLinkEvent makeEvent(const std::string& text) {
    core::DeepLinkEvent event;
    event.url = *core::Url::parse(text);
    event.receivedAt = std::chrono::system_clock::now();
    return event;
}

class ThrowingSink : public core::IEventSink {
public:
    void deliver(const core::DeepLinkEvent& event) override {
        ++calls;
        if (event.url.host == "boom") {
            throw std::runtime_error("sink failure");
        }
    }

    std::atomic<int> calls{0};
};

} // namespace

TEST_CASE("EventDispatcher delivers events", "[EventDispatcher]") {
    infra::AsioContext context(4);
    context.start();

    auto sink = std::make_shared<test::RecordingSink>();
    auto dispatcher = std::make_shared<infra::EventDispatcher>(context, sink);

    SECTION("Events arrive in dispatch order") {
        std::vector<std::string> expected;
        for (int i = 0; i < 200; ++i) {
            expected.push_back("myapp://item/" + std::to_string(i));
            dispatcher->dispatch(makeEvent(expected.back()));
        }

        REQUIRE(test::waitFor([&]() { return sink->count() == expected.size(); }));
        REQUIRE(sink->urls() == expected);
        REQUIRE(dispatcher->deliveredCount() == expected.size());
        REQUIRE(dispatcher->droppedCount() == 0);
    }

    SECTION("Event fields are delivered unchanged") {
        auto event = makeEvent("https://app/open?id=1");
        event.origin = core::LinkOrigin::LaunchArguments;
        dispatcher->dispatch(event);

        REQUIRE(test::waitFor([&]() { return sink->count() == 1; }));
        REQUIRE(sink->events().front() == event);
    }

    SECTION("Events are dropped once the sink is gone") {
        sink.reset();
        dispatcher->dispatch(makeEvent("myapp://late"));

        REQUIRE(test::waitFor([&]() { return dispatcher->droppedCount() == 1; }));
        REQUIRE(dispatcher->deliveredCount() == 0);
    }

    SECTION("Sink can be replaced") {
        auto other = std::make_shared<test::RecordingSink>();
        dispatcher->setSink(other);
        dispatcher->dispatch(makeEvent("myapp://other"));

        REQUIRE(test::waitFor([&]() { return other->count() == 1; }));
        REQUIRE(sink->count() == 0);
    }

    context.stop();
}

TEST_CASE("EventDispatcher survives a failing sink", "[EventDispatcher]") {
    infra::AsioContext context(2);
    context.start();

    auto sink = std::make_shared<ThrowingSink>();
    auto dispatcher = std::make_shared<infra::EventDispatcher>(context, sink);

    dispatcher->dispatch(makeEvent("myapp://boom"));
    dispatcher->dispatch(makeEvent("myapp://fine"));

    REQUIRE(test::waitFor([&]() { return sink->calls.load() == 2; }));
    REQUIRE(test::waitFor([&]() { return dispatcher->deliveredCount() == 1; }));
    REQUIRE(dispatcher->droppedCount() == 1);

    context.stop();
}
