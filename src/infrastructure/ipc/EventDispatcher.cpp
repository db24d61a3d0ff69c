#include "infrastructure/ipc/EventDispatcher.hpp"

#include <spdlog/spdlog.h>

namespace linkrelay::infra {

EventDispatcher::EventDispatcher(AsioContext& context, std::weak_ptr<core::IEventSink> sink)
    : strand_(asio::make_strand(context.getContext())), sink_(std::move(sink)) {}

void EventDispatcher::setSink(std::weak_ptr<core::IEventSink> sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
}

void EventDispatcher::dispatch(core::DeepLinkEvent event) {
    asio::post(strand_, [self = shared_from_this(), event = std::move(event)]() {
        self->deliver(event);
    });
}

void EventDispatcher::deliver(const core::DeepLinkEvent& event) {
    std::shared_ptr<core::IEventSink> sink;
    {
        std::lock_guard lock(mutex_);
        sink = sink_.lock();
    }

    if (!sink) {
        ++dropped_;
        spdlog::debug("No event sink, dropping deep link {}", event.url.toString());
        return;
    }

    try {
        sink->deliver(event);
        ++delivered_;
        spdlog::info("Delivered deep link {} ({})", event.url.toString(), event.originToString());
    } catch (const std::exception& e) {
        ++dropped_;
        spdlog::error("Event sink failed for {}: {}", event.url.toString(), e.what());
    }
}

} // namespace linkrelay::infra
