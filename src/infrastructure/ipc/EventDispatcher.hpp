#pragma once

#include "core/services/IEventSink.hpp"
#include "core/types/DeepLinkEvent.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace linkrelay::infra {

/**
 * @brief Hands deep-link events to the application's event sink.
 *
 * dispatch() only queues the delivery on a strand and returns, so callers on
 * the I/O path never wait for the sink. Deliveries run one at a time in the
 * order they were dispatched. The sink is held weakly; events arriving after
 * the sink is gone are dropped.
 *
 * @note Must be owned by a std::shared_ptr; queued deliveries keep it alive.
 */
class EventDispatcher : public std::enable_shared_from_this<EventDispatcher> {
public:
    /**
     * @brief Constructs a dispatcher delivering on the given context.
     * @param context AsioContext whose workers run the deliveries.
     * @param sink Event sink; may be set later with setSink().
     */
    explicit EventDispatcher(AsioContext& context, std::weak_ptr<core::IEventSink> sink = {});

    /**
     * @brief Replaces the event sink.
     * @param sink New sink; an empty pointer drops all further events.
     */
    void setSink(std::weak_ptr<core::IEventSink> sink);

    /**
     * @brief Queues an event for delivery.
     * @param event Event to deliver.
     */
    void dispatch(core::DeepLinkEvent event);

    uint64_t deliveredCount() const { return delivered_.load(); }
    uint64_t droppedCount() const { return dropped_.load(); }

private:
    void deliver(const core::DeepLinkEvent& event);

    asio::strand<asio::io_context::executor_type> strand_;
    std::weak_ptr<core::IEventSink> sink_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace linkrelay::infra
