/**
 * @file IEventSink.hpp
 * @brief Interface through which deep links reach the application.
 */

#pragma once

#include "core/types/DeepLinkEvent.hpp"

namespace linkrelay::core {

/**
 * @brief Receiver of deep-link events, typically the GUI event queue.
 *
 * Implementations must return quickly; delivery happens on an I/O worker
 * thread and ordering relative to other application events is owned by the
 * implementation.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /**
     * @brief Delivers one deep-link event.
     * @param event The event to deliver.
     */
    virtual void deliver(const DeepLinkEvent& event) = 0;
};

} // namespace linkrelay::core
