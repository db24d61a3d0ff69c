/**
 * @file DeepLinkEvent.hpp
 * @brief Event delivered to the application when a deep link arrives.
 */

#pragma once

#include "core/types/Url.hpp"

#include <chrono>
#include <string>

namespace linkrelay::core {

/**
 * @brief Where a deep link came from.
 */
enum class LinkOrigin {
    Relay,          ///< Forwarded by a follower launch
    LaunchArguments ///< Passed on the leader's own command line
};

/**
 * @brief A deep link handed to the application's event sink.
 *
 * The IPC core keeps no reference to an event once it has been dispatched.
 */
struct DeepLinkEvent {
    Url url;                                           ///< The parsed link
    LinkOrigin origin{LinkOrigin::Relay};              ///< Provenance of the link
    std::chrono::system_clock::time_point receivedAt;  ///< When the link was parsed

    /**
     * @brief Converts the origin to a string.
     * @return "relay" or "launch".
     */
    [[nodiscard]] std::string originToString() const;

    bool operator==(const DeepLinkEvent& other) const = default;
};

} // namespace linkrelay::core
