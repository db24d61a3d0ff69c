/**
 * @file Url.hpp
 * @brief Absolute URL value used for deep links.
 *
 * This file defines a parsed, validated URL following the generic syntax of
 * RFC 3986. Only absolute URLs (with a scheme) are accepted since a deep link
 * without a scheme cannot be routed by the application.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace linkrelay::core {

/**
 * @brief A parsed absolute URL.
 *
 * Components are stored exactly as they appear in the input (no percent
 * decoding), except the scheme which is lower-cased.
 */
struct Url {
    std::string scheme;                  ///< Lower-cased scheme without the ':'
    std::string userInfo;                ///< User information before '@' (may be empty)
    std::string host;                    ///< Host name or bracketed IP literal
    std::optional<uint16_t> port;        ///< Port when given in the authority
    std::string path;                    ///< Path component (may be empty)
    std::optional<std::string> query;    ///< Query without the leading '?'
    std::optional<std::string> fragment; ///< Fragment without the leading '#'
    bool hasAuthority{false};            ///< Whether the URL contained "//authority"
    std::string text;                    ///< Original text as received

    /**
     * @brief Parses and validates an absolute URL.
     * @param text The candidate URL.
     * @return The parsed URL, or nullopt if the text is not a valid absolute URL.
     */
    static std::optional<Url> parse(std::string_view text);

    /**
     * @brief Returns the original URL text.
     */
    [[nodiscard]] const std::string& toString() const { return text; }

    bool operator==(const Url& other) const = default;
};

} // namespace linkrelay::core
