#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace linkrelay::infra {

/**
 * @brief Wire format of a relay payload.
 *
 * A payload is the launch arguments joined by newlines, with no header and no
 * length prefix. The sender closes the connection to mark its end.
 */
class PayloadCodec {
public:
    static constexpr char kDelimiter = '\n';

    /**
     * @brief Joins arguments into a payload.
     *
     * Arguments containing a line break cannot be framed and are skipped with
     * a warning.
     *
     * @param args Launch arguments, excluding the program name.
     * @return The encoded payload.
     */
    static std::string encode(const std::vector<std::string>& args);

    /**
     * @brief Splits a payload into its non-empty argument strings.
     *
     * A carriage return ending a line is removed.
     *
     * @param payload Bytes received on one connection.
     * @return Arguments in payload order.
     */
    static std::vector<std::string> decode(std::string_view payload);
};

} // namespace linkrelay::infra
