#include "infrastructure/ipc/PayloadCodec.hpp"

#include <spdlog/spdlog.h>

namespace linkrelay::infra {

std::string PayloadCodec::encode(const std::vector<std::string>& args) {
    std::string payload;
    bool first = true;

    for (const auto& arg : args) {
        if (arg.find_first_of("\r\n") != std::string::npos) {
            spdlog::warn("Skipping argument containing a line break: \"{}\"", arg);
            continue;
        }
        if (!first) {
            payload += kDelimiter;
        }
        payload += arg;
        first = false;
    }

    return payload;
}

std::vector<std::string> PayloadCodec::decode(std::string_view payload) {
    std::vector<std::string> args;

    size_t start = 0;
    while (start <= payload.size()) {
        auto end = payload.find(kDelimiter, start);
        if (end == std::string_view::npos) {
            end = payload.size();
        }

        auto line = payload.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            args.emplace_back(line);
        }

        start = end + 1;
    }

    return args;
}

} // namespace linkrelay::infra
