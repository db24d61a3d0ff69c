#include "core/types/Url.hpp"

#include <algorithm>
#include <cctype>

namespace linkrelay::core {

namespace {

bool isAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// Characters that RFC 3986 never allows unencoded in a URL.
bool isForbidden(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (uc <= 0x20 || uc == 0x7F) {
        return true;
    }
    switch (c) {
    case '"':
    case '<':
    case '>':
    case '\\':
    case '^':
    case '`':
    case '{':
    case '|':
    case '}':
        return true;
    default:
        return false;
    }
}

bool hasValidPercentEncoding(std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            continue;
        }
        if (i + 2 >= text.size() || !isHexDigit(text[i + 1]) || !isHexDigit(text[i + 2])) {
            return false;
        }
        i += 2;
    }
    return true;
}

std::optional<size_t> parseSchemeEnd(std::string_view text) {
    if (text.empty() || !isAlpha(text.front())) {
        return std::nullopt;
    }
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == ':') {
            return i;
        }
        if (!isAlpha(c) && !isDigit(c) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool parseAuthority(std::string_view authority, Url& url) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        url.userInfo = std::string(authority.substr(0, at));
        if (url.userInfo.find_first_of("[]") != std::string::npos) {
            return false;
        }
        authority.remove_prefix(at + 1);
    }

    std::string_view portText;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        auto literal = authority.substr(1, close - 1);
        if (literal.empty() || !std::all_of(literal.begin(), literal.end(), [](char c) {
                return isHexDigit(c) || c == ':' || c == '.';
            })) {
            return false;
        }
        url.host = std::string(authority.substr(0, close + 1));
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return false;
            }
            portText = rest.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            portText = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
        }
        if (authority.find_first_of("[]@") != std::string_view::npos) {
            return false;
        }
        url.host = std::string(authority);
    }

    if (!portText.empty()) {
        if (portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(), [](char c) { return isDigit(c); })) {
            return false;
        }
        auto value = std::stoul(std::string(portText));
        if (value > 65535) {
            return false;
        }
        url.port = static_cast<uint16_t>(value);
    }
    return true;
}

} // namespace

std::optional<Url> Url::parse(std::string_view text) {
    if (text.empty() || std::any_of(text.begin(), text.end(), isForbidden)) {
        return std::nullopt;
    }
    if (!hasValidPercentEncoding(text)) {
        return std::nullopt;
    }

    auto schemeEnd = parseSchemeEnd(text);
    if (!schemeEnd) {
        return std::nullopt;
    }

    Url url;
    url.text = std::string(text);
    url.scheme = std::string(text.substr(0, *schemeEnd));
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto rest = text.substr(*schemeEnd + 1);
    if (rest.empty()) {
        return std::nullopt;
    }

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        auto fragment = rest.substr(hash + 1);
        if (fragment.find('#') != std::string_view::npos) {
            return std::nullopt;
        }
        url.fragment = std::string(fragment);
        rest = rest.substr(0, hash);
    }

    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        url.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
        url.hasAuthority = true;
        rest.remove_prefix(2);
        auto pathStart = rest.find('/');
        auto authority = rest.substr(0, pathStart);
        if (!parseAuthority(authority, url)) {
            return std::nullopt;
        }
        rest = pathStart == std::string_view::npos ? std::string_view{} : rest.substr(pathStart);
    } else if (rest.find_first_of("[]") != std::string_view::npos) {
        return std::nullopt;
    }

    url.path = std::string(rest);

    // A bare "scheme:?" or "scheme:#" carries nothing to route on.
    if (!url.hasAuthority && url.path.empty()) {
        return std::nullopt;
    }

    return url;
}

} // namespace linkrelay::core
