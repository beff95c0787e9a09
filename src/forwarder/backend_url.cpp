#include "forwarder/backend_url.hpp"

#include <charconv>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

std::string BackendEndpoint::host_header() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    const std::string h = ipv6 ? "[" + host + "]" : host;
    if (port == 80) {
        return h;
    }
    return h + ":" + std::to_string(port);
}

std::expected<BackendEndpoint, std::string> parse_backend_url(std::string_view url) {
    constexpr std::string_view kScheme = "http://";

    if (url.substr(0, kScheme.size()) != kScheme) {
        return std::unexpected(fmt::format("unsupported backend url '{}' (only http:// is supported)", url));
    }
    std::string_view rest = url.substr(kScheme.size());

    // authority / path 분리
    const auto slash_pos = rest.find('/');
    std::string_view authority = rest.substr(0, slash_pos);
    std::string_view path      = (slash_pos == std::string_view::npos) ? std::string_view{} : rest.substr(slash_pos);

    if (authority.empty()) {
        return std::unexpected(fmt::format("backend url '{}' has no host", url));
    }

    BackendEndpoint ep{};
    std::string_view port_str{};

    if (authority.front() == '[') {
        // IPv6 리터럴: [addr]:port
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(fmt::format("backend url '{}' has unterminated IPv6 literal", url));
        }
        ep.host = std::string(authority.substr(1, close - 1));
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(fmt::format("backend url '{}' has garbage after IPv6 literal", url));
            }
            port_str = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        ep.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_str = authority.substr(colon + 1);
        }
    }

    if (ep.host.empty()) {
        return std::unexpected(fmt::format("backend url '{}' has no host", url));
    }

    if (!port_str.empty()) {
        unsigned value{0};
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535) {
            return std::unexpected(fmt::format("backend url '{}' has invalid port '{}'", url, port_str));
        }
        ep.port = static_cast<std::uint16_t>(value);
    }

    if (!path.empty() && path != "/") {
        ep.target = std::string(path);
    }

    return ep;
}
