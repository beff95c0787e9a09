#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// BackendEndpoint
//   백엔드 URL 을 분해한 결과.
//   예: "http://localhost:11434/api/generate"
//       → host="localhost", port=11434, target="/api/generate"
// ---------------------------------------------------------------------------
struct BackendEndpoint {
    std::string   host{};
    std::uint16_t port{80};
    std::string   target{"/api/generate"};

    // Host 헤더 값 ("host" 또는 "host:port")
    [[nodiscard]] std::string host_header() const;
};

// ---------------------------------------------------------------------------
// parse_backend_url
//   "http://host[:port][/path]" 형식만 지원한다 (TLS 미지원).
//   IPv6 리터럴은 "[::1]:11434" 형식.
//   경로가 없으면 "/api/generate" 를 사용한다.
//   실패 시 std::unexpected(error_message).
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<BackendEndpoint, std::string> parse_backend_url(std::string_view url);
