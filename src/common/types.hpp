#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// RequestContext
//   프롬프트 요청 하나를 식별하는 불변 컨텍스트.
//   server/CLI 레이어가 생성하고 gate/logger 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct RequestContext {
    std::uint64_t request_id{0};            // 프로세스 범위 내 유일 요청 ID
    std::string   client_ip{};              // 요청 발신지 (CLI 실행 시 "local")
    std::chrono::system_clock::time_point received_at{};  // 요청 수신 시각
};

// ---------------------------------------------------------------------------
// truncate_for_log
//   로그에 기록할 프롬프트를 max_bytes 로 자른다.
//   프롬프트 원문 전체를 로그에 남기지 않기 위한 헬퍼.
// ---------------------------------------------------------------------------
inline std::string truncate_for_log(const std::string& text, std::size_t max_bytes = 200) {
    if (text.size() <= max_bytes) {
        return text;
    }
    return text.substr(0, max_bytes) + "...";
}
