#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ClassificationResult, ForwardOutcome 을 직접 include 하지 않는다.
//   호출자(gate 레이어)가 문자열로 변환해 채운다.
//
// [민감정보 취급 주의]
// - prompt 는 truncate_for_log() 로 잘린 프롬프트를 담는다. 원문 전체를
//   로그에 남기지 말 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// RequestLog
//   백엔드 전달에 성공한 요청 로그 (event = "prompt_forwarded").
// ---------------------------------------------------------------------------
struct RequestLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                prompt{};          // 잘린 프롬프트
    std::size_t                                response_bytes{0}; // 생성 텍스트 길이
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};       // 전체 처리 시간
};

// ---------------------------------------------------------------------------
// BlockLog
//   차단 이벤트 로그 (event = "prompt_blocked").
//   direct_matches: "keyword:<sig>" / "regex:<sig>" 형식
// ---------------------------------------------------------------------------
struct BlockLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                prompt{};
    std::vector<std::string>                   direct_matches{};
    std::vector<std::string>                   indirect_matches{};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// BackendFailureLog
//   허용되었으나 백엔드 호출이 실패한 요청 로그 (event = "backend_failure").
//   failure: "BackendUnreachable" | "BackendError" | "MalformedResponse"
//   status : BackendError 일 때만 HTTP 상태 코드, 그 외 0
// ---------------------------------------------------------------------------
struct BackendFailureLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                prompt{};
    std::string                                failure{};
    unsigned                                   status{0};
    std::string                                detail{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};
