#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
// 판정 파이프라인과 분리된 관찰 채널: 로깅 실패가 판정 결과를 바꾸지 않는다.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - spdlog 레지스트리에 등록하지 않는다 (인스턴스 여러 개 공존 가능).
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   RequestLog / BlockLog / BackendFailureLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. 빈 경로면 stdout 에만 기록한다.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_request(const RequestLog& entry);
    void log_block(const BlockLog& entry);
    void log_backend_failure(const BackendFailureLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept;
};

// ---------------------------------------------------------------------------
// parse_log_level
//   "debug" | "info" | "warn" | "error" → LogLevel. 그 외는 kInfo.
// ---------------------------------------------------------------------------
[[nodiscard]] LogLevel parse_log_level(std::string_view level_str);

// LogLevel → spdlog 레벨. 기본 logger 와 StructuredLogger 가 같은 변환을 쓴다.
[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level);
