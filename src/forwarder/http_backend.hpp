#pragma once

// ---------------------------------------------------------------------------
// http_backend.hpp
//
// Ollama 스타일 /api/generate 엔드포인트로 프롬프트를 전달하는 백엔드.
//
// [요청 흐름]
// 1. 프로브: GET / (probe_timeout). 어떤 HTTP 응답이든 받으면 살아 있음.
//    실패 시 본 요청 없이 BackendUnreachable.
// 2. 본 요청: POST <target> {"model":..,"prompt":..,"stream":false}
//    (request_timeout, 호출자 deadline 을 넘지 않음)
// 3. 2xx 아님 → BackendError{status, body}
// 4. JSON 아님 / "response" 문자열 없음 → MalformedResponse{body}
// 5. 성공 → ForwardSuccess{response}
//
// [타임아웃]
// 각 호출은 전용 io_context 위에서 코루틴으로 실행되며 run_until(deadline) 으로
// 상한이 보장된다. DNS 해석처럼 tcp_stream 만료가 적용되지 않는 단계도 포함.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <exception>
#include <string>
#include <string_view>

#include "forwarder/backend_url.hpp"
#include "forwarder/forward_outcome.hpp"

// ---------------------------------------------------------------------------
// BackendConfig
//   url            : 생성 엔드포인트 전체 URL
//   model          : 요청 본문의 "model" 값
//   probe_timeout  : 연결 확인(GET /) 타임아웃
//   request_timeout: 생성 요청 타임아웃 (생성은 느리므로 더 길게)
// ---------------------------------------------------------------------------
struct BackendConfig {
    std::string               url{"http://localhost:11434/api/generate"};
    std::string               model{"llama3"};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::milliseconds request_timeout{60000};
};

// ---------------------------------------------------------------------------
// HttpExchange
//   HTTP 요청/응답 한 번의 결과 (상태 코드 + 본문).
// ---------------------------------------------------------------------------
struct HttpExchange {
    unsigned    status{0};
    std::string body{};
};

// ---------------------------------------------------------------------------
// HttpBackend
//   상태 없음: 매 호출마다 새 연결을 연다. generate() 동시 호출 안전.
// ---------------------------------------------------------------------------
class HttpBackend final : public GenerationBackend {
public:
    explicit HttpBackend(BackendConfig config);

    HttpBackend(const HttpBackend&)            = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    [[nodiscard]] ForwardOutcome generate(
        std::string_view                      prompt,
        std::chrono::steady_clock::time_point deadline) override;

    [[nodiscard]] const std::string& model() const noexcept override { return config_.model; }

    // probe
    //   백엔드 호스트 연결 확인. 성공 시 빈 값, 실패 시 오류 메시지.
    [[nodiscard]] std::expected<void, std::string> probe(
        std::chrono::steady_clock::time_point deadline) const;

    [[nodiscard]] const BackendConfig& config() const noexcept { return config_; }

private:
    BackendConfig                                config_;
    std::expected<BackendEndpoint, std::string>  endpoint_;
};

// ---------------------------------------------------------------------------
// interpret_generate_response
//   HTTP 응답을 ForwardOutcome 으로 변환한다 (단계 3~5).
//   네트워크와 무관한 순수 함수이므로 단독 테스트 가능.
// ---------------------------------------------------------------------------
[[nodiscard]] ForwardOutcome interpret_generate_response(const HttpExchange& exchange);

// ---------------------------------------------------------------------------
// describe_exchange_failure
//   교환 코루틴이 예외로 끝났을 때의 진단 메시지.
//   std::exception 이 아닌 예외는 "unknown exchange error".
// ---------------------------------------------------------------------------
[[nodiscard]] std::string describe_exchange_failure(std::exception_ptr eptr);

// ---------------------------------------------------------------------------
// build_generate_body
//   {"model":..,"prompt":..,"stream":false} JSON 본문을 만든다.
//   잘못된 UTF-8 바이트는 U+FFFD 로 치환된다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string build_generate_body(std::string_view model, std::string_view prompt);
