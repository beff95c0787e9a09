#pragma once

// ---------------------------------------------------------------------------
// forward_outcome.hpp
//
// 백엔드 전달 결과 타입과 백엔드 추상 인터페이스.
//
// [설계 원칙]
// - 모든 실패 경로는 타입이 있는 값(ForwardOutcome 변형)으로 반환한다.
//   generate() 는 예외를 밖으로 던지지 않는다.
// - 부분 출력은 없다: 성공이 아니면 생성 텍스트를 반환하지 않는다.
// - 재시도는 이 레이어의 책임이 아니다. 실패는 한 번만 보고된다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

struct ForwardSuccess {
    std::string text{};  // 백엔드가 생성한 응답 텍스트
};

// 프로브 실패, 연결 실패, 타임아웃, deadline 만료
struct BackendUnreachable {
    std::string detail{};
};

// 2xx 가 아닌 HTTP 응답
struct BackendError {
    unsigned    status{0};
    std::string body{};
};

// 2xx 응답이지만 JSON 이 아니거나 "response" 문자열 필드가 없음.
// body 는 진단용 원문.
struct MalformedResponse {
    std::string body{};
};

using ForwardOutcome = std::variant<ForwardSuccess, BackendUnreachable, BackendError, MalformedResponse>;

// ---------------------------------------------------------------------------
// GenerationBackend
//   텍스트 생성 백엔드 추상 인터페이스.
//   운영 구현은 HttpBackend, 테스트는 호출을 기록하는 stub 을 주입한다.
//
//   [스레드 안전성]
//   구현체는 generate() 의 동시 호출을 허용해야 한다 (요청당 워커 1개).
// ---------------------------------------------------------------------------
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    // generate
    //   prompt  : 정책 검사를 통과한 프롬프트 원문 (변형 없이 전달)
    //   deadline: 호출자 deadline. 이 시각 이후에는 결과를 기다리지 않는다.
    //   예외를 던지지 않는다. 모든 실패는 ForwardOutcome 변형으로 반환한다.
    [[nodiscard]] virtual ForwardOutcome generate(
        std::string_view                      prompt,
        std::chrono::steady_clock::time_point deadline) = 0;

    // 요청에 사용하는 모델 식별자
    [[nodiscard]] virtual const std::string& model() const noexcept = 0;
};
