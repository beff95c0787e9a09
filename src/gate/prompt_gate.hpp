#pragma once

// ---------------------------------------------------------------------------
// prompt_gate.hpp
//
// 요청 처리 오케스트레이터.
//   Received → Classified → Decided → {Blocked | Forwarded} → Reported
//
// [구성 요소 소유권]
// - SignatureSet      : shared_ptr<const> (불변, 요청 간 공유)
// - InjectionDetector : 값 소유 (생성 시 regex 컴파일 1회)
// - PolicyEngine      : 값 소유
// - GenerationBackend : shared_ptr (테스트에서 stub 주입)
// - StructuredLogger / StatsCollector : shared_ptr, nullptr 허용 (관찰 채널 비활성)
//
// [관찰 채널 분리]
// 로그/통계는 판정과 분리된 부수 효과다. handle() 의 반환값만으로
// 판정 결과를 검증할 수 있어야 한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "detector/injection_detector.hpp"
#include "forwarder/forward_outcome.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_engine.hpp"
#include "signature/signature_set.hpp"
#include "stats/stats_collector.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// OutcomeKind
//   요청 하나의 최종 결과 분류.
// ---------------------------------------------------------------------------
enum class OutcomeKind : std::uint8_t {
    kBlocked            = 0,
    kSuccess            = 1,
    kBackendUnreachable = 2,
    kBackendError       = 3,
    kMalformedResponse  = 4,
};

[[nodiscard]] const char* to_string(OutcomeKind kind) noexcept;

// ---------------------------------------------------------------------------
// RequestOutcome
//   handle() 의 반환값. 차단이면 forward 는 비어 있다.
// ---------------------------------------------------------------------------
struct RequestOutcome {
    OutcomeKind                   kind{OutcomeKind::kBlocked};
    PolicyDecision                decision{};
    std::optional<ForwardOutcome> forward{};
    std::uint64_t                 request_id{0};
    std::chrono::microseconds     elapsed{0};

    [[nodiscard]] bool blocked() const noexcept { return kind == OutcomeKind::kBlocked; }

    // 성공 시 생성 텍스트, 그 외에는 nullptr
    [[nodiscard]] const std::string* response_text() const noexcept;
};

// ---------------------------------------------------------------------------
// PromptGate
//
//   [스레드 안전성]
//   handle() 은 const 구성 요소만 읽는다. request_id 발급은 atomic.
//   GenerationBackend 구현체가 동시 호출을 허용하면 handle() 도 동시 호출 안전.
// ---------------------------------------------------------------------------
class PromptGate {
public:
    PromptGate(std::shared_ptr<const SignatureSet>  signatures,
               PolicyConfig                         policy,
               std::shared_ptr<GenerationBackend>   backend,
               std::shared_ptr<StructuredLogger>    logger = nullptr,
               std::shared_ptr<StatsCollector>      stats  = nullptr);

    PromptGate(const PromptGate&)            = delete;
    PromptGate& operator=(const PromptGate&) = delete;

    // handle
    //   prompt  : 클라이언트 프롬프트 원문
    //   deadline: 백엔드 호출 deadline
    //   context : 요청 식별 정보. request_id 가 0 이면 내부에서 발급한다.
    [[nodiscard]] RequestOutcome handle(std::string_view                      prompt,
                                        std::chrono::steady_clock::time_point deadline,
                                        RequestContext                        context = {});

    [[nodiscard]] const SignatureSet&  signatures() const noexcept { return *signatures_; }
    [[nodiscard]] const PolicyEngine&  policy() const noexcept { return policy_engine_; }
    [[nodiscard]] const std::string&   model() const noexcept { return backend_->model(); }

private:
    std::shared_ptr<const SignatureSet> signatures_;
    InjectionDetector                   detector_;
    PolicyEngine                        policy_engine_;
    std::shared_ptr<GenerationBackend>  backend_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<StatsCollector>     stats_;
    std::atomic<std::uint64_t>          next_request_id_{1};

    void report_block(const RequestContext& context, std::string_view prompt,
                      const PolicyDecision& decision);
    void report_forward(const RequestContext& context, std::string_view prompt,
                        const RequestOutcome& outcome);
};

// ---------------------------------------------------------------------------
// describe
//   사람이 읽는 상태 블록. CLI 출력용.
//     STATUS: BLOCKED_PROMPT_INJECTION / STATUS: SUCCESS / ERROR: ...
// ---------------------------------------------------------------------------
[[nodiscard]] std::string describe(const RequestOutcome& outcome);

// ForwardOutcome 변형 이름 ("ForwardSuccess", "BackendUnreachable", ...)
[[nodiscard]] const char* outcome_name(const ForwardOutcome& outcome) noexcept;
