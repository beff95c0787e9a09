#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// 분류 결과(ClassificationResult)를 받아 허용/차단 판정을 내리는 엔진.
//
// [판정 규칙]
//   BLOCK ⇔ block_on_injection
//           ∧ (direct_injection_detected
//              ∨ (indirect_risk_detected ∧ block_on_indirect_risk))
//   그 외 ALLOW.
//
// [결정성]
// decide() 는 입력(분류 결과 + 생성 시 주입된 PolicyConfig)만으로 판정한다.
// 숨은 상태가 없으므로 같은 입력에는 항상 같은 PolicyDecision 을 반환한다.
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → detector/injection_detector.hpp (단방향)
// policy_engine.hpp → rule.hpp                         (단방향)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>

#include "detector/injection_detector.hpp"  // ClassificationResult
#include "rule.hpp"                         // PolicyConfig

// ---------------------------------------------------------------------------
// PolicyAction
//   정책 평가 결과 액션.
// ---------------------------------------------------------------------------
enum class PolicyAction : std::uint8_t {
    kAllow = 0,  // 백엔드로 전달
    kBlock = 1,  // 차단 (백엔드 호출 없음)
};

[[nodiscard]] inline const char* to_string(PolicyAction action) noexcept {
    return action == PolicyAction::kBlock ? "BLOCK" : "ALLOW";
}

// ---------------------------------------------------------------------------
// PolicyDecision
//   정책 평가 결과. 한 요청 처리 동안만 존재한다.
//   classification: 판정 근거가 된 분류 결과 (차단 응답/감사 로그용)
//   reason        : 사람이 읽을 수 있는 판정 이유
// ---------------------------------------------------------------------------
struct PolicyDecision {
    PolicyAction         action{PolicyAction::kAllow};
    ClassificationResult classification{};
    std::string          reason{};

    [[nodiscard]] bool blocked() const noexcept { return action == PolicyAction::kBlock; }

    bool operator==(const PolicyDecision&) const = default;
};

// ---------------------------------------------------------------------------
// PolicyEngine
//   PolicyConfig 를 기반으로 프롬프트 허용/차단을 판정한다.
//
//   [스레드 안전성]
//   - decide: 읽기 전용. concurrent 호출 안전.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    explicit PolicyEngine(PolicyConfig config) noexcept;

    [[nodiscard]] PolicyDecision decide(const ClassificationResult& result) const;

    [[nodiscard]] const PolicyConfig& config() const noexcept { return config_; }

private:
    PolicyConfig config_;
};
