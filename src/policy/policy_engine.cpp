// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 분류 결과를 받아 허용/차단 판정을 내리는 엔진.
//
// [오탐/미탐 트레이드오프]
// - 기본 정책은 간접 위험 문맥만으로도 차단한다 (보수적). 정상적인 요약/분석
//   요청의 false positive 가 많으면 block_on_indirect_risk 를 끈다.
// - block_on_injection = false 는 탐지만 기록하고 모두 전달하는 관찰 모드다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <spdlog/spdlog.h>

PolicyEngine::PolicyEngine(PolicyConfig config) noexcept
    : config_{config}
{}

PolicyDecision PolicyEngine::decide(const ClassificationResult& result) const {
    PolicyDecision decision{};
    decision.classification = result;

    if (!result.any_detected()) {
        decision.action = PolicyAction::kAllow;
        decision.reason = "no signature matched";
        return decision;
    }

    if (!config_.block_on_injection) {
        // 관찰 모드: 탐지는 되었으나 정책상 허용
        spdlog::debug("policy_engine: signatures matched but blocking is disabled");
        decision.action = PolicyAction::kAllow;
        decision.reason = "blocking disabled by policy";
        return decision;
    }

    if (result.direct_injection_detected) {
        decision.action = PolicyAction::kBlock;
        decision.reason = "direct injection signature matched";
        return decision;
    }

    // 여기부터는 간접 위험 문맥만 매칭된 경우
    if (config_.block_on_indirect_risk) {
        decision.action = PolicyAction::kBlock;
        decision.reason = "indirect injection risk context matched";
        return decision;
    }

    decision.action = PolicyAction::kAllow;
    decision.reason = "indirect risk allowed by policy";
    return decision;
}
