#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 차단 정책 설정 구조체 정의 (헤더만, 구현 없음).
// 환경변수(BLOCK_ON_PROMPT_INJECTION, BLOCK_ON_INDIRECT_RISK)에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 기본값은 차단 활성 (보수적 정책).
// - 시작 시 한 번 생성되어 PolicyEngine 에 값으로 전달된다. 전역 상태 없음.
// ---------------------------------------------------------------------------

// ---------------------------------------------------------------------------
// PolicyConfig
//   block_on_injection     : false 이면 탐지 결과와 무관하게 모두 허용 (관찰 모드)
//   block_on_indirect_risk : false 이면 간접 인젝션 위험 문맥만 매칭된 프롬프트는
//                            허용한다. 직접 인젝션은 여전히 차단.
//
//   [오탐 주의]
//   간접 위험 문맥("summarize the following document" 등)은 공격의 "주제"일 뿐
//   실제 삽입된 명령이 아니다. block_on_indirect_risk = true 는 정상적인
//   요약/분석 요청에서 false positive 를 유발할 수 있다.
// ---------------------------------------------------------------------------
struct PolicyConfig {
    bool block_on_injection{true};
    bool block_on_indirect_risk{true};
};
