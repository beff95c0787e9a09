#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 시그니처 기반 프롬프트 인젝션 탐지기.
// 독립적 모듈: signature_set.hpp 외의 프로젝트 헤더에 의존하지 않는다.
//
// [탐지 단계]
// 1. 직접 인젝션: 키워드: 대소문자 무관 부분 문자열 검사
// 2. 직접 인젝션: 정규식: 대소문자 무관 search (ECMAScript)
// 3. 간접 인젝션 위험: 문맥 문구: 대소문자 무관 부분 문자열 검사
//    (외부 문서 내용 자체는 분석하지 않는다. 취약한 "주제"만 표시)
//
// 모든 단계를 끝까지 수행하며 첫 매칭에서 중단하지 않는다.
// 같은 부분 문자열에 키워드와 정규식이 동시에 매칭되면 각각 기록한다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 대소문자 외 정규화 없음: 유니코드 변형, 공백 삽입, 동형 문자 우회 가능.
// 2. 인코딩 우회: base64, 번역, 철자 분할 등은 탐지 불가.
// 3. 대소문자 변환은 ASCII 기준 (바이트 단위 tolower).
// 4. 정규식은 kRegexWindowBytes 창 단위로 검사한다. kRegexWindowOverlap 보다
//    긴 매칭이 창 경계에 걸치면 놓친다 (키워드/문맥 문구는 전체 검사).
//
// [보안 원칙]
// - 빈 프롬프트 또는 빈 SignatureSet → 모든 플래그 false (vacuous safe default).
// - 판정은 PolicyEngine 의 몫. 이 모듈은 분류만 수행한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "signature/signature_set.hpp"

// ---------------------------------------------------------------------------
// MatchKind / SignatureMatch
//   직접 인젝션 매칭 하나를 기술한다. text 는 매칭된 시그니처 원문이다.
// ---------------------------------------------------------------------------
enum class MatchKind : std::uint8_t {
    kKeyword = 0,
    kRegex   = 1,
};

struct SignatureMatch {
    MatchKind   kind{MatchKind::kKeyword};
    std::string text{};

    bool operator==(const SignatureMatch&) const = default;
};

[[nodiscard]] inline const char* to_string(MatchKind kind) noexcept {
    return kind == MatchKind::kRegex ? "regex" : "keyword";
}

// ---------------------------------------------------------------------------
// ClassificationResult
//   요청마다 새로 생성되는 불변 분류 결과.
//   matched 시그니처는 로깅/차단 응답 목적으로 사용한다.
// ---------------------------------------------------------------------------
struct ClassificationResult {
    bool                        direct_injection_detected{false};
    std::vector<SignatureMatch> direct_matches{};
    bool                        indirect_risk_detected{false};
    std::vector<std::string>    indirect_matches{};

    [[nodiscard]] bool any_detected() const noexcept {
        return direct_injection_detected || indirect_risk_detected;
    }

    bool operator==(const ClassificationResult&) const = default;
};

// ---------------------------------------------------------------------------
// InjectionDetector
//   생성 시 SignatureSet 을 받아 정규식을 컴파일하고, detect() 에서 매칭.
//
//   [성능 고려사항]
//   - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - O((K + P + C) * N). 입력 길이 제한은 호출자(server 레이어)가 적용한다.
//
//   [스레드 안전성]
//   - detect() 는 const 이며 내부 상태를 변경하지 않는다. 동시 호출 안전.
// ---------------------------------------------------------------------------
class InjectionDetector {
public:
    // 정규식 한 번에 넘기는 최대 입력 크기와 창 사이 중첩
    static constexpr std::size_t kRegexWindowBytes   = 4096;
    static constexpr std::size_t kRegexWindowOverlap = 512;

    // signatures 가 nullptr 이면 빈 SignatureSet 으로 취급한다.
    // 컴파일에 실패한 regex 패턴은 경고 로그 후 건너뛴다.
    explicit InjectionDetector(std::shared_ptr<const SignatureSet> signatures);

    ~InjectionDetector();

    // 복사 금지 (컴파일된 regex 재사용 비용 방지), 이동 허용
    InjectionDetector(const InjectionDetector&)            = delete;
    InjectionDetector& operator=(const InjectionDetector&) = delete;
    InjectionDetector(InjectionDetector&&) noexcept;
    InjectionDetector& operator=(InjectionDetector&&) noexcept;

    // detect
    //   prompt: 클라이언트가 보낸 프롬프트 원문
    //   반환: ClassificationResult (모든 매칭 포함)
    [[nodiscard]] ClassificationResult detect(std::string_view prompt) const;

    [[nodiscard]] const SignatureSet& signatures() const noexcept { return *signatures_; }

    // 실제 사용 가능한(컴파일 성공) regex 수
    [[nodiscard]] std::size_t active_regex_count() const noexcept;

private:
    struct CompiledPattern;

    std::shared_ptr<const SignatureSet> signatures_;
    std::vector<std::string>            lowered_keywords_;
    std::vector<std::string>            lowered_contexts_;
    std::vector<CompiledPattern>        compiled_patterns_;
};

// ---------------------------------------------------------------------------
// detect
//   일회성 탐지 (InjectionDetector 를 생성하여 한 번 사용).
//   반복 호출 경로에서는 InjectionDetector 인스턴스를 재사용할 것.
// ---------------------------------------------------------------------------
[[nodiscard]] ClassificationResult detect(std::string_view prompt, const SignatureSet& signatures);

// ---------------------------------------------------------------------------
// to_lower_ascii
//   바이트 단위 ASCII 소문자 변환. 탐지기의 유일한 정규화 단계.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string to_lower_ascii(std::string_view text);
