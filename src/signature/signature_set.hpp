#pragma once

// ---------------------------------------------------------------------------
// signature_set.hpp
//
// 탐지 시그니처 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/injection_patterns.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 로드 이후 불변. 요청 간 공유는 std::shared_ptr<const SignatureSet> 으로만 한다.
//   읽기 전용이므로 동시 요청에서 락 없이 읽을 수 있다.
// - 빈 SignatureSet 은 유효한 상태다: 탐지기는 "아무것도 매칭되지 않음"으로
//   동작한다 (fail-open). 로드 실패 시 프로세스를 중단하지 않기 위함.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SignatureSet
//   keyword_signatures      : 대소문자 무관 부분 문자열 시그니처 (직접 인젝션)
//   regex_signatures        : 정규식 시그니처 (직접 인젝션). 로드 시 검증을
//                             통과한 패턴만 남는다.
//   indirect_context_phrases: 간접 인젝션에 취약한 문맥 문구
//                             (예: "summarize the following document")
//
//   [YAML 키 매핑]
//   direct_injection_keywords       → keyword_signatures
//   direct_injection_regex          → regex_signatures
//   indirect_injection_placeholders → indirect_context_phrases
// ---------------------------------------------------------------------------
struct SignatureSet {
    std::vector<std::string> keyword_signatures{};
    std::vector<std::string> regex_signatures{};
    std::vector<std::string> indirect_context_phrases{};

    // 로드 시 컴파일에 실패하여 제외된 regex 패턴 수 (진단용)
    std::size_t              rejected_patterns{0};

    [[nodiscard]] bool empty() const noexcept {
        return keyword_signatures.empty()
            && regex_signatures.empty()
            && indirect_context_phrases.empty();
    }

    [[nodiscard]] std::size_t total() const noexcept {
        return keyword_signatures.size()
             + regex_signatures.size()
             + indirect_context_phrases.size();
    }
};

// ---------------------------------------------------------------------------
// SignatureLoadErrorCode
//   시그니처 로드 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class SignatureLoadErrorCode : std::uint8_t {
    kNotFound   = 0,  // 파일 없음 / 열 수 없음
    kParseError = 1,  // YAML/JSON 문법 오류 또는 최상위가 map 이 아님
    kUnexpected = 2,  // 그 외 예상치 못한 오류
};

// ---------------------------------------------------------------------------
// SignatureLoadError
//   std::expected<SignatureSet, SignatureLoadError> 패턴과 함께 사용한다.
//   호출자는 실패 시 빈 SignatureSet 으로 계속 동작해야 한다.
// ---------------------------------------------------------------------------
struct SignatureLoadError {
    SignatureLoadErrorCode code{SignatureLoadErrorCode::kUnexpected};
    std::string            message{};  // 사람이 읽을 수 있는 오류 설명
};

[[nodiscard]] inline const char* to_string(SignatureLoadErrorCode code) noexcept {
    switch (code) {
        case SignatureLoadErrorCode::kNotFound:   return "NotFound";
        case SignatureLoadErrorCode::kParseError: return "ParseError";
        case SignatureLoadErrorCode::kUnexpected: return "Unexpected";
        default:                                  return "Unexpected";
    }
}
