// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// 시그니처 기반 프롬프트 인젝션 탐지기 구현.
//
// [매칭 방식]
// - 키워드/문맥 문구: 생성 시 소문자로 변환해 두고, detect() 에서 프롬프트를
//   한 번 소문자로 변환한 뒤 std::string::find 로 검사한다.
// - 정규식: ECMAScript | icase 로 컴파일, std::regex_search 로 검사.
//   regex_search 는 과도한 백트래킹 시 std::regex_error(error_complexity /
//   error_stack) 를 던질 수 있다. 이 경우 해당 패턴만 건너뛴다.
// - libstdc++ regex 매처는 반복 문자 하나당 한 단계씩 재귀한다. 긴 입력을
//   그대로 넘기면 스레드 스택이 넘쳐 프로세스가 죽으므로, 프롬프트를
//   kRegexWindowBytes 크기의 창으로 나눠 검사한다 (창 사이 kRegexWindowOverlap
//   바이트 중첩). 중첩보다 긴 매칭이 창 경계에 걸치면 놓친다.
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 을 전방 선언만 하므로 소멸자/이동 연산은
// 이 파일에서 CompiledPattern 의 완전한 정의 이후에 default 로 정의한다.
// ---------------------------------------------------------------------------

#include "detector/injection_detector.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

struct InjectionDetector::CompiledPattern {
    std::string                 source_pattern;  // 원본 패턴 문자열 (매칭 보고용)
    std::shared_ptr<std::regex> compiled;        // 컴파일된 정규식
};

namespace {

// ---------------------------------------------------------------------------
// windowed_search
//   text 를 고정 크기 창으로 나눠 regex_search 한다.
//   첫 창 이후에는 match_prev_avail 로 앞 문자를 \b / ^ 판정에 사용하고,
//   마지막 창 이전에는 창 끝을 입력 끝으로 취급하지 않는다.
// ---------------------------------------------------------------------------
bool windowed_search(const std::string& text, const std::regex& re) {
    constexpr std::size_t kWindow = InjectionDetector::kRegexWindowBytes;
    constexpr std::size_t kStep   = kWindow - InjectionDetector::kRegexWindowOverlap;

    if (text.size() <= kWindow) {
        return std::regex_search(text, re);
    }

    for (std::size_t start = 0; start < text.size(); start += kStep) {
        const std::size_t end = std::min(text.size(), start + kWindow);

        auto flags = std::regex_constants::match_default;
        if (start > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }
        if (end < text.size()) {
            flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
        }

        const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
        const auto last  = text.begin() + static_cast<std::ptrdiff_t>(end);
        if (std::regex_search(first, last, re, flags)) {
            return true;
        }
        if (end == text.size()) {
            break;
        }
    }
    return false;
}

}  // namespace

std::string to_lower_ascii(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

// ---------------------------------------------------------------------------
// InjectionDetector 생성자
// ---------------------------------------------------------------------------
InjectionDetector::InjectionDetector(std::shared_ptr<const SignatureSet> signatures)
    : signatures_(std::move(signatures))
{
    if (!signatures_) {
        signatures_ = std::make_shared<SignatureSet>();
    }

    lowered_keywords_.reserve(signatures_->keyword_signatures.size());
    for (const auto& k : signatures_->keyword_signatures) {
        lowered_keywords_.push_back(to_lower_ascii(k));
    }

    lowered_contexts_.reserve(signatures_->indirect_context_phrases.size());
    for (const auto& c : signatures_->indirect_context_phrases) {
        lowered_contexts_.push_back(to_lower_ascii(c));
    }

    compiled_patterns_.reserve(signatures_->regex_signatures.size());
    for (const auto& p : signatures_->regex_signatures) {
        try {
            auto re = std::make_shared<std::regex>(
                p,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled_patterns_.push_back(CompiledPattern{p, std::move(re)});
        } catch (const std::regex_error& e) {
            // 잘못된 정규식은 로그 후 건너뜀 (해당 패턴의 false negative).
            // 나머지 키워드/패턴은 계속 적용한다.
            spdlog::warn(
                "injection_detector: invalid regex pattern '{}', skipping: {}",
                p, e.what()
            );
        }
    }

    if (signatures_->empty()) {
        spdlog::warn("injection_detector: signature set is empty: every prompt will pass");
    }
}

InjectionDetector::~InjectionDetector() = default;

InjectionDetector::InjectionDetector(InjectionDetector&&) noexcept            = default;
InjectionDetector& InjectionDetector::operator=(InjectionDetector&&) noexcept = default;

std::size_t InjectionDetector::active_regex_count() const noexcept {
    return compiled_patterns_.size();
}

// ---------------------------------------------------------------------------
// InjectionDetector::detect 구현
// ---------------------------------------------------------------------------
ClassificationResult InjectionDetector::detect(std::string_view prompt) const {
    ClassificationResult result{};

    if (prompt.empty() || signatures_->empty()) {
        return result;
    }

    const std::string lowered = to_lower_ascii(prompt);

    // 1. 직접 인젝션: 키워드
    for (std::size_t i = 0; i < lowered_keywords_.size(); ++i) {
        if (lowered.find(lowered_keywords_[i]) != std::string::npos) {
            const auto& keyword = signatures_->keyword_signatures[i];
            result.direct_injection_detected = true;
            result.direct_matches.push_back(SignatureMatch{MatchKind::kKeyword, keyword});
            spdlog::debug("injection_detector: direct injection keyword matched: '{}'", keyword);
        }
    }

    // 2. 직접 인젝션: 정규식 (원문에 대해 창 단위 icase search)
    const std::string prompt_str(prompt);
    for (const auto& cp : compiled_patterns_) {
        try {
            if (windowed_search(prompt_str, *cp.compiled)) {
                result.direct_injection_detected = true;
                result.direct_matches.push_back(SignatureMatch{MatchKind::kRegex, cp.source_pattern});
                spdlog::debug("injection_detector: direct injection regex matched: '{}'",
                              cp.source_pattern);
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("injection_detector: regex '{}' failed during search, skipping: {}",
                         cp.source_pattern, e.what());
        }
    }

    // 3. 간접 인젝션 위험 문맥: 직접 인젝션 결과와 독립적으로 검사
    for (std::size_t i = 0; i < lowered_contexts_.size(); ++i) {
        if (lowered.find(lowered_contexts_[i]) != std::string::npos) {
            const auto& phrase = signatures_->indirect_context_phrases[i];
            result.indirect_risk_detected = true;
            result.indirect_matches.push_back(phrase);
            spdlog::debug("injection_detector: indirect injection risk context matched: '{}'",
                          phrase);
        }
    }

    return result;
}

ClassificationResult detect(std::string_view prompt, const SignatureSet& signatures) {
    if (prompt.empty() || signatures.empty()) {
        return ClassificationResult{};
    }
    const InjectionDetector detector(std::make_shared<SignatureSet>(signatures));
    return detector.detect(prompt);
}
