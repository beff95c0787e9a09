// ---------------------------------------------------------------------------
// signature_loader.cpp
//
// 시그니처 파일을 로드하여 SignatureSet 구조체로 파싱한다.
//
// [설계 원칙]
// - 파일 없음 / 문법 오류는 SignatureLoadError 로 반환한다. 예외를 밖으로
//   던지지 않는다.
// - 키 누락 시 빈 목록을 적용한다. 세 목록이 모두 비어 있어도 로드 성공
//   (탐지기는 아무것도 매칭하지 않음).
// - 시그니처 문자열 자체는 로그에 출력하되, 파일 전체를 출력하지 않는다.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 regex 패턴은 제외된다 (해당 패턴의 false negative).
//   로드 시점에 경고를 출력하여 운영자에게 알린다.
// - 빈 문자열 키워드/문구는 모든 프롬프트와 매칭되므로 로드 시 제외한다.
// ---------------------------------------------------------------------------

#include "signature/signature_loader.hpp"

#include <exception>
#include <regex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없으면 빈 벡터. sequence 가 아니거나 scalar 가 아닌 항목은 경고 후 건너뛴다.
// 빈 문자열 항목은 건너뛴다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node,
                                                            std::string_view  key) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        spdlog::warn("signature_loader: '{}' is not a sequence, ignoring", key);
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            spdlog::warn("signature_loader: non-scalar entry in '{}' skipped", key);
            continue;
        }
        auto value = item.as<std::string>();
        if (value.empty()) {
            spdlog::warn("signature_loader: empty entry in '{}' skipped", key);
            continue;
        }
        result.push_back(std::move(value));
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: regex 패턴을 하나씩 컴파일해 보고 유효한 것만 남긴다.
// 컴파일 옵션은 InjectionDetector 와 동일 (ECMAScript | icase).
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> keep_valid_patterns(std::vector<std::string> patterns,
                                                           std::size_t&             rejected) {
    std::vector<std::string> valid;
    valid.reserve(patterns.size());
    for (auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
            valid.push_back(std::move(p));
        } catch (const std::regex_error& e) {
            ++rejected;
            spdlog::warn(
                "signature_loader: direct_injection_regex '{}' is invalid and will be skipped "
                "(false negative risk): {}",
                p, e.what()
            );
        }
    }
    return valid;
}

[[nodiscard]] std::unexpected<SignatureLoadError>
fail(SignatureLoadErrorCode code, std::string message) {
    spdlog::error("{}", message);
    return std::unexpected(SignatureLoadError{code, std::move(message)});
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 파싱된 루트 노드를 SignatureSet 으로 변환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<SignatureSet, SignatureLoadError>
build_signature_set(const YAML::Node& root, std::string_view source_name) {
    if (!root || root.IsNull()) {
        // 빈 문서: 시그니처 없음으로 취급 (로드 성공, 탐지 비활성)
        spdlog::warn("signature_loader: '{}' is empty: no signatures loaded", source_name);
        return SignatureSet{};
    }
    if (!root.IsMap()) {
        return fail(SignatureLoadErrorCode::kParseError,
                    fmt::format("signature_loader: '{}' is not a valid map (top-level)",
                                source_name));
    }

    SignatureSet set{};
    try {
        set.keyword_signatures =
            read_string_sequence(root["direct_injection_keywords"], "direct_injection_keywords");
        set.regex_signatures = keep_valid_patterns(
            read_string_sequence(root["direct_injection_regex"], "direct_injection_regex"),
            set.rejected_patterns);
        set.indirect_context_phrases = read_string_sequence(
            root["indirect_injection_placeholders"], "indirect_injection_placeholders");
    } catch (const YAML::Exception& e) {
        return fail(SignatureLoadErrorCode::kParseError,
                    fmt::format("signature_loader: error reading '{}': {}", source_name, e.what()));
    }

    spdlog::info(
        "signature_loader: signatures loaded from '{}': keywords={}, regex={} (rejected={}), "
        "indirect_contexts={}",
        source_name,
        set.keyword_signatures.size(),
        set.regex_signatures.size(),
        set.rejected_patterns,
        set.indirect_context_phrases.size()
    );

    return set;
}

}  // namespace

// ---------------------------------------------------------------------------
// SignatureLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<SignatureSet, SignatureLoadError>
SignatureLoader::load(const std::filesystem::path& path) {
    // 1. 경로 정규화 (존재하지 않으면 kNotFound)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        return fail(SignatureLoadErrorCode::kNotFound,
                    fmt::format("signature_loader: cannot resolve signature path '{}': {}",
                                path.string(), ec.message()));
    }

    spdlog::info("signature_loader: loading signatures from '{}'", canonical_path.string());

    // 2. 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(SignatureLoadErrorCode::kNotFound,
                    fmt::format("signature_loader: cannot open file '{}': {}",
                                canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(SignatureLoadErrorCode::kParseError,
                    fmt::format("signature_loader: parse error in '{}' at line {}, col {}: {}",
                                canonical_path.string(),
                                e.mark.line + 1,   // yaml-cpp는 0-based
                                e.mark.column + 1,
                                e.what()));
    } catch (const YAML::Exception& e) {
        return fail(SignatureLoadErrorCode::kUnexpected,
                    fmt::format("signature_loader: YAML error in '{}': {}",
                                canonical_path.string(), e.what()));
    } catch (const std::exception& e) {
        return fail(SignatureLoadErrorCode::kUnexpected,
                    fmt::format("signature_loader: unexpected error loading '{}': {}",
                                canonical_path.string(), e.what()));
    }

    return build_signature_set(root, canonical_path.string());
}

// ---------------------------------------------------------------------------
// SignatureLoader::parse 구현
// ---------------------------------------------------------------------------
std::expected<SignatureSet, SignatureLoadError>
SignatureLoader::parse(std::string_view document, std::string_view source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return fail(SignatureLoadErrorCode::kParseError,
                    fmt::format("signature_loader: parse error in '{}' at line {}, col {}: {}",
                                source_name, e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(SignatureLoadErrorCode::kUnexpected,
                    fmt::format("signature_loader: YAML error in '{}': {}", source_name, e.what()));
    }

    return build_signature_set(root, source_name);
}
