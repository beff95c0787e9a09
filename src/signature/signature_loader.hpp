#pragma once

// ---------------------------------------------------------------------------
// signature_loader.hpp
//
// YAML(또는 JSON) 시그니처 파일을 로드하여 SignatureSet 으로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(SignatureLoadError) 반환.
//   호출자는 빈 SignatureSet 으로 계속 동작한다 (프로세스 중단 금지).
// - 개별 regex 패턴 오류는 로드 실패가 아니다: 해당 패턴만 제외하고
//   경고 로그를 출력한다. 나머지 시그니처는 정상 로드된다.
// - JSON 문서는 YAML 파서로 그대로 읽는다 (JSON ⊂ YAML 1.2).
//
// [순환 의존성]
// signature_loader.hpp → signature_set.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "signature_set.hpp"

// ---------------------------------------------------------------------------
// SignatureLoader
//   정적 로드 전용. 시그니처는 프로세스 수명 동안 한 번만 로드된다.
// ---------------------------------------------------------------------------
class SignatureLoader {
public:
    // load
    //   지정된 경로의 파일을 읽어 SignatureSet 으로 파싱한다.
    //
    //   성공: SignatureSet (일부 regex 가 제외되었을 수 있음: rejected_patterns 참조)
    //   실패: kNotFound  : 경로 없음 / 열기 실패
    //         kParseError: 문법 오류, 최상위가 map 이 아님
    //         kUnexpected: 그 외 예외
    [[nodiscard]] static std::expected<SignatureSet, SignatureLoadError>
    load(const std::filesystem::path& path);

    // parse
    //   문서 문자열을 직접 파싱한다. load() 의 파일 읽기 이후 단계와 동일.
    //   source_name 은 로그 메시지에만 사용된다.
    [[nodiscard]] static std::expected<SignatureSet, SignatureLoadError>
    parse(std::string_view document, std::string_view source_name = "<memory>");
};
