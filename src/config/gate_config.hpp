#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// promptgate 프로세스 설정. 시작 시 한 번 생성하여 각 구성 요소에 값으로 전달한다.
// 전역 가변 설정은 두지 않는다.
//
//   backend               : 생성 백엔드 URL / 모델 / 타임아웃
//   policy                : 차단 정책 플래그
//   signature_path        : 시그니처 파일 경로 (YAML/JSON)
//   listen_address        : 게이트 HTTP 서버 바인딩 주소
//   listen_port           : 게이트 HTTP 서버 포트
//   worker_threads        : 요청 처리 워커 스레드 수
//   max_prompt_bytes      : 요청 본문 최대 크기
//   log_path              : 구조화 로그 파일 경로 (빈 값이면 stdout 만)
//   log_level             : "debug" | "info" | "warn" | "error"
// ---------------------------------------------------------------------------

#include "forwarder/http_backend.hpp"
#include "policy/rule.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct GateConfig {
    BackendConfig backend{};
    PolicyConfig  policy{};

    std::string   signature_path{"config/injection_patterns.yaml"};

    std::string   listen_address{"127.0.0.1"};
    std::uint16_t listen_port{8088};
    std::uint32_t worker_threads{4};
    std::uint32_t max_prompt_bytes{1024 * 1024};

    std::string   log_path{"/tmp/promptgate.log"};
    std::string   log_level{"info"};
};

// ---------------------------------------------------------------------------
// load_gate_config_from_env
//   환경변수를 읽어 GateConfig 를 만든다. 없거나 잘못된 값은 기본값 + 경고.
//
//   OLLAMA_API_URL, LOCAL_LLM_MODEL, BLOCK_ON_PROMPT_INJECTION,
//   BLOCK_ON_INDIRECT_RISK, SIGNATURE_PATH, PROBE_TIMEOUT_MS,
//   REQUEST_TIMEOUT_MS, GATE_LISTEN_ADDR, GATE_LISTEN_PORT, GATE_WORKERS,
//   MAX_PROMPT_BYTES, LOG_PATH, LOG_LEVEL
// ---------------------------------------------------------------------------
[[nodiscard]] GateConfig load_gate_config_from_env();

// ---------------------------------------------------------------------------
// parse_bool
//   "1/0", "true/false", "yes/no", "on/off" (대소문자 무관).
//   그 외는 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text);
