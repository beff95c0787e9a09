#include "config/gate_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

const char* env_raw(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return nullptr;
    }
    return val;
}

std::string env_str(const char* name, std::string default_val) {
    const char* val = env_raw(name);
    if (val != nullptr) {
        return val;
    }
    return default_val;
}

// 부호 없는 10진수 전체 일치 파싱. 실패 시 false.
bool parse_unsigned(std::string_view text, std::uint64_t& out) {
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::uint16_t env_u16(const char* name, std::uint16_t default_val) {
    const char* val = env_raw(name);
    if (val == nullptr) {
        return default_val;
    }
    std::uint64_t parsed = 0;
    if (!parse_unsigned(val, parsed)) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
    if (parsed < 1 || parsed > 65535) {
        spdlog::warn("env {}: value {} out of range, using default {}", name, parsed, default_val);
        return default_val;
    }
    return static_cast<std::uint16_t>(parsed);
}

std::uint32_t env_u32(const char* name, std::uint32_t default_val, std::uint32_t min_val = 0) {
    const char* val = env_raw(name);
    if (val == nullptr) {
        return default_val;
    }
    std::uint64_t parsed = 0;
    if (!parse_unsigned(val, parsed)) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
    if (parsed < min_val || parsed > UINT32_MAX) {
        spdlog::warn("env {}: value {} out of range, using default {}", name, parsed, default_val);
        return default_val;
    }
    return static_cast<std::uint32_t>(parsed);
}

bool env_bool(const char* name, bool default_val) {
    const char* val = env_raw(name);
    if (val == nullptr) {
        return default_val;
    }
    const auto parsed = parse_bool(val);
    if (!parsed) {
        spdlog::warn("env {}: invalid boolean '{}', using default {}", name, val, default_val);
        return default_val;
    }
    return *parsed;
}

} // namespace

std::optional<bool> parse_bool(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// load_gate_config_from_env
// ---------------------------------------------------------------------------
GateConfig load_gate_config_from_env() {
    GateConfig config;

    config.backend.url   = env_str("OLLAMA_API_URL",  config.backend.url);
    config.backend.model = env_str("LOCAL_LLM_MODEL", config.backend.model);
    config.backend.probe_timeout = std::chrono::milliseconds{
        env_u32("PROBE_TIMEOUT_MS",
                static_cast<std::uint32_t>(config.backend.probe_timeout.count()), 1)};
    config.backend.request_timeout = std::chrono::milliseconds{
        env_u32("REQUEST_TIMEOUT_MS",
                static_cast<std::uint32_t>(config.backend.request_timeout.count()), 1)};

    config.policy.block_on_injection =
        env_bool("BLOCK_ON_PROMPT_INJECTION", config.policy.block_on_injection);
    config.policy.block_on_indirect_risk =
        env_bool("BLOCK_ON_INDIRECT_RISK", config.policy.block_on_indirect_risk);

    config.signature_path   = env_str("SIGNATURE_PATH",   config.signature_path);
    config.listen_address   = env_str("GATE_LISTEN_ADDR", config.listen_address);
    config.listen_port      = env_u16("GATE_LISTEN_PORT", config.listen_port);
    config.worker_threads   = env_u32("GATE_WORKERS",     config.worker_threads, 1);
    config.max_prompt_bytes = env_u32("MAX_PROMPT_BYTES", config.max_prompt_bytes, 1);
    config.log_path         = env_str("LOG_PATH",         config.log_path);
    config.log_level        = env_str("LOG_LEVEL",        config.log_level);

    return config;
}
