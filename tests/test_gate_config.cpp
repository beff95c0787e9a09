// ---------------------------------------------------------------------------
// test_gate_config.cpp
//
// load_gate_config_from_env / parse_bool 단위 테스트.
//
// 환경변수를 직접 조작하므로 각 테스트는 사용한 변수를 TearDown 에서 지운다.
// ---------------------------------------------------------------------------

#include "config/gate_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace {

const std::vector<const char*> kGateEnvVars = {
    "OLLAMA_API_URL", "LOCAL_LLM_MODEL", "BLOCK_ON_PROMPT_INJECTION", "BLOCK_ON_INDIRECT_RISK",
    "SIGNATURE_PATH", "PROBE_TIMEOUT_MS", "REQUEST_TIMEOUT_MS", "GATE_LISTEN_ADDR",
    "GATE_LISTEN_PORT", "GATE_WORKERS", "MAX_PROMPT_BYTES", "LOG_PATH", "LOG_LEVEL",
};

class GateConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void set(const char* name, const char* value) {
        ::setenv(name, value, 1);  // NOLINT(concurrency-mt-unsafe)
    }

private:
    static void clear() {
        for (const auto* name : kGateEnvVars) {
            ::unsetenv(name);  // NOLINT(concurrency-mt-unsafe)
        }
    }
};

}  // namespace

TEST_F(GateConfigEnvTest, DefaultsWhenUnset) {
    const auto cfg = load_gate_config_from_env();

    EXPECT_EQ(cfg.backend.url, "http://localhost:11434/api/generate");
    EXPECT_EQ(cfg.backend.model, "llama3");
    EXPECT_EQ(cfg.backend.probe_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.backend.request_timeout, std::chrono::milliseconds(60000));
    EXPECT_TRUE(cfg.policy.block_on_injection);
    EXPECT_TRUE(cfg.policy.block_on_indirect_risk);
    EXPECT_EQ(cfg.signature_path, "config/injection_patterns.yaml");
    EXPECT_EQ(cfg.listen_address, "127.0.0.1");
    EXPECT_EQ(cfg.listen_port, 8088);
    EXPECT_EQ(cfg.worker_threads, 4u);
    EXPECT_EQ(cfg.max_prompt_bytes, 1024u * 1024u);
    EXPECT_EQ(cfg.log_path, "/tmp/promptgate.log");
    EXPECT_EQ(cfg.log_level, "info");
}

TEST_F(GateConfigEnvTest, OverridesFromEnvironment) {
    set("OLLAMA_API_URL", "http://10.0.0.5:8000/api/generate");
    set("LOCAL_LLM_MODEL", "mistral");
    set("BLOCK_ON_PROMPT_INJECTION", "false");
    set("BLOCK_ON_INDIRECT_RISK", "off");
    set("SIGNATURE_PATH", "/etc/promptgate/patterns.json");
    set("PROBE_TIMEOUT_MS", "250");
    set("REQUEST_TIMEOUT_MS", "5000");
    set("GATE_LISTEN_ADDR", "0.0.0.0");
    set("GATE_LISTEN_PORT", "9000");
    set("GATE_WORKERS", "16");
    set("MAX_PROMPT_BYTES", "4096");
    set("LOG_PATH", "/var/log/promptgate.log");
    set("LOG_LEVEL", "debug");

    const auto cfg = load_gate_config_from_env();

    EXPECT_EQ(cfg.backend.url, "http://10.0.0.5:8000/api/generate");
    EXPECT_EQ(cfg.backend.model, "mistral");
    EXPECT_FALSE(cfg.policy.block_on_injection);
    EXPECT_FALSE(cfg.policy.block_on_indirect_risk);
    EXPECT_EQ(cfg.signature_path, "/etc/promptgate/patterns.json");
    EXPECT_EQ(cfg.backend.probe_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.backend.request_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.listen_address, "0.0.0.0");
    EXPECT_EQ(cfg.listen_port, 9000);
    EXPECT_EQ(cfg.worker_threads, 16u);
    EXPECT_EQ(cfg.max_prompt_bytes, 4096u);
    EXPECT_EQ(cfg.log_path, "/var/log/promptgate.log");
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(GateConfigEnvTest, InvalidNumbersFallBackToDefaults) {
    set("GATE_LISTEN_PORT", "70000");
    set("GATE_WORKERS", "0");
    set("PROBE_TIMEOUT_MS", "-5");
    set("MAX_PROMPT_BYTES", "12abc");

    const auto cfg = load_gate_config_from_env();

    EXPECT_EQ(cfg.listen_port, 8088);
    EXPECT_EQ(cfg.worker_threads, 4u);
    EXPECT_EQ(cfg.backend.probe_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.max_prompt_bytes, 1024u * 1024u);
}

TEST_F(GateConfigEnvTest, InvalidBooleanFallsBackToDefault) {
    set("BLOCK_ON_PROMPT_INJECTION", "maybe");

    const auto cfg = load_gate_config_from_env();
    EXPECT_TRUE(cfg.policy.block_on_injection);
}

TEST_F(GateConfigEnvTest, EmptyValueTreatedAsUnset) {
    set("LOCAL_LLM_MODEL", "");

    const auto cfg = load_gate_config_from_env();
    EXPECT_EQ(cfg.backend.model, "llama3");
}

TEST(ParseBool, AcceptedSpellings) {
    for (const char* s : {"1", "true", "TRUE", "yes", "Yes", "on", "ON"}) {
        EXPECT_EQ(parse_bool(s), std::optional<bool>{true}) << s;
    }
    for (const char* s : {"0", "false", "False", "no", "NO", "off", "Off"}) {
        EXPECT_EQ(parse_bool(s), std::optional<bool>{false}) << s;
    }
}

TEST(ParseBool, RejectsOtherValues) {
    EXPECT_FALSE(parse_bool("").has_value());
    EXPECT_FALSE(parse_bool("2").has_value());
    EXPECT_FALSE(parse_bool("enable").has_value());
    EXPECT_FALSE(parse_bool(" true").has_value());
}
