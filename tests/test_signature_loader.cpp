// ---------------------------------------------------------------------------
// test_signature_loader.cpp
//
// SignatureLoader 단위 테스트.
//
// [테스트 범위]
// - 정상 YAML / JSON 문서 로드
// - 키 누락 → 빈 목록, 빈 문서 → 빈 SignatureSet (성공)
// - 파일 없음 → kNotFound, 문법 오류 / map 아님 → kParseError
// - 잘못된 regex 는 제외하고 rejected_patterns 로 집계
// - 빈 문자열 / scalar 가 아닌 항목 무시
// - config/injection_patterns.yaml 실제 로딩
// ---------------------------------------------------------------------------

#include "signature/signature_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// Fixture: 임시 시그니처 파일
// ---------------------------------------------------------------------------
class SignatureLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "promptgate_test_signatures"
             / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path write_file(const std::string& name, const std::string& content) const {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

}  // namespace

// ===========================================================================
// 1. 문서 파싱 (parse)
// ===========================================================================

TEST(SignatureLoader, ParseYamlAllKeys) {
    const auto result = SignatureLoader::parse(R"(
direct_injection_keywords:
  - "ignore previous instructions"
  - "private key"
direct_injection_regex:
  - 'you\s+are\s+now'
indirect_injection_placeholders:
  - "summarize the following document"
)");

    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& set = *result;
    ASSERT_EQ(set.keyword_signatures.size(), 2u);
    EXPECT_EQ(set.keyword_signatures[0], "ignore previous instructions");
    EXPECT_EQ(set.keyword_signatures[1], "private key");
    ASSERT_EQ(set.regex_signatures.size(), 1u);
    EXPECT_EQ(set.regex_signatures[0], R"(you\s+are\s+now)");
    ASSERT_EQ(set.indirect_context_phrases.size(), 1u);
    EXPECT_EQ(set.rejected_patterns, 0u);
    EXPECT_EQ(set.total(), 4u);
}

TEST(SignatureLoader, ParseJsonDocument) {
    const auto result = SignatureLoader::parse(R"({
        "direct_injection_keywords": ["disregard everything"],
        "direct_injection_regex": ["/etc/passwd"],
        "indirect_injection_placeholders": []
    })");

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->keyword_signatures.size(), 1u);
    EXPECT_EQ(result->regex_signatures.size(), 1u);
    EXPECT_TRUE(result->indirect_context_phrases.empty());
}

TEST(SignatureLoader, MissingKeysYieldEmptyCollections) {
    const auto result = SignatureLoader::parse("direct_injection_keywords: [\"developer mode\"]\n");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->keyword_signatures.size(), 1u);
    EXPECT_TRUE(result->regex_signatures.empty());
    EXPECT_TRUE(result->indirect_context_phrases.empty());
}

TEST(SignatureLoader, EmptyDocumentIsEmptySet) {
    const auto result = SignatureLoader::parse("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(SignatureLoader, InvalidRegexRejectedOthersKept) {
    const auto result = SignatureLoader::parse(R"(
direct_injection_keywords: ["private key"]
direct_injection_regex:
  - '([unclosed'
  - 'you\s+are\s+now'
  - '*leading'
)");

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->regex_signatures.size(), 1u);
    EXPECT_EQ(result->regex_signatures[0], R"(you\s+are\s+now)");
    EXPECT_EQ(result->rejected_patterns, 2u);
    EXPECT_EQ(result->keyword_signatures.size(), 1u);
}

TEST(SignatureLoader, EmptyAndNonScalarEntriesSkipped) {
    const auto result = SignatureLoader::parse(R"(
direct_injection_keywords:
  - ""
  - "private key"
  - [nested, list]
  - {a: b}
)");

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->keyword_signatures.size(), 1u);
    EXPECT_EQ(result->keyword_signatures[0], "private key");
}

TEST(SignatureLoader, NonSequenceValueIgnored) {
    const auto result = SignatureLoader::parse(R"(
direct_injection_keywords: "not a list"
indirect_injection_placeholders: ["review the customer feedback"]
)");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->keyword_signatures.empty());
    EXPECT_EQ(result->indirect_context_phrases.size(), 1u);
}

TEST(SignatureLoader, TopLevelNotMap_ParseError) {
    const auto result = SignatureLoader::parse("- just\n- a\n- list\n");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SignatureLoadErrorCode::kParseError);
    EXPECT_FALSE(result.error().message.empty());
}

TEST(SignatureLoader, SyntaxError_ParseError) {
    const auto result = SignatureLoader::parse("direct_injection_keywords: [unterminated\n");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SignatureLoadErrorCode::kParseError);
}

// ===========================================================================
// 2. 파일 로드 (load)
// ===========================================================================

TEST(SignatureLoader, MissingFile_NotFound) {
    const auto result = SignatureLoader::load("/nonexistent/promptgate/patterns.yaml");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SignatureLoadErrorCode::kNotFound);
    EXPECT_STREQ(to_string(result.error().code), "NotFound");
}

TEST_F(SignatureLoaderFileTest, LoadYamlFile) {
    const auto path = write_file("patterns.yaml",
                                 "direct_injection_keywords: [\"ignore previous instructions\"]\n"
                                 "indirect_injection_placeholders: [\"analyze the provided email\"]\n");

    const auto result = SignatureLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->keyword_signatures.size(), 1u);
    EXPECT_EQ(result->indirect_context_phrases.size(), 1u);
}

TEST_F(SignatureLoaderFileTest, LoadJsonFile) {
    const auto path = write_file("injection_patterns.json",
                                 R"({"direct_injection_keywords": ["disregard everything"],
                                     "direct_injection_regex": ["you\\s+are\\s+now"]})");

    const auto result = SignatureLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->keyword_signatures.size(), 1u);
    ASSERT_EQ(result->regex_signatures.size(), 1u);
    EXPECT_EQ(result->regex_signatures[0], R"(you\s+are\s+now)");
}

TEST_F(SignatureLoaderFileTest, LoadMalformedFile_ParseError) {
    const auto path = write_file("broken.yaml", "direct_injection_keywords: [a, b\n  c: {\n");

    const auto result = SignatureLoader::load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SignatureLoadErrorCode::kParseError);
}

// ===========================================================================
// 3. config/injection_patterns.yaml 실제 로딩
// ===========================================================================

TEST(SignatureLoader, LoadShippedPatterns_Succeeds) {
    const fs::path path = fs::path(PROMPTGATE_CONFIG_DIR) / "injection_patterns.yaml";

    if (!fs::exists(path)) {
        GTEST_SKIP() << "config/injection_patterns.yaml not found, skipping test";
    }

    const auto result = SignatureLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_FALSE(result->keyword_signatures.empty());
    EXPECT_FALSE(result->regex_signatures.empty());
    EXPECT_FALSE(result->indirect_context_phrases.empty());
    EXPECT_EQ(result->rejected_patterns, 0u)
        << "every shipped regex must compile";
}
