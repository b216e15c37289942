#include "validator/diagnostic.hpp"
#include <gtest/gtest.h>

namespace {

using namespace validator;

class DiagnosticTest : public ::testing::Test {
protected:
    void SetUp() override {
        result.diagnostics.push_back(
            {Severity::Warning, "unknown-transform-type", "Transform type 'HASH' is not supported",
             parser::usml::SourceLocation{12, 7}});
        result.diagnostics.push_back(
            {Severity::Error, "field-schema-match", "Field 'slug' is not part of the API response schema"});
    }

    ValidationResult result;
};

TEST_F(DiagnosticTest, CountsBySeverity) {
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_count(), 1u);
    EXPECT_EQ(result.warning_count(), 1u);
    EXPECT_EQ(result.count("field-schema-match"), 1u);
    EXPECT_EQ(result.count("unknown-transform-type"), 0u);
    EXPECT_EQ(result.count("unknown-transform-type", Severity::Warning), 1u);
}

// Warnings alone keep the status ok
TEST_F(DiagnosticTest, WarningsDoNotFail) {
    result.diagnostics.pop_back();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.status(), "ok");
}

// Test the machine readable report
TEST_F(DiagnosticTest, SerializesToJson) {
    const auto json = to_json(result, "mappings/posts.usml.yaml");
    EXPECT_EQ(json["file"], "mappings/posts.usml.yaml");
    EXPECT_EQ(json["status"], "error");
    ASSERT_EQ(json["diagnostics"].size(), 2u);

    const auto& warning = json["diagnostics"][0];
    EXPECT_EQ(warning["severity"], "warning");
    EXPECT_EQ(warning["rule"], "unknown-transform-type");
    EXPECT_EQ(warning["line"], 12);
    EXPECT_EQ(warning["column"], 7);

    const auto& error = json["diagnostics"][1];
    EXPECT_EQ(error["severity"], "error");
    EXPECT_FALSE(error.contains("line"));

    // key order is part of the format
    EXPECT_EQ(json.begin().key(), "file");
    EXPECT_EQ(warning.begin().key(), "severity");
}

TEST(DiagnosticJsonTest, EmptyResultIsOk) {
    const auto json = to_json(ValidationResult{}, "a.yaml");
    EXPECT_EQ(json.dump(), R"({"file":"a.yaml","status":"ok","diagnostics":[]})");
}

} // namespace
