#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "session/output_extractor.hpp"

namespace {

using agentbox::core::errors::ErrorCategory;
using agentbox::core::errors::get_error;
using agentbox::core::errors::get_value;
using agentbox::core::errors::is_error;
using agentbox::session::extract_json_object;
using agentbox::session::read_cost;
using agentbox::session::read_metadata;
using agentbox::session::read_result_text;
using agentbox::session::read_session_id;
using nlohmann::json;

const char* kNestedObject =
    "{\n"
    "  \"session_id\": \"abc-123\",\n"
    "  \"result\": \"line one\\nline two\",\n"
    "  \"a\": {\n"
    "    \"b\": {\n"
    "      \"c\": {\n"
    "        \"d\": {\n"
    "          \"e\": {\"f\": [1, 2, 3]}\n"
    "        }\n"
    "      }\n"
    "    }\n"
    "  }\n"
    "}";

TEST(OutputExtractorTest, ExtractsObjectBetweenShellNoise) {
    const std::string noisy = std::string("Welcome to zsh!\nLast login: Mon\n") +
                              kNestedObject + "\n[oh-my-zsh] updated\nbye\n";

    auto result = extract_json_object(noisy);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json::parse(kNestedObject));
    EXPECT_EQ(get_value(result)["a"]["b"]["c"]["d"]["e"]["f"][2], 3);
}

TEST(OutputExtractorTest, SingleLineObject) {
    auto result = extract_json_object("noise\n   {\"session_id\": \"s\", \"result\": \"ok\"}\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["result"], "ok");
}

TEST(OutputExtractorTest, NoBraceLineIsNoStructuredOutput) {
    auto result = extract_json_object("just text\nthat mentions { mid-line\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "no_structured_output");
}

TEST(OutputExtractorTest, EmptyOutputIsNoStructuredOutput) {
    auto result = extract_json_object("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "no_structured_output");
}

TEST(OutputExtractorTest, MalformedObjectIsInvalidJson) {
    auto result = extract_json_object("{\"session_id\": oops}\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "invalid_json");
}

TEST(OutputExtractorTest, UnterminatedObjectIsInvalidJson) {
    auto result = extract_json_object("{\n  \"session_id\": \"x\",\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_json");
}

TEST(OutputExtractorTest, SessionIdFallbackKeys) {
    EXPECT_EQ(read_session_id(json{{"session_id", "a"}, {"sid", "c"}}).value(), "a");
    EXPECT_EQ(read_session_id(json{{"sessionId", "b"}}).value(), "b");
    EXPECT_EQ(read_session_id(json{{"sid", "c"}}).value(), "c");
    EXPECT_FALSE(read_session_id(json{{"result", "x"}}).has_value());
}

TEST(OutputExtractorTest, ResultTextFallsBackToWholeObject) {
    EXPECT_EQ(read_result_text(json{{"result", "r"}, {"message", "m"}}), "r");
    EXPECT_EQ(read_result_text(json{{"result", ""}, {"response", "resp"}}), "resp");
    EXPECT_EQ(read_result_text(json{{"text", "t"}}), "t");

    const json bare = {{"session_id", "s"}};
    EXPECT_EQ(read_result_text(bare), bare.dump(2));
}

TEST(OutputExtractorTest, CostAndMetadata) {
    const json payload = {{"total_cost_usd", 0.42},
                          {"model", "m1"},
                          {"num_turns", 3},
                          {"unrelated", true}};
    ASSERT_TRUE(read_cost(payload).has_value());
    EXPECT_DOUBLE_EQ(read_cost(payload).value(), 0.42);

    const json metadata = read_metadata(payload);
    EXPECT_EQ(metadata["model"], "m1");
    EXPECT_EQ(metadata["num_turns"], 3);
    EXPECT_FALSE(metadata.contains("unrelated"));

    EXPECT_EQ(read_metadata(json{{"meta", {{"k", 1}}}}), (json{{"k", 1}}));
    EXPECT_FALSE(read_cost(json{{"total_cost_usd", "free"}}).has_value());
}

}  // namespace
