#include <gtest/gtest.h>
#include "geist/engine/function_call_protocol.hpp"
#include "fixtures/sample_responses.hpp"

using namespace geist;
using namespace geist::engine;
using namespace geist::testing;

// ============================================================================
// FC-001: Well-formed calls parse
// ============================================================================

TEST(FunctionCallProtocolTest, ParsesWellFormedCall) {
    auto call = FunctionCallProtocol::parse(responses::CALL_RECORDER_ADD);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->capability_name, "Recorder");
    EXPECT_EQ(call->action_name, "add");
    EXPECT_EQ(call->parameters, (nlohmann::json{{"a", 2}, {"b", 3}}));
}

TEST(FunctionCallProtocolTest, NewlinesAreStrippedBeforeParsing) {
    EXPECT_TRUE(FunctionCallProtocol::is_valid(responses::CALL_MULTILINE));

    auto call = FunctionCallProtocol::parse(responses::CALL_MULTILINE);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->action_name, "write");
    EXPECT_EQ(call->parameters["text"], "hi");
}

TEST(FunctionCallProtocolTest, NormalizeRemovesLineBreaksOnly) {
    EXPECT_EQ(FunctionCallProtocol::normalize("a\nb\r\nc d"), "abc d");
}

TEST(FunctionCallProtocolTest, ExtraKeysAreTolerated) {
    auto call = FunctionCallProtocol::parse(responses::CALL_WITH_EXTRA_KEY);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->capability_name, "Recorder");
}

TEST(FunctionCallProtocolTest, EmptyParametersObjectIsValid) {
    EXPECT_TRUE(FunctionCallProtocol::is_valid(R"({"class": "LogAdapter", "function": "read_log", "parameters": {}})"));
}

TEST(FunctionCallProtocolTest, ToJsonUsesWireKeys) {
    auto call = FunctionCallProtocol::parse(responses::CALL_RECORDER_WRITE);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->to_json(), nlohmann::json::parse(responses::CALL_RECORDER_WRITE));
}

// ============================================================================
// FC-002: Everything else is invalid, never an exception
// ============================================================================

TEST(FunctionCallProtocolTest, InvalidPayloads) {
    const std::string invalid[] = {
        responses::PROSE_NOT_JSON,
        responses::TRUNCATED_JSON,
        responses::CALL_MISSING_PARAMETERS,
        responses::CALL_PARAMETERS_NOT_OBJECT,
        responses::CALL_CLASS_NOT_STRING,
        "[]",
        "42",
        "",
    };
    for (const auto& text : invalid) {
        EXPECT_FALSE(FunctionCallProtocol::is_valid(text)) << text;

        auto parsed = FunctionCallProtocol::parse(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidFunctionCall);
        EXPECT_EQ(parsed.error().category(), ErrorCategory::Protocol);
    }
}

TEST(FunctionCallProtocolTest, InvalidReportsPayloadAsContext) {
    auto parsed = FunctionCallProtocol::parse(responses::CALL_MISSING_PARAMETERS);
    ASSERT_FALSE(parsed.has_value());
    ASSERT_TRUE(parsed.error().context.has_value());
    EXPECT_EQ(*parsed.error().context, responses::CALL_MISSING_PARAMETERS);
    EXPECT_NE(parsed.error().message.find("parameters"), std::string::npos);
}

TEST(FunctionCallProtocolTest, PredicateAgreesWithParse) {
    for (const auto& text : {responses::CALL_LOG_HAIKU, responses::PROSE_NOT_JSON,
                             responses::CALL_PARAMETERS_NOT_OBJECT}) {
        EXPECT_EQ(FunctionCallProtocol::is_valid(text), FunctionCallProtocol::parse(text).has_value());
    }
}
