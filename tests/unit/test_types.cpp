#include <gtest/gtest.h>
#include "geist/types.hpp"

using namespace geist;

// ============================================================================
// Message Tests
// ============================================================================

TEST(MessageTest, FactoryMethods) {
    auto sys = Message::system("System message");
    EXPECT_EQ(sys.role, Role::System);
    EXPECT_EQ(sys.content, "System message");

    auto user = Message::user("User message");
    EXPECT_EQ(user.role, Role::User);
    EXPECT_EQ(user.content, "User message");

    auto assistant = Message::assistant("Assistant message");
    EXPECT_EQ(assistant.role, Role::Assistant);
    EXPECT_EQ(assistant.content, "Assistant message");
}

TEST(MessageTest, Equality) {
    EXPECT_EQ(Message::user("Hello"), Message::user("Hello"));
    EXPECT_NE(Message::user("Hello"), Message::user("World"));
    EXPECT_NE(Message::user("Hello"), Message::assistant("Hello"));
}

TEST(RoleTest, RoundTripNames) {
    EXPECT_STREQ(role_to_string(Role::System), "system");
    EXPECT_STREQ(role_to_string(Role::User), "user");
    EXPECT_STREQ(role_to_string(Role::Assistant), "assistant");

    EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
    EXPECT_FALSE(role_from_string("tool").has_value());
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToStringWithoutContext) {
    Error error{ErrorCode::TaskQueueEmpty, "No task queued for execution"};
    EXPECT_EQ(error.to_string(), "[500] No task queued for execution");
}

TEST(ErrorTest, ToStringWithContext) {
    Error error{ErrorCode::ProviderServerError, "HTTP 503", "https://api.example.com"};
    EXPECT_EQ(error.to_string(), "[202] HTTP 503 | Context: https://api.example.com");
}

TEST(ErrorTest, CategoryFollowsCodeRange) {
    EXPECT_EQ(error_category(ErrorCode::InvalidConfig), ErrorCategory::Config);
    EXPECT_EQ(error_category(ErrorCode::ConfigFileUnreadable), ErrorCategory::Config);
    EXPECT_EQ(error_category(ErrorCode::FailoverExhausted), ErrorCategory::Transport);
    EXPECT_EQ(error_category(ErrorCode::FunctionCallRetriesExhausted), ErrorCategory::Protocol);
    EXPECT_EQ(error_category(ErrorCode::ActionNotFound), ErrorCategory::Dispatch);
    EXPECT_EQ(error_category(ErrorCode::TaskQueueEmpty), ErrorCategory::State);
    EXPECT_EQ(error_category(ErrorCode::SnapshotCorrupted), ErrorCategory::Persistence);
    EXPECT_EQ(error_category(ErrorCode::ModelLoadFailed), ErrorCategory::Backend);
    EXPECT_EQ(error_category(ErrorCode::Unknown), ErrorCategory::Unknown);

    Error error{ErrorCode::AgentNotRunning, "stopped"};
    EXPECT_EQ(error.category(), ErrorCategory::State);
    EXPECT_STREQ(category_to_string(error.category()), "state");
}

// ============================================================================
// GenerationSettings Tests
// ============================================================================

TEST(GenerationSettingsTest, DefaultsAreValid) {
    GenerationSettings settings;
    EXPECT_EQ(settings.max_tokens, 16);
    EXPECT_EQ(settings.n, 1);
    EXPECT_FLOAT_EQ(settings.temperature, 1.0f);
    EXPECT_FLOAT_EQ(settings.top_p, 1.0f);
    EXPECT_FALSE(settings.stop.has_value());
    EXPECT_TRUE(settings.validate().has_value());
}

TEST(GenerationSettingsTest, RejectsOutOfRangeValues) {
    GenerationSettings settings;
    settings.max_tokens = 0;
    auto result = settings.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidSettings);

    settings = GenerationSettings{};
    settings.n = 0;
    EXPECT_FALSE(settings.validate().has_value());

    settings = GenerationSettings{};
    settings.temperature = -0.1f;
    EXPECT_FALSE(settings.validate().has_value());

    settings = GenerationSettings{};
    settings.top_p = 0.0f;
    EXPECT_FALSE(settings.validate().has_value());

    settings.top_p = 1.5f;
    EXPECT_FALSE(settings.validate().has_value());
}

TEST(AgentSettingsTest, EmptyNameRejected) {
    AgentSettings settings;
    EXPECT_TRUE(settings.validate().has_value());

    settings.name.clear();
    auto result = settings.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidSettings);
}

// ============================================================================
// CompletionRequest / CompletionResult Tests
// ============================================================================

TEST(CompletionRequestTest, SystemMessagePrecedesUser) {
    CompletionRequest request;
    request.system_prompt = "be brief";
    request.user_prompt = "hello";

    auto messages = request.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], Message::system("be brief"));
    EXPECT_EQ(messages[1], Message::user("hello"));
}

TEST(CompletionRequestTest, EmptySystemPromptIsOmitted) {
    CompletionRequest request;
    request.system_prompt = "";
    request.user_prompt = "hello";

    auto messages = request.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].role, Role::User);
}

TEST(CompletionResultTest, ContentsKeepChoiceOrder) {
    CompletionResult result;
    result.choices = {Message::assistant("a"), Message::assistant("b")};

    EXPECT_EQ(result.contents(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(result.first_content(), "a");
}

TEST(CompletionResultTest, NoChoicesHasNoFirstContent) {
    CompletionResult result;
    EXPECT_TRUE(result.contents().empty());
    EXPECT_FALSE(result.first_content().has_value());
}
