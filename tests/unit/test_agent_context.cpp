#include <gtest/gtest.h>
#include "geist/engine/agent_context.hpp"

using namespace geist;
using namespace geist::engine;

class AgentContextTest : public ::testing::Test {
protected:
    AgentContext context{AgentSettings{}, "session-1"};

    void fill() {
        context.replace_world({"w1", "w2"});
        context.replace_task({"t1"});
        context.replace_execution({"e1", "e2"});
    }
};

// ============================================================================
// CX-001: Aggregate labels appear in fixed order for every subset
// ============================================================================

TEST_F(AgentContextTest, AggregateAllBuffers) {
    fill();
    EXPECT_EQ(context.aggregate(true, true, true),
              "WORLD_CONTEXT:w1\nw2\nTASK_CONTEXT:t1\nEXECUTION_CONTEXT:e1\ne2");
}

TEST_F(AgentContextTest, AggregateOrderIndependentOfSubset) {
    fill();
    EXPECT_EQ(context.aggregate(false, true, true), "TASK_CONTEXT:t1\nEXECUTION_CONTEXT:e1\ne2");
    EXPECT_EQ(context.aggregate(true, false, true), "WORLD_CONTEXT:w1\nw2\nEXECUTION_CONTEXT:e1\ne2");
    EXPECT_EQ(context.aggregate(true, true, false), "WORLD_CONTEXT:w1\nw2\nTASK_CONTEXT:t1");
}

TEST_F(AgentContextTest, AggregateOmittedBufferHasNoLabel) {
    fill();
    const auto text = context.aggregate(false, true, false);
    EXPECT_EQ(text, "TASK_CONTEXT:t1");
    EXPECT_EQ(text.find("WORLD_CONTEXT:"), std::string::npos);
    EXPECT_EQ(text.find("EXECUTION_CONTEXT:"), std::string::npos);
}

TEST_F(AgentContextTest, AggregateNothingIsEmpty) {
    fill();
    EXPECT_EQ(context.aggregate(false, false, false), "");
}

TEST_F(AgentContextTest, AggregateEmptyBuffersKeepLabels) {
    EXPECT_EQ(context.aggregate(true, true, true), "WORLD_CONTEXT:\nTASK_CONTEXT:\nEXECUTION_CONTEXT:");
}

TEST_F(AgentContextTest, AggregateHasNoSideEffects) {
    fill();
    const auto before = context.snapshot();
    (void)context.aggregate(true, true, true);
    EXPECT_EQ(context.snapshot(), before);
}

// ============================================================================
// CX-002: Replacement is wholesale
// ============================================================================

TEST_F(AgentContextTest, ReplaceIsWholesale) {
    fill();
    context.replace_world({"only"});
    EXPECT_EQ(context.world_context(), (std::vector<std::string>{"only"}));
    EXPECT_EQ(context.task_context(), (std::vector<std::string>{"t1"}));
    EXPECT_EQ(context.execution_context(), (std::vector<std::string>{"e1", "e2"}));

    context.replace_execution({});
    EXPECT_TRUE(context.execution_context().empty());
}

// ============================================================================
// CX-003: pop_next_task consumes from the front
// ============================================================================

TEST_F(AgentContextTest, PopNextTaskFifo) {
    context.append_task("first");
    context.append_task("second");

    auto a = context.pop_next_task();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, "first");
    EXPECT_EQ(context.task_context(), (std::vector<std::string>{"second"}));

    auto b = context.pop_next_task();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, "second");
    EXPECT_TRUE(context.task_context().empty());
}

TEST_F(AgentContextTest, PopEmptyQueueIsStateError) {
    auto result = context.pop_next_task();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskQueueEmpty);
    EXPECT_EQ(result.error().category(), ErrorCategory::State);
}

// ============================================================================
// CX-004: Snapshot / restore
// ============================================================================

TEST_F(AgentContextTest, RestoreReplacesAllBuffers) {
    fill();
    ContextSnapshot snapshot{{"W"}, {"T1", "T2"}, {}};
    context.restore(snapshot);
    EXPECT_EQ(context.snapshot(), snapshot);
}

TEST_F(AgentContextTest, SettingsAndSession) {
    EXPECT_EQ(context.session_handle(), "session-1");
    EXPECT_FALSE(context.world_processing_enabled());

    AgentSettings settings;
    settings.include_world_processing = true;
    settings.generation.max_tokens = 64;
    context.set_settings(settings);

    EXPECT_TRUE(context.world_processing_enabled());
    EXPECT_EQ(context.settings().generation.max_tokens, 64);
}
