#include <gtest/gtest.h>
#include "geist/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace geist;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

json minimal_doc() {
    return json{
        {"gateway", {{"primary", {{"base_url", "https://api.openai.com/v1"}, {"model", "gpt-4o"}}}}}
    };
}

void expect_invalid_key(const Expected<RuntimeConfig>& config, const std::string& key) {
    ASSERT_FALSE(config.has_value()) << "expected failure on " << key;
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    ASSERT_TRUE(config.error().context.has_value());
    EXPECT_EQ(*config.error().context, key);
    EXPECT_NE(config.error().message.find("'" + key + "'"), std::string::npos) << config.error().message;
}

} // namespace

// ============================================================================
// CF-001: Defaults and full documents
// ============================================================================

TEST(RuntimeConfigTest, MinimalDocumentUsesDefaults) {
    auto config = parse_runtime_config(minimal_doc());
    ASSERT_TRUE(config.has_value()) << config.error().to_string();

    EXPECT_EQ(config->agent.name, "geist");
    EXPECT_FALSE(config->agent.include_world_processing);
    EXPECT_EQ(config->agent.generation.max_tokens, GenerationSettings{}.max_tokens);
    ASSERT_TRUE(config->gateway.has_value());
    EXPECT_EQ(config->gateway->max_retries, 3);
    EXPECT_EQ(config->gateway->max_failover_depth, 1);
    EXPECT_TRUE(config->gateway->backups.empty());
    EXPECT_FALSE(config->local_model.has_value());
    EXPECT_EQ(config->capabilities, RuntimeConfig::default_capabilities());
    EXPECT_TRUE(config->database_path.empty());
    EXPECT_EQ(config->session, "default");
    EXPECT_EQ(config->log_level, "info");
    EXPECT_FALSE(config->system_prompt.has_value());
}

TEST(RuntimeConfigTest, FullDocumentParses) {
    json doc = {
        {"agent", {
            {"name", "scribe"},
            {"description", "writes things"},
            {"include_world_processing", true},
            {"generation", {{"max_tokens", 256}, {"n", 2}, {"temperature", 0.5},
                            {"top_p", 0.9}, {"stop", "END"}}}
        }},
        {"gateway", {
            {"primary", {{"base_url", "https://api.openai.com/v1"}, {"model", "gpt-4o"}, {"api_key", "sk-1"}}},
            {"backups", json::array({json{{"base_url", "https://api.groq.com/openai/v1"}, {"model", "llama3"},
                                          {"api_key_env", "GROQ_API_KEY"}}})},
            {"max_retries", 5},
            {"request_timeout_ms", 1500},
            {"retry_backoff_ms", 0},
            {"max_failover_depth", 1}
        }},
        {"capabilities", {{"LogAdapter", {{"filename", "agent.log"}}}}},
        {"database_path", "geist.db"},
        {"session", "scribe-1"},
        {"log_level", "debug"},
        {"system_prompt", "Be brief."}
    };

    auto config = parse_runtime_config(doc);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();

    EXPECT_EQ(config->agent.name, "scribe");
    EXPECT_TRUE(config->agent.include_world_processing);
    EXPECT_EQ(config->agent.generation.max_tokens, 256);
    EXPECT_EQ(config->agent.generation.n, 2);
    EXPECT_FLOAT_EQ(config->agent.generation.temperature, 0.5f);
    ASSERT_TRUE(config->agent.generation.stop.has_value());
    EXPECT_EQ(*config->agent.generation.stop, "END");

    const auto& gw = *config->gateway;
    EXPECT_EQ(gw.primary.api_key, "sk-1");
    ASSERT_EQ(gw.backups.size(), 1u);
    EXPECT_EQ(gw.backups[0].model, "llama3");
    EXPECT_EQ(gw.backups[0].api_key_env, "GROQ_API_KEY");
    EXPECT_TRUE(gw.backups[0].api_key.empty());
    EXPECT_EQ(gw.max_retries, 5);
    EXPECT_EQ(gw.request_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(gw.retry_backoff, std::chrono::milliseconds(0));

    EXPECT_EQ(config->capabilities, (json{{"LogAdapter", {{"filename", "agent.log"}}}}));
    EXPECT_EQ(config->database_path, "geist.db");
    EXPECT_EQ(config->session, "scribe-1");
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->system_prompt, std::optional<std::string>("Be brief."));
}

TEST(RuntimeConfigTest, LocalModelAloneIsEnough) {
    json doc = {{"local_model", {{"model_path", "/models/tiny.gguf"}, {"context_size", 2048}, {"n_gpu_layers", 8}}}};

    auto config = parse_runtime_config(doc);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_FALSE(config->gateway.has_value());
    ASSERT_TRUE(config->local_model.has_value());
    EXPECT_EQ(config->local_model->model_path, "/models/tiny.gguf");
    EXPECT_EQ(config->local_model->context_size, 2048);
    EXPECT_EQ(config->local_model->n_gpu_layers, 8);
    EXPECT_TRUE(config->local_model->use_mmap);
}

// ============================================================================
// CF-002: Backups inherit from the primary
// ============================================================================

TEST(RuntimeConfigTest, BackupInheritsEndpointAndCredentials) {
    json doc = minimal_doc();
    doc["gateway"]["primary"]["api_key"] = "sk-primary";
    doc["gateway"]["backups"] = json::array({json{{"model", "gpt-4o-mini"}}});

    auto config = parse_runtime_config(doc);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();

    const auto& backup = config->gateway->backups.at(0);
    EXPECT_EQ(backup.base_url, "https://api.openai.com/v1");
    EXPECT_EQ(backup.model, "gpt-4o-mini");
    EXPECT_EQ(backup.api_key, "sk-primary");
    EXPECT_EQ(backup.api_key_env, "OPENAI_API_KEY");
}

TEST(RuntimeConfigTest, BackupWithOwnEnvKeepsIt) {
    json doc = minimal_doc();
    doc["gateway"]["primary"]["api_key"] = "sk-primary";
    doc["gateway"]["backups"] = json::array({json{{"base_url", "https://api.x.ai/v1"}, {"api_key_env", "XAI"}}});

    auto config = parse_runtime_config(doc);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();

    const auto& backup = config->gateway->backups.at(0);
    EXPECT_EQ(backup.model, "gpt-4o");
    EXPECT_TRUE(backup.api_key.empty());
    EXPECT_EQ(backup.api_key_env, "XAI");
}

// ============================================================================
// CF-003: Errors name the offending key
// ============================================================================

TEST(RuntimeConfigTest, GatewayOrLocalModelRequired) {
    expect_invalid_key(parse_runtime_config(json::object()), "gateway");
}

TEST(RuntimeConfigTest, PrimaryRequired) {
    expect_invalid_key(parse_runtime_config(json{{"gateway", json::object()}}), "gateway.primary");
}

TEST(RuntimeConfigTest, PrimaryModelRequired) {
    json doc = minimal_doc();
    doc["gateway"]["primary"].erase("model");
    expect_invalid_key(parse_runtime_config(doc), "gateway.primary.model");
}

TEST(RuntimeConfigTest, LocalModelPathRequired) {
    expect_invalid_key(parse_runtime_config(json{{"local_model", json::object()}}), "local_model.model_path");
}

TEST(RuntimeConfigTest, WrongTypesNameTheKey) {
    json doc = minimal_doc();
    doc["agent"] = {{"generation", {{"max_tokens", "lots"}}}};
    expect_invalid_key(parse_runtime_config(doc), "agent.generation.max_tokens");

    doc = minimal_doc();
    doc["agent"] = {{"include_world_processing", "yes"}};
    expect_invalid_key(parse_runtime_config(doc), "agent.include_world_processing");

    doc = minimal_doc();
    doc["gateway"]["max_retries"] = 2.5;
    expect_invalid_key(parse_runtime_config(doc), "gateway.max_retries");

    doc = minimal_doc();
    doc["gateway"]["backups"] = json::array({json{{"model", 4}}});
    expect_invalid_key(parse_runtime_config(doc), "gateway.backups[0].model");

    doc = minimal_doc();
    doc["gateway"]["backups"] = json::object();
    expect_invalid_key(parse_runtime_config(doc), "gateway.backups");

    doc = minimal_doc();
    doc["capabilities"] = json::array();
    expect_invalid_key(parse_runtime_config(doc), "capabilities");

    doc = minimal_doc();
    doc["session"] = 12;
    expect_invalid_key(parse_runtime_config(doc), "session");
}

TEST(RuntimeConfigTest, SemanticChecks) {
    json doc = minimal_doc();
    doc["log_level"] = "loud";
    expect_invalid_key(parse_runtime_config(doc), "log_level");

    doc = minimal_doc();
    doc["session"] = "";
    expect_invalid_key(parse_runtime_config(doc), "session");

    doc = minimal_doc();
    doc["gateway"]["max_retries"] = 0;
    auto config = parse_runtime_config(doc);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);

    doc = minimal_doc();
    doc["gateway"]["primary"]["base_url"] = "ftp://example.com";
    config = parse_runtime_config(doc);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidProvider);
}

TEST(RuntimeConfigTest, NonObjectDocumentRejected) {
    auto config = parse_runtime_config(json::array());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(RuntimeConfigTest, KnownLogLevels) {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        EXPECT_TRUE(is_known_log_level(level)) << level;
    }
    EXPECT_FALSE(is_known_log_level("verbose"));
    EXPECT_FALSE(is_known_log_level(""));
}

// ============================================================================
// CF-004: Loading from disk
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("geist_config_" + std::to_string(now) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    fs::path path;
};

TEST_F(ConfigFileTest, LoadsFileWithComments) {
    write(R"({
        // remote provider
        "gateway": {"primary": {"base_url": "https://api.openai.com/v1", "model": "gpt-4o"}},
        "session": "from-file" /* trailing */
    })");

    auto config = load_runtime_config(path.string());
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_EQ(config->session, "from-file");
}

TEST_F(ConfigFileTest, MissingFileIsUnreadable) {
    auto config = load_runtime_config((path.string() + ".missing"));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigFileUnreadable);
    EXPECT_EQ(config.error().category(), ErrorCategory::Config);
}

TEST_F(ConfigFileTest, MalformedJsonIsUnreadable) {
    write("{\"gateway\": ");
    auto config = load_runtime_config(path.string());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigFileUnreadable);
}

TEST_F(ConfigFileTest, ValidationErrorsPassThrough) {
    write("{}");
    auto config = load_runtime_config(path.string());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}
