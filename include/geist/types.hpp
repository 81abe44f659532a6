#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <tl/expected.hpp>

namespace geist {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in a completion exchange
 */
enum class Role {
    System,     ///< Instructions that frame the whole exchange
    User,       ///< Prompt text produced by the tick engine
    Assistant   ///< Model-generated choice
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> role_from_string(const std::string& role) {
    if (role == "system") return Role::System;
    if (role == "user") return Role::User;
    if (role == "assistant") return Role::Assistant;
    return std::nullopt;
}

/**
 * @brief Single (role, content) pair exchanged with a completion provider
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;            ///< Message role (system/user/assistant)
    std::string content;  ///< Text content of the message

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Transport errors (provider unreachable, non-2xx, bad body)
 * - 300-399: Protocol errors (malformed function-call text)
 * - 400-499: Dispatch errors (unknown capability/action, action failure)
 * - 500-599: State errors (nothing to do, lifecycle misuse)
 * - 600-699: Persistence errors
 * - 700-799: Local backend errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidProvider = 101,
    InvalidSettings = 102,
    ConfigFileUnreadable = 103,

    // Transport errors (200-299)
    TransportFailed = 200,
    ProviderRequestFailed = 201,
    ProviderServerError = 202,
    FailoverExhausted = 203,
    MalformedProviderResponse = 204,
    RequestTimeout = 205,
    BackupNotConfigured = 206,

    // Protocol errors (300-399)
    InvalidFunctionCall = 300,
    FunctionCallRetriesExhausted = 301,

    // Dispatch errors (400-499)
    CapabilityNotFound = 400,
    ActionNotFound = 401,
    InvalidActionArguments = 402,
    ActionFailed = 403,
    DuplicateCapability = 404,

    // State errors (500-599)
    TaskQueueEmpty = 500,
    AgentNotRunning = 501,
    AgentAlreadyRunning = 502,

    // Persistence errors (600-699)
    SnapshotStoreFailed = 600,
    SnapshotCorrupted = 601,

    // Local backend errors (700-799)
    BackendInitFailed = 700,
    ModelLoadFailed = 701,
    ContextCreationFailed = 702,
    InferenceFailed = 703,
    TokenizationFailed = 704,
    ContextWindowExceeded = 705,

    // Unknown
    Unknown = 999
};

/**
 * @brief Coarse error taxonomy derived from the code range
 *
 * Tick callers branch on the category: a State error means "nothing to do",
 * everything else means the tick failed.
 */
enum class ErrorCategory {
    Config,
    Transport,
    Protocol,
    Dispatch,
    State,
    Persistence,
    Backend,
    Unknown
};

[[nodiscard]] inline ErrorCategory error_category(ErrorCode code) {
    const int value = static_cast<int>(code);
    if (value >= 100 && value < 200) return ErrorCategory::Config;
    if (value >= 200 && value < 300) return ErrorCategory::Transport;
    if (value >= 300 && value < 400) return ErrorCategory::Protocol;
    if (value >= 400 && value < 500) return ErrorCategory::Dispatch;
    if (value >= 500 && value < 600) return ErrorCategory::State;
    if (value >= 600 && value < 700) return ErrorCategory::Persistence;
    if (value >= 700 && value < 800) return ErrorCategory::Backend;
    return ErrorCategory::Unknown;
}

[[nodiscard]] inline const char* category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Config: return "config";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Dispatch: return "dispatch";
        case ErrorCategory::State: return "state";
        case ErrorCategory::Persistence: return "persistence";
        case ErrorCategory::Backend: return "backend";
        case ErrorCategory::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type used with tl::expected for composable error handling without
 * exceptions crossing the library boundary.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (payloads, URLs, status bodies)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    ErrorCategory category() const { return error_category(code); }

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Generation Settings
// ============================================================================

/**
 * @brief Generation parameters forwarded to every completion call
 *
 * Defaults follow the conversational defaults agents were historically
 * configured with; deployments override them through the config file.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct GenerationSettings {
    int max_tokens = 16;                 ///< Maximum tokens per choice (> 0)
    int n = 1;                           ///< Number of choices to request (> 0)
    float temperature = 1.0f;            ///< Sampling temperature (>= 0)
    float top_p = 1.0f;                  ///< Nucleus sampling threshold (0, 1]
    float frequency_penalty = 0.0f;      ///< Penalty on token frequency
    float presence_penalty = 0.0f;       ///< Penalty on token presence
    std::optional<std::string> stop;     ///< Optional stop sequence

    Expected<void> validate() const {
        if (max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidSettings, "max_tokens must be positive"});
        }
        if (n <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidSettings, "n must be positive"});
        }
        if (temperature < 0.0f) {
            return tl::unexpected(Error{ErrorCode::InvalidSettings, "temperature must be >= 0"});
        }
        if (top_p <= 0.0f || top_p > 1.0f) {
            return tl::unexpected(Error{ErrorCode::InvalidSettings, "top_p must be in (0, 1]"});
        }
        return {};
    }

    bool operator==(const GenerationSettings& other) const {
        return max_tokens == other.max_tokens &&
               n == other.n &&
               temperature == other.temperature &&
               top_p == other.top_p &&
               frequency_penalty == other.frequency_penalty &&
               presence_penalty == other.presence_penalty &&
               stop == other.stop;
    }

    bool operator!=(const GenerationSettings& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Identity and behaviour switches of one agent
 */
struct AgentSettings {
    std::string name = "geist";
    std::string version = "1.0";
    std::string description;
    GenerationSettings generation;
    bool include_world_processing = false;  ///< Run the world phase before the task phase

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidSettings, "Agent name cannot be empty"});
        }
        return generation.validate();
    }

    bool operator==(const AgentSettings& other) const {
        return name == other.name &&
               version == other.version &&
               description == other.description &&
               generation == other.generation &&
               include_world_processing == other.include_world_processing;
    }

    bool operator!=(const AgentSettings& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Completion Types
// ============================================================================

/**
 * @brief Provider-facing request: optional system prompt, user prompt, settings
 */
struct CompletionRequest {
    std::optional<std::string> system_prompt;  ///< Sent as a leading system message when set
    std::string user_prompt;                   ///< Always the final message
    GenerationSettings settings;               ///< Generation parameters

    /** @brief Messages in wire order: [system], user. */
    std::vector<Message> messages() const {
        std::vector<Message> out;
        out.reserve(2);
        if (system_prompt.has_value() && !system_prompt->empty()) {
            out.push_back(Message::system(*system_prompt));
        }
        out.push_back(Message::user(user_prompt));
        return out;
    }
};

/**
 * @brief Token usage reported by the provider (zero when unreported)
 */
struct TokenUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;

    bool operator==(const TokenUsage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const TokenUsage& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Normalized completion: one or more assistant choices plus metadata
 *
 * Lifetime is one call; the tick engine folds it into the context or hands
 * the first choice to the function-call protocol.
 */
struct CompletionResult {
    std::vector<Message> choices;              ///< Assistant messages, one per choice
    std::string provider;                      ///< Base URL or backend name that answered
    std::string model;                         ///< Model that produced the choices
    std::optional<std::string> id;             ///< Provider completion id
    TokenUsage usage;                          ///< Token accounting
    std::chrono::milliseconds latency_ms{0};   ///< Wall time of the successful call

    /** @brief Content strings of every choice, in order. */
    std::vector<std::string> contents() const {
        std::vector<std::string> out;
        out.reserve(choices.size());
        for (const auto& choice : choices) {
            out.push_back(choice.content);
        }
        return out;
    }

    /** @brief Content of the first assistant choice, if any. */
    std::optional<std::string> first_content() const {
        for (const auto& choice : choices) {
            if (choice.role == Role::Assistant) {
                return choice.content;
            }
        }
        return std::nullopt;
    }
};

} // namespace geist
