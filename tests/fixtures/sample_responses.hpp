#pragma once

#include <string>

namespace geist {
namespace testing {
namespace responses {

// ----------------------------------------------------------------------------
// Provider bodies (OpenAI-compatible /chat/completions)
// ----------------------------------------------------------------------------

inline const std::string CHAT_OK =
    R"({"id": "chatcmpl-1", "model": "gpt-4o",
        "choices": [{"index": 0, "message": {"role": "assistant", "content": "hello"}}],
        "usage": {"prompt_tokens": 12, "completion_tokens": 3, "total_tokens": 15}})";

inline const std::string CHAT_TWO_CHOICES =
    R"({"model": "gpt-4o",
        "choices": [{"message": {"role": "assistant", "content": "first"}},
                    {"message": {"role": "assistant", "content": "second"}}]})";

// Legacy completions shape: text instead of message.content
inline const std::string CHAT_TEXT_CHOICE =
    R"({"choices": [{"text": "plain text"}]})";

inline const std::string CHAT_NO_CHOICES = R"({"choices": []})";

inline const std::string NOT_JSON = "<html>502 Bad Gateway</html>";

inline const std::string RATE_LIMITED = R"({"error": {"message": "rate limited"}})";

inline const std::string SERVER_ERROR = R"({"error": {"message": "overloaded"}})";

// ----------------------------------------------------------------------------
// Function-call payloads produced by the model
// ----------------------------------------------------------------------------

inline const std::string CALL_LOG_HAIKU =
    R"({"class": "LogAdapter", "function": "log", "parameters": {"output": "leaves drift in cold wind"}})";

// Same call, pretty-printed across lines
inline const std::string CALL_MULTILINE =
    "{\n    \"class\": \"Recorder\",\n    \"function\": \"write\",\n"
    "    \"parameters\": {\"text\": \"hi\"}\n}";

inline const std::string CALL_RECORDER_WRITE =
    R"({"class": "Recorder", "function": "write", "parameters": {"text": "hi"}})";

inline const std::string CALL_RECORDER_ADD =
    R"({"class": "Recorder", "function": "add", "parameters": {"a": 2, "b": 3}})";

inline const std::string CALL_WITH_EXTRA_KEY =
    R"({"class": "Recorder", "function": "write", "parameters": {"text": "hi"}, "reason": "because"})";

inline const std::string CALL_MISSING_PARAMETERS =
    R"({"class": "Recorder", "function": "write"})";

inline const std::string CALL_PARAMETERS_NOT_OBJECT =
    R"({"class": "Recorder", "function": "write", "parameters": "text=hi"})";

inline const std::string CALL_CLASS_NOT_STRING =
    R"({"class": 7, "function": "write", "parameters": {}})";

inline const std::string CALL_UNKNOWN_CAPABILITY =
    R"({"class": "Nope", "function": "write", "parameters": {}})";

inline const std::string CALL_UNKNOWN_ACTION =
    R"({"class": "Recorder", "function": "erase", "parameters": {}})";

inline const std::string PROSE_NOT_JSON =
    "Sure! I will log the haiku for you.";

inline const std::string TRUNCATED_JSON =
    R"({"class": "Recorder", "function": "write", "parameters": {"text": )";

} // namespace responses
} // namespace testing
} // namespace geist
