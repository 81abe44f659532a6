#pragma once

#include "../capability/capability_registry.hpp"
#include <string>

namespace geist {
namespace engine {
namespace prompts {

inline constexpr const char* kWorldTick =
    "You are a world class executive. Your plans are direct, and detailed only if necessary. "
    "Given what you know about the world today, and the main task that you need to complete, "
    "consider if there are any additional facts that you should add to the list of things you consider. "
    "Do not add anything that doesn't need to be added, consolidate anything that is worth "
    "consolidating with simpler statements.";

inline constexpr const char* kTaskTick =
    "You are a focused individual. Given the main task that you wish to complete, and current working "
    "subtasks, create a specific list of actionable tasks that will complete your problem. Delimit these "
    "as plain english separated by the | character. Do not use function calls yet - only plain english.";

inline constexpr const char* kFunctionCallJson = R"(
{
    "class" : "class_name",
    "function": "function_name",
    "parameters": {
        "param1": "value1",
        "param2": "value2"
    }
}
)";

inline constexpr const char* kSystem =
    "You are an agent looking to complete tasks for individuals. You will be given context about the "
    "world, the task and functions you can call. Take the most direct and thorough way of satisfying "
    "these constraints.";

/** @brief Execution instruction with the function-call shape embedded. */
inline std::string execution_tick() {
    return std::string(
        "You are given a list of tasks and list of function calls that you can make. Given the state of "
        "the world, and classes available to you - formulate a function call that will help you complete "
        "your task. You should formulate the function call as ") +
        kFunctionCallJson +
        ". Only call functions that are listed in our adapter list.";
}

/** @brief Agent preamble followed by the capability list the model may call. */
inline std::string system_prompt(const capability::CapabilityRegistry& registry) {
    std::string out = kSystem;
    if (registry.size() > 0) {
        out += "\nAvailable adapters (class, functions, parameters):\n";
        out += registry.describe().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return out;
}

} // namespace prompts
} // namespace engine
} // namespace geist
