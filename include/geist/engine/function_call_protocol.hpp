#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

namespace geist {

// ============================================================================
// FunctionCall struct
// ============================================================================

/** @brief A validated action intent extracted from model output. */
struct FunctionCall {
    std::string capability_name;  ///< Wire key "class"
    std::string action_name;      ///< Wire key "function"
    nlohmann::json parameters;    ///< Wire key "parameters"; always a JSON object

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"class", capability_name},
            {"function", action_name},
            {"parameters", parameters}
        };
    }

    bool operator==(const FunctionCall& other) const {
        return capability_name == other.capability_name &&
               action_name == other.action_name &&
               parameters == other.parameters;
    }
    bool operator!=(const FunctionCall& other) const { return !(*this == other); }
};

namespace engine {

// ============================================================================
// FunctionCallProtocol
// ============================================================================

/**
 * @brief Decides whether raw model text is a function call and extracts it.
 *
 * The wire shape is a single JSON object carrying the keys "class",
 * "function" and "parameters", where "parameters" is itself an object.
 * Newline characters are stripped before parsing because models tend to
 * wrap the object across lines. Parsing never throws: text that is not JSON
 * at all is reported the same way as well-formed JSON of the wrong shape.
 */
class FunctionCallProtocol {
public:
    static constexpr const char* kClassKey = "class";
    static constexpr const char* kFunctionKey = "function";
    static constexpr const char* kParametersKey = "parameters";

    /** @brief Remove embedded '\n' and '\r' characters. */
    static std::string normalize(std::string text) {
        text.erase(std::remove_if(text.begin(), text.end(),
                                  [](char c) { return c == '\n' || c == '\r'; }),
                   text.end());
        return text;
    }

    /**
     * @brief Total validity predicate: true iff parse() would succeed.
     */
    static bool is_valid(const std::string& text) noexcept {
        try {
            return parse(text).has_value();
        } catch (const std::exception&) {
            // Only allocation failure can reach here.
            return false;
        }
    }

    /**
     * @brief Parse model output into a FunctionCall.
     *
     * @param text Raw text output from the model
     * @return The call, or InvalidFunctionCall with the reason and the payload
     */
    static Expected<FunctionCall> parse(const std::string& text) {
        const std::string normalized = normalize(text);

        auto doc = nlohmann::json::parse(normalized, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            return invalid("Payload is not valid JSON", normalized);
        }
        if (!doc.is_object()) {
            return invalid("Payload is not a JSON object", normalized);
        }

        for (const char* key : {kClassKey, kFunctionKey, kParametersKey}) {
            if (!doc.contains(key)) {
                return invalid(std::string("Missing required key '") + key + "'", normalized);
            }
        }

        if (!doc[kParametersKey].is_object()) {
            return invalid("'parameters' must be a JSON object", normalized);
        }
        if (!doc[kClassKey].is_string() || !doc[kFunctionKey].is_string()) {
            return invalid("'class' and 'function' must be strings", normalized);
        }

        FunctionCall call;
        call.capability_name = doc[kClassKey].get<std::string>();
        call.action_name = doc[kFunctionKey].get<std::string>();
        call.parameters = std::move(doc[kParametersKey]);
        return call;
    }

private:
    static tl::unexpected<Error> invalid(std::string reason, const std::string& payload) {
        return tl::unexpected(Error{ErrorCode::InvalidFunctionCall, std::move(reason), payload});
    }
};

} // namespace engine
} // namespace geist
