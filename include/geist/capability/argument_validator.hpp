#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace geist {
namespace capability {

/**
 * @brief Checks a call's named parameters against an action schema
 *
 * Runs before the action so a malformed call is rejected with a typed error
 * instead of failing inside the action body. Checks run in this order:
 * parameters is an object, no key outside "properties", every "required"
 * key present, every provided value of the declared type.
 */
class ArgumentValidator {
public:
    /**
     * @return Empty if valid, otherwise a description of the first problem
     */
    static std::string validate(const std::string& action_name,
                                const nlohmann::json& parameters,
                                const nlohmann::json& schema) {
        if (!parameters.is_object()) {
            return "Parameters for '" + action_name + "' must be an object";
        }

        static const nlohmann::json kNoProperties = nlohmann::json::object();
        auto props = schema.find("properties");
        const nlohmann::json& properties =
            (props != schema.end() && props->is_object()) ? *props : kNoProperties;

        std::string problem = unexpected_key(action_name, parameters, properties);
        if (problem.empty()) {
            problem = missing_key(parameters, schema);
        }
        if (problem.empty()) {
            problem = wrong_type(parameters, properties);
        }
        return problem;
    }

private:
    static std::string unexpected_key(const std::string& action_name,
                                      const nlohmann::json& parameters,
                                      const nlohmann::json& properties) {
        for (auto it = parameters.begin(); it != parameters.end(); ++it) {
            if (!properties.contains(it.key())) {
                return "Unexpected argument for '" + action_name + "': " + it.key();
            }
        }
        return {};
    }

    static std::string missing_key(const nlohmann::json& parameters, const nlohmann::json& schema) {
        auto required = schema.find("required");
        if (required == schema.end() || !required->is_array()) {
            return {};
        }
        for (const auto& name : *required) {
            if (name.is_string() && !parameters.contains(name.get<std::string>())) {
                return "Missing required argument: " + name.get<std::string>();
            }
        }
        return {};
    }

    static std::string wrong_type(const nlohmann::json& parameters, const nlohmann::json& properties) {
        for (auto it = properties.begin(); it != properties.end(); ++it) {
            auto value = parameters.find(it.key());
            auto declared = it->find("type");
            if (value == parameters.end() || declared == it->end() || !declared->is_string()) {
                continue;
            }
            const std::string expected = declared->get<std::string>();
            if (!has_type(*value, expected)) {
                return "Argument '" + it.key() + "' has wrong type: expected " +
                       expected + ", got " + type_of(*value);
            }
        }
        return {};
    }

    static bool has_type(const nlohmann::json& value, const std::string& type) {
        if (type == "number") {
            return value.is_number();
        }
        return type == type_of(value);
    }

    static std::string type_of(const nlohmann::json& value) {
        switch (value.type()) {
            case nlohmann::json::value_t::null: return "null";
            case nlohmann::json::value_t::boolean: return "boolean";
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned: return "integer";
            case nlohmann::json::value_t::number_float: return "number";
            case nlohmann::json::value_t::string: return "string";
            case nlohmann::json::value_t::array: return "array";
            case nlohmann::json::value_t::object: return "object";
            default: return "unknown";
        }
    }
};

} // namespace capability
} // namespace geist
