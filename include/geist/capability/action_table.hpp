#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace geist {
namespace capability {

/** @brief Untyped action entry point: named JSON parameters in, JSON result or Error out. */
using ActionHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

namespace detail {

template<typename T>
inline constexpr bool always_false = false;

/** @brief JSON Schema type keyword for a C++ parameter type. */
template<typename T>
constexpr const char* schema_type() {
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else if constexpr (std::is_integral_v<T>) {
        return "integer";
    } else if constexpr (std::is_floating_point_v<T>) {
        return "number";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
        return "array";
    } else if constexpr (std::is_same_v<T, nlohmann::json>) {
        return "object";
    } else {
        static_assert(always_false<T>, "unsupported action parameter type");
        return "";
    }
}

// Parameter list of a lambda or function pointer, with references and
// cv-qualifiers stripped.
template<typename T>
struct callable_signature : callable_signature<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct callable_signature<R(*)(Args...)> {
    using result = R;
    using params = std::tuple<std::decay_t<Args>...>;
};

template<typename C, typename R, typename... Args>
struct callable_signature<R(C::*)(Args...) const> : callable_signature<R(*)(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_signature<R(C::*)(Args...)> : callable_signature<R(*)(Args...)> {};

template<typename Params, size_t... Is>
nlohmann::json schema_for(const std::vector<std::string>& names, std::index_sequence<Is...>) {
    constexpr std::array<const char*, sizeof...(Is)> types = {
        schema_type<std::tuple_element_t<Is, Params>>()...
    };

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"required", nlohmann::json::array()}
    };
    for (size_t i = 0; i < types.size(); ++i) {
        schema["properties"][names[i]] = {{"type", types[i]}};
        schema["required"].push_back(names[i]);
    }
    return schema;
}

template<typename Params, typename Func, size_t... Is>
decltype(auto) call_with(Func& func, const nlohmann::json& args,
                         const std::vector<std::string>& names, std::index_sequence<Is...>) {
    return func(args.at(names[Is]).template get<std::tuple_element_t<Is, Params>>()...);
}

} // namespace detail

/** @brief One callable action of a capability. */
struct ActionEntry {
    std::string name;                    ///< Matches FunctionCall::action_name
    std::string description;             ///< Shown to the model in the system prompt
    nlohmann::json parameters_schema;    ///< JSON Schema of the named parameters
    ActionHandler handler;
};

/**
 * @brief Name -> handler map owned by each capability
 *
 * Filled in the capability's constructor and read-only afterwards. Typed
 * registration derives the parameter schema from the callable's signature,
 * so what the model is told and what invocation coerces always agree.
 * Exceptions escaping a handler become ActionFailed (InvalidActionArguments
 * for JSON conversion errors).
 */
class ActionTable {
public:
    /**
     * @brief Register a typed callable; every parameter is required
     *
     * @param param_names One name per callable parameter, in order
     * @throws std::invalid_argument if the name count differs from the arity
     */
    template<typename Func>
    void register_action(const std::string& name, const std::string& description,
                         const std::vector<std::string>& param_names, Func func) {
        using signature = detail::callable_signature<Func>;
        using params = typename signature::params;
        using result = typename signature::result;
        constexpr size_t arity = std::tuple_size_v<params>;

        if (param_names.size() != arity) {
            throw std::invalid_argument(
                "Action '" + name + "' declares " + std::to_string(param_names.size()) +
                " parameter name(s) for a callable taking " + std::to_string(arity));
        }

        auto schema = detail::schema_for<params>(param_names, std::make_index_sequence<arity>{});
        ActionHandler handler = [f = std::move(func), names = param_names](
            const nlohmann::json& args) mutable -> Expected<nlohmann::json> {
            if constexpr (std::is_void_v<result>) {
                detail::call_with<params>(f, args, names, std::make_index_sequence<arity>{});
                return nlohmann::json(nullptr);
            } else {
                return nlohmann::json(detail::call_with<params>(f, args, names, std::make_index_sequence<arity>{}));
            }
        };

        register_action_with_schema(name, description, std::move(schema), std::move(handler));
    }

    /**
     * @brief Register a handler with a hand-written schema
     *
     * For actions with optional parameters.
     */
    void register_action_with_schema(const std::string& name, const std::string& description,
                                     nlohmann::json schema, ActionHandler handler) {
        entries_.insert_or_assign(name, ActionEntry{name, description, std::move(schema), guard(std::move(handler))});
    }

    bool has_action(const std::string& name) const {
        return entries_.count(name) > 0;
    }

    /** @brief nullptr when unknown. */
    const ActionEntry* find(const std::string& name) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    /** @brief Action names, sorted. */
    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.push_back(entry.first);
        }
        return out;
    }

    nlohmann::json describe() const {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& entry : entries_) {
            const ActionEntry& action = entry.second;
            out.push_back({
                {"name", action.name},
                {"description", action.description},
                {"parameters", action.parameters_schema}
            });
        }
        return out;
    }

    size_t size() const { return entries_.size(); }

private:
    static ActionHandler guard(ActionHandler handler) {
        return [inner = std::move(handler)](const nlohmann::json& args) -> Expected<nlohmann::json> {
            try {
                return inner(args);
            } catch (const nlohmann::json::exception& e) {
                return tl::unexpected(Error{ErrorCode::InvalidActionArguments,
                                            std::string("Bad action argument: ") + e.what()});
            } catch (const std::exception& e) {
                return tl::unexpected(Error{ErrorCode::ActionFailed,
                                            std::string("Action failed: ") + e.what()});
            }
        };
    }

    std::map<std::string, ActionEntry> entries_;
};

} // namespace capability
} // namespace geist
