#pragma once

#include "../types.hpp"
#include "action_table.hpp"
#include "argument_validator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace geist {
namespace capability {

/**
 * @brief Contract every registered capability exposes to the dispatcher
 *
 * A capability is a named unit with a closed set of actions. The dispatcher
 * only ever sees action names and JSON parameters; how an action is carried
 * out is private to the capability.
 */
class ICapability {
public:
    virtual ~ICapability() = default;

    /** @brief Name the model uses in the "class" key. */
    virtual const std::string& name() const = 0;

    /** @brief Callable action names, in lexical order. */
    virtual std::vector<std::string> actions() const = 0;

    virtual bool has_action(const std::string& action) const = 0;

    /**
     * @brief Run one action with named parameters
     *
     * @return The action's result (null for actions without one), or
     *         ActionNotFound / InvalidActionArguments / ActionFailed
     */
    virtual Expected<nlohmann::json> invoke(const std::string& action,
                                            const nlohmann::json& parameters) = 0;

    /** @brief {"name","actions":[{"name","description","parameters"}...]} */
    virtual nlohmann::json describe() const = 0;
};

/**
 * @brief ICapability backed by an ActionTable
 *
 * Subclasses register their actions in the constructor via actions_table().
 * invoke() validates the parameters against the action's schema before the
 * handler runs.
 */
class Capability : public ICapability {
public:
    explicit Capability(std::string name) : name_(std::move(name)) {}

    // Handlers capture this
    Capability(const Capability&) = delete;
    Capability& operator=(const Capability&) = delete;

    const std::string& name() const override { return name_; }

    std::vector<std::string> actions() const override { return table_.names(); }

    bool has_action(const std::string& action) const override {
        return table_.has_action(action);
    }

    Expected<nlohmann::json> invoke(const std::string& action,
                                    const nlohmann::json& parameters) override {
        const ActionEntry* entry = table_.find(action);
        if (entry == nullptr) {
            return tl::unexpected(Error{
                ErrorCode::ActionNotFound,
                "Action not found: " + name_ + "." + action
            });
        }

        auto validation_error = ArgumentValidator::validate(action, parameters, entry->parameters_schema);
        if (!validation_error.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidActionArguments,
                std::move(validation_error),
                parameters.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            });
        }

        return entry->handler(parameters);
    }

    nlohmann::json describe() const override {
        return nlohmann::json{
            {"name", name_},
            {"actions", table_.describe()}
        };
    }

protected:
    ActionTable& actions_table() { return table_; }

private:
    std::string name_;
    ActionTable table_;
};

} // namespace capability
} // namespace geist
