#pragma once

#include "../types.hpp"
#include "../engine/function_call_protocol.hpp"
#include "capability.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace geist {
namespace capability {

/** @brief Builds a capability from its settings object. */
using CapabilityFactory =
    std::function<Expected<std::shared_ptr<ICapability>>(const nlohmann::json& settings)>;

/** @brief One row of a static registration table. */
struct CapabilityRegistration {
    std::string name;
    CapabilityFactory factory;
};

/**
 * @brief Resolves FunctionCalls to capability actions
 *
 * Holds one instance per capability name for the lifetime of the owning
 * agent. The registry knows nothing about what a capability does; it only
 * routes (capability, action, parameters) and returns the result untouched.
 *
 * Thread Safety: registration takes an exclusive lock, lookups a shared one.
 * The lock is not held while an action runs.
 */
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /**
     * @brief Instantiate capabilities from a registration table
     *
     * @param table Registration rows, names unique
     * @param settings Null to instantiate every row with empty settings, or an
     *        object mapping capability name to that capability's settings, in
     *        which case only the named rows are instantiated
     */
    static Expected<std::shared_ptr<CapabilityRegistry>> from_table(
        const std::vector<CapabilityRegistration>& table,
        const nlohmann::json& settings = nullptr) {
        auto registry = std::make_shared<CapabilityRegistry>();

        if (!settings.is_null() && !settings.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Capability settings must be an object keyed by capability name"
            });
        }

        if (settings.is_object()) {
            for (auto entry = settings.begin(); entry != settings.end(); ++entry) {
                const std::string& name = entry.key();
                auto row = std::find_if(table.begin(), table.end(),
                    [&name](const CapabilityRegistration& r) { return r.name == name; });
                if (row == table.end()) {
                    return tl::unexpected(Error{
                        ErrorCode::CapabilityNotFound,
                        "No registration for configured capability: " + name
                    });
                }
            }
        }

        for (const auto& row : table) {
            nlohmann::json row_settings = nlohmann::json::object();
            if (settings.is_object()) {
                auto it = settings.find(row.name);
                if (it == settings.end()) {
                    continue;
                }
                if (!it->is_null()) {
                    row_settings = *it;
                }
            }

            auto instance = row.factory(row_settings);
            if (!instance) {
                return tl::unexpected(instance.error());
            }
            if (auto added = registry->add(row.name, std::move(*instance)); !added) {
                return tl::unexpected(added.error());
            }
        }

        return registry;
    }

    /**
     * @brief Register a live capability under a name
     *
     * @return DuplicateCapability if the name is taken
     */
    Expected<void> add(const std::string& name, std::shared_ptr<ICapability> capability) {
        if (!capability) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Capability instance for '" + name + "' is null"
            });
        }

        std::unique_lock lock(mutex_);
        if (capabilities_.find(name) != capabilities_.end()) {
            return tl::unexpected(Error{
                ErrorCode::DuplicateCapability,
                "Capability already registered: " + name
            });
        }
        capabilities_.emplace(name, std::move(capability));
        return {};
    }

    /** @brief Register under the capability's own name. */
    Expected<void> add(std::shared_ptr<ICapability> capability) {
        if (!capability) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Capability instance is null"});
        }
        const std::string name = capability->name();
        return add(name, std::move(capability));
    }

    bool contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return capabilities_.find(name) != capabilities_.end();
    }

    std::shared_ptr<ICapability> find(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = capabilities_.find(name);
        return it == capabilities_.end() ? nullptr : it->second;
    }

    /**
     * @brief Route a function call to its action
     *
     * @return The action result, or CapabilityNotFound / ActionNotFound /
     *         any error the action itself reported
     */
    Expected<nlohmann::json> dispatch(const FunctionCall& call) const {
        auto capability = find(call.capability_name);
        if (!capability) {
            return tl::unexpected(Error{
                ErrorCode::CapabilityNotFound,
                "Capability not found: " + call.capability_name
            });
        }

        if (!capability->has_action(call.action_name)) {
            return tl::unexpected(Error{
                ErrorCode::ActionNotFound,
                "Action not found: " + call.capability_name + "." + call.action_name
            });
        }

        spdlog::info("dispatch {}.{} {}", call.capability_name, call.action_name, call.parameters.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return capability->invoke(call.action_name, call.parameters);
    }

    /** @brief Registered names in lexical order. */
    std::vector<std::string> names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> out;
        out.reserve(capabilities_.size());
        for (const auto& [name, _] : capabilities_) {
            out.push_back(name);
        }
        return out;
    }

    /** @brief Description of every capability for inclusion in the system prompt. */
    nlohmann::json describe() const {
        std::shared_lock lock(mutex_);
        nlohmann::json out = nlohmann::json::array();
        for (const auto& [name, capability] : capabilities_) {
            auto entry = capability->describe();
            entry["name"] = name;
            out.push_back(std::move(entry));
        }
        return out;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return capabilities_.size();
    }

private:
    std::map<std::string, std::shared_ptr<ICapability>> capabilities_;
    mutable std::shared_mutex mutex_;
};

} // namespace capability
} // namespace geist
