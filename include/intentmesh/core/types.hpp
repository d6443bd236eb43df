/**
 * @file types.hpp
 * @brief Shared enums and metadata records used by discovery, plugins and routing.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/capability/capability.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    class Intent;           // Forward-declaration
    class IComponent;       // Forward-declaration
    class IIntentPlugin;    // Forward-declaration

    /**
     * @enum Health
     * @brief Current health of a registered component.
     */
    enum class Health {
        Healthy,
        Degraded,
        Unhealthy,
        Unknown
    };

    std::string_view toString(Health h);
    std::optional<Health> parseHealth(std::string_view name);

    /**
     * @enum LoadBalanceStrategy
     * @brief Selection policy applied to a scored candidate list.
     */
    enum class LoadBalanceStrategy {
        RoundRobin,
        LeastConnections,
        WeightedRoundRobin,
        Random
    };

    std::string_view toString(LoadBalanceStrategy s);

    /**
     * @brief Parse a strategy name. Unknown names fall back to round robin.
     */
    LoadBalanceStrategy parseLoadBalanceStrategy(std::string_view name);

    /**
     * @brief True if @p name is one of the four known strategy names.
     */
    bool isKnownLoadBalanceStrategy(std::string_view name);

    /**
     * @enum PluginType
     * @brief Which pipeline stage a plugin takes part in.
     */
    enum class PluginType {
        Validation,
        Transformation,
        Routing,
        Composition,
        Generic
    };

    std::string_view toString(PluginType t);

    /**
     * @struct ComponentMetadata
     * @brief Descriptive attributes of a registered component.
     */
    struct ComponentMetadata {
        std::string              type{ "generic" };
        std::string              version{ "1.0.0" };
        std::vector<Capability>  capabilities;
        std::vector<std::string> dependencies;
        std::vector<std::string> tags;
        nlohmann::json           interface = nlohmann::json::object();
    };

    void to_json(nlohmann::json& j, const ComponentMetadata& m);

    /**
     * @struct ComponentMetadataPatch
     * @brief Partial metadata. Set fields replace the corresponding field of the target.
     */
    struct ComponentMetadataPatch {
        std::optional<std::string>              type;
        std::optional<std::string>              version;
        std::optional<std::vector<Capability>>  capabilities;
        std::optional<std::vector<std::string>> dependencies;
        std::optional<std::vector<std::string>> tags;
        std::optional<nlohmann::json>           interface;

        void applyTo(ComponentMetadata& target) const;
        bool empty() const;

        /**
         * @brief Read a patch from a JSON object. Unknown keys are ignored.
         * @return InvalidConfig if a known key holds a value of the wrong shape
         */
        static Result<ComponentMetadataPatch> fromJson(const nlohmann::json& j);
    };

}
