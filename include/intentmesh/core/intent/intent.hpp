/**
 * @file intent.hpp
 * @brief Intent and composite-intent value objects.
 *
 * Intents are immutable requests for effect. Derivations such as delegation
 * produce new values; the original is never modified.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/capability/capability.hpp"

namespace intentmesh {

    /**
     * @enum CompositionStrategy
     * @brief How a set of intents is jointly executed.
     */
    enum class CompositionStrategy {
        Sequential,
        Parallel,
        Conditional,
        Pipeline,
        FanOut
    };

    std::string_view toString(CompositionStrategy s);

    /**
     * @brief Parse "sequential", "parallel", "conditional", "pipeline" or "fan_out".
     */
    std::optional<CompositionStrategy> parseStrategy(std::string_view name);

    /**
     * @class Intent
     * @brief `{id, type, payload, capabilities, metadata}`.
     *
     * Metadata carries flags such as `dynamic`, `composite` and `delegated_to`.
     */
    class Intent {
    public:
        Intent(std::string id,
               std::string type,
               nlohmann::json payload,
               std::vector<Capability> capabilities,
               nlohmann::json metadata);

        const std::string& id() const { return id_; }
        const std::string& type() const { return type_; }
        const nlohmann::json& payload() const { return payload_; }
        const std::vector<Capability>& capabilities() const { return capabilities_; }
        const nlohmann::json& metadata() const { return metadata_; }

        bool isComposite() const;
        std::optional<std::string> delegatedTo() const;

        /**
         * @brief Copy with metadata[key] = value.
         */
        Intent withMetadata(const std::string& key, nlohmann::json value) const;

        /**
         * @brief Copy with the payload replaced.
         */
        Intent withPayload(nlohmann::json payload) const;

        nlohmann::json toJson() const;

    private:
        std::string             id_;
        std::string             type_;
        nlohmann::json          payload_;
        std::vector<Capability> capabilities_;
        nlohmann::json          metadata_;
    };

    /**
     * @class CompositeIntent
     * @brief Ordered intents plus the strategy that executes them.
     *
     * Sub-intents are held by value and may be reused in other composites.
     */
    class CompositeIntent {
    public:
        CompositeIntent(std::string id,
                        std::vector<Intent> intents,
                        CompositionStrategy strategy,
                        nlohmann::json metadata);

        const std::string& id() const { return id_; }
        const std::vector<Intent>& intents() const { return intents_; }
        CompositionStrategy strategy() const { return strategy_; }
        const nlohmann::json& metadata() const { return metadata_; }

        /**
         * @brief View as a single intent of type "composite" (for routing).
         */
        Intent asIntent() const;

    private:
        std::string         id_;
        std::vector<Intent> intents_;
        CompositionStrategy strategy_;
        nlohmann::json      metadata_;
    };

    /**
     * @brief Fresh id of the form `intent_<epoch-ns>_<16 hex digits>`.
     */
    std::string generateIntentId();

    /**
     * @brief Create an intent stamped with id, created_at and dynamic = true.
     */
    Intent createIntent(std::string type,
                        nlohmann::json payload = nlohmann::json::object(),
                        std::vector<Capability> capabilities = {});

    /**
     * @brief Create a composite intent stamped with id, created_at, dynamic and composite flags.
     */
    CompositeIntent createCompositeIntent(std::vector<Intent> intents,
                                          CompositionStrategy strategy = CompositionStrategy::Parallel);

}
