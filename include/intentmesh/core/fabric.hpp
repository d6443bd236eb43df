/**
 * @file fabric.hpp
 * @brief Fabric: one discovery, plugin pipeline, router, composer and catalog wired together.
 *
 * Collaborators register components, plugins and capability units into a
 * Fabric and issue intents through it. Several fabrics may coexist in one
 * process; none of their state is global.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/catalog/capability_catalog.hpp"
#include "intentmesh/core/discovery/component_discovery.hpp"
#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/options.hpp"
#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/core/router/intent_composer.hpp"
#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    /**
     * @class Fabric
     * @brief Facade over the intent routing and discovery services.
     */
    class Fabric {
    public:
        /**
         * @brief Build every service from @p opts. A set opts.logLevel is applied to the process-wide Logger.
         */
        explicit Fabric(FabricOptions opts = {});

        /**
         * @brief Load options from a JSON file and build a Fabric.
         * @return InvalidConfig if the file is unreadable or invalid
         */
        static Result<std::unique_ptr<Fabric>> fromConfigFile(const std::string& path);

        ~Fabric();

        Fabric(const Fabric&) = delete;
        Fabric& operator=(const Fabric&) = delete;

        /* ---- components ---- */
        Result<void> registerComponent(const std::string& id,
                                       std::shared_ptr<IComponent> handle,
                                       const ComponentMetadataPatch& metadata = {});
        bool unregisterComponent(const std::string& id);
        std::vector<ComponentMatch> findComponents(const DiscoveryPattern& pattern);
        std::optional<ComponentMatch> getBestMatch(const DiscoveryPattern& pattern,
                                                   LoadBalanceStrategy strategy = LoadBalanceStrategy::RoundRobin);
        Health getComponentHealth(const std::string& id);
        Result<void> updateComponentMetadata(const std::string& id, const nlohmann::json& partial);

        /* ---- intents ---- */
        Result<std::string> routeIntent(const Intent& intent);
        Result<Intent> delegateIntent(const Intent& intent, const std::string& targetId);
        Result<Intent> validateIntent(const Intent& intent);
        Result<Intent> transformIntent(const Intent& intent);

        /**
         * @brief Validate, transform, route and dispatch one intent.
         */
        Outcome processIntent(const Intent& intent);

        Result<Composition> composeIntents(const std::vector<Intent>& intents,
                                           CompositionStrategy strategy,
                                           const CompositionOptions& opts = {});
        Result<Composition> composeIntents(const std::vector<Intent>& intents,
                                           std::string_view strategy,
                                           const CompositionOptions& opts = {});
        Result<Composition> composeComposite(const CompositeIntent& composite,
                                             const CompositionOptions& opts = {});

        /**
         * @brief Compose with the configured retry overlay.
         */
        Result<Composition> composeWithRetry(const std::vector<Intent>& intents,
                                             const CompositionOptions& opts = {});

        /* ---- plugins ---- */
        void registerPlugin(PluginPtr plugin);
        bool unregisterPlugin(const PluginPtr& plugin);
        std::vector<PluginPtr> getPluginsByType(PluginType type) const;

        /* ---- services ---- */
        ComponentDiscovery& discovery();
        PluginPipeline& plugins();
        IntentRouter& router();
        IntentComposer& composer();
        CapabilityCatalog& catalog();
        const FabricOptions& options() const;

    private:
        // PIMPL idiom
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
