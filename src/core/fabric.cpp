#include "intentmesh/core/fabric.hpp"
#include "intentmesh/core/util/logger.hpp"

namespace intentmesh {

    struct Fabric::Impl {
        FabricOptions      options_;
        PluginPipeline     pipeline_;
        ComponentDiscovery discovery_;
        IntentRouter       router_;
        IntentComposer     composer_;
        CapabilityCatalog  catalog_;

        explicit Impl(FabricOptions opts)
            : options_(std::move(opts)),
              discovery_(options_.discovery),
              router_(discovery_, pipeline_, options_.router),
              composer_(router_, pipeline_, options_.retry, options_.branchThreads) {}
    };

    Fabric::Fabric(FabricOptions opts) {
        if (opts.logLevel) Logger::inst().setLevel(*opts.logLevel);
        pImpl_ = std::make_unique<Impl>(std::move(opts));
        LOG_DEBUG("[Fabric] started");
    }

    Result<std::unique_ptr<Fabric>> Fabric::fromConfigFile(const std::string& path) {
        auto opts = loadOptions(path);
        if (!opts) return opts.error();
        return std::make_unique<Fabric>(std::move(opts).value());
    }

    Fabric::~Fabric() = default;

    /* ---- components ---- */
    Result<void> Fabric::registerComponent(const std::string& id,
                                           std::shared_ptr<IComponent> handle,
                                           const ComponentMetadataPatch& metadata) {
        return pImpl_->discovery_.registerComponent(id, std::move(handle), metadata);
    }

    bool Fabric::unregisterComponent(const std::string& id) {
        return pImpl_->discovery_.unregisterComponent(id);
    }

    std::vector<ComponentMatch> Fabric::findComponents(const DiscoveryPattern& pattern) {
        return pImpl_->discovery_.findComponents(pattern);
    }

    std::optional<ComponentMatch> Fabric::getBestMatch(const DiscoveryPattern& pattern,
                                                       LoadBalanceStrategy strategy) {
        return pImpl_->discovery_.getBestMatch(pattern, strategy);
    }

    Health Fabric::getComponentHealth(const std::string& id) {
        return pImpl_->discovery_.getComponentHealth(id);
    }

    Result<void> Fabric::updateComponentMetadata(const std::string& id, const nlohmann::json& partial) {
        return pImpl_->discovery_.updateComponentMetadata(id, partial);
    }

    /* ---- intents ---- */
    Result<std::string> Fabric::routeIntent(const Intent& intent) {
        return pImpl_->router_.routeIntent(intent);
    }

    Result<Intent> Fabric::delegateIntent(const Intent& intent, const std::string& targetId) {
        return pImpl_->router_.delegateIntent(intent, targetId);
    }

    Result<Intent> Fabric::validateIntent(const Intent& intent) {
        return pImpl_->pipeline_.runValidate(intent);
    }

    Result<Intent> Fabric::transformIntent(const Intent& intent) {
        return pImpl_->pipeline_.runTransform(intent);
    }

    Outcome Fabric::processIntent(const Intent& intent) {
        return pImpl_->router_.process(intent);
    }

    Result<Composition> Fabric::composeIntents(const std::vector<Intent>& intents,
                                               CompositionStrategy strategy,
                                               const CompositionOptions& opts) {
        return pImpl_->composer_.composeIntents(intents, strategy, opts);
    }

    Result<Composition> Fabric::composeIntents(const std::vector<Intent>& intents,
                                               std::string_view strategy,
                                               const CompositionOptions& opts) {
        return pImpl_->composer_.composeIntents(intents, strategy, opts);
    }

    Result<Composition> Fabric::composeComposite(const CompositeIntent& composite,
                                                 const CompositionOptions& opts) {
        return pImpl_->composer_.composeComposite(composite, opts);
    }

    Result<Composition> Fabric::composeWithRetry(const std::vector<Intent>& intents,
                                                 const CompositionOptions& opts) {
        return pImpl_->composer_.composeWithRetry(intents, opts);
    }

    /* ---- plugins ---- */
    void Fabric::registerPlugin(PluginPtr plugin) {
        pImpl_->pipeline_.registerPlugin(std::move(plugin));
    }

    bool Fabric::unregisterPlugin(const PluginPtr& plugin) {
        return pImpl_->pipeline_.unregisterPlugin(plugin);
    }

    std::vector<PluginPtr> Fabric::getPluginsByType(PluginType type) const {
        return pImpl_->pipeline_.getPluginsByType(type);
    }

    /* ---- services ---- */
    ComponentDiscovery& Fabric::discovery() { return pImpl_->discovery_; }
    PluginPipeline& Fabric::plugins() { return pImpl_->pipeline_; }
    IntentRouter& Fabric::router() { return pImpl_->router_; }
    IntentComposer& Fabric::composer() { return pImpl_->composer_; }
    CapabilityCatalog& Fabric::catalog() { return pImpl_->catalog_; }
    const FabricOptions& Fabric::options() const { return pImpl_->options_; }

}
