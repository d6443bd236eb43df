#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>

namespace intentmesh {

namespace {

    /*
     * Run one hook. Anything it throws is logged and turned into a
     * PluginFailure naming the plugin and the hook.
     */
    template <typename F>
    auto guarded(const IIntentPlugin& plugin, const char* hook, F&& call) -> decltype(call()) {
        try {
            return call();
        }
        catch (const std::exception& ex) {
            LOG_ERROR("[PluginPipeline] " + std::string(plugin.name()) + "." + hook +
                      " threw: " + ex.what());
            return makeError(FabricErr::PluginFailure,
                             std::string(plugin.name()) + "." + hook + ": " + ex.what());
        }
        catch (...) {
            LOG_ERROR("[PluginPipeline] " + std::string(plugin.name()) + "." + hook +
                      " threw a non-standard exception");
            return makeError(FabricErr::PluginFailure,
                             std::string(plugin.name()) + "." + hook + ": unknown exception");
        }
    }

}

void PluginPipeline::registerPlugin(PluginPtr plugin) {
    if (!plugin) return;
    std::unique_lock lock(mx_);
    if (std::find(plugins_.begin(), plugins_.end(), plugin) != plugins_.end()) return;
    LOG_DEBUG("[PluginPipeline] registered " + std::string(plugin->name()) +
              " (" + std::string(toString(plugin->type())) + ", priority " +
              std::to_string(plugin->priority()) + ")");
    plugins_.push_back(std::move(plugin));
}

bool PluginPipeline::unregisterPlugin(const PluginPtr& plugin) {
    std::unique_lock lock(mx_);
    auto it = std::find(plugins_.begin(), plugins_.end(), plugin);
    if (it == plugins_.end()) return false;
    plugins_.erase(it);
    return true;
}

size_t PluginPipeline::unregisterPlugin(std::string_view name) {
    std::unique_lock lock(mx_);
    auto before = plugins_.size();
    plugins_.erase(std::remove_if(plugins_.begin(), plugins_.end(),
                                  [&](const PluginPtr& p) { return name == p->name(); }),
                   plugins_.end());
    return before - plugins_.size();
}

std::vector<PluginPtr> PluginPipeline::snapshot(bool (*accept)(PluginType)) const {
    std::vector<PluginPtr> out;
    {
        std::shared_lock lock(mx_);
        for (const auto& p : plugins_)
            if (accept(p->type())) out.push_back(p);
    }
    std::stable_sort(out.begin(), out.end(), [](const PluginPtr& a, const PluginPtr& b) {
        return a->priority() > b->priority();
    });
    return out;
}

std::vector<PluginPtr> PluginPipeline::getPluginsByType(PluginType type) const {
    std::vector<PluginPtr> out;
    {
        std::shared_lock lock(mx_);
        std::copy_if(plugins_.begin(), plugins_.end(), std::back_inserter(out),
                     [type](const PluginPtr& p) { return p->type() == type; });
    }
    std::stable_sort(out.begin(), out.end(), [](const PluginPtr& a, const PluginPtr& b) {
        return a->priority() > b->priority();
    });
    return out;
}

std::vector<PluginPtr> PluginPipeline::plugins() const {
    std::shared_lock lock(mx_);
    return plugins_;
}

size_t PluginPipeline::size() const {
    std::shared_lock lock(mx_);
    return plugins_.size();
}

Result<Intent> PluginPipeline::runValidate(const Intent& intent) const {
    auto chain = snapshot([](PluginType t) { return t == PluginType::Validation; });

    Intent current = intent;
    for (const auto& p : chain) {
        auto r = guarded(*p, "validate", [&] { return p->validate(current); });
        if (!r) {
            LOG_DEBUG("[PluginPipeline] " + std::string(p->name()) + " rejected " +
                      intent.id() + ": " + r.error().reason);
            return r.error();
        }
        current = std::move(r).value();
    }
    return current;
}

Result<Intent> PluginPipeline::runTransform(const Intent& intent) const {
    auto chain = snapshot([](PluginType t) {
        return t == PluginType::Transformation || t == PluginType::Validation;
    });

    Intent current = intent;
    for (const auto& p : chain) {
        auto r = guarded(*p, "transform", [&] { return p->transform(current); });
        if (!r) return r.error();
        current = std::move(r).value();
    }
    return current;
}

Result<std::vector<std::string>> PluginPipeline::runRoute(const Intent& intent,
                                                          std::vector<std::string> candidates) const {
    auto chain = snapshot([](PluginType t) { return t == PluginType::Routing; });

    for (const auto& p : chain) {
        auto r = guarded(*p, "route", [&]() -> Result<std::vector<std::string>> {
            return p->route(intent, candidates);
        });
        if (!r) return r.error();
        candidates = std::move(r).value();
    }
    return candidates;
}

Result<std::vector<Intent>> PluginPipeline::runCompose(std::vector<Intent> intents,
                                                       std::string_view strategy) const {
    auto chain = snapshot([](PluginType t) { return t == PluginType::Composition; });

    for (const auto& p : chain) {
        auto r = guarded(*p, "compose", [&]() -> Result<std::vector<Intent>> {
            return p->compose(intents, strategy);
        });
        if (!r) return r.error();
        intents = std::move(r).value();
    }
    return intents;
}

}
