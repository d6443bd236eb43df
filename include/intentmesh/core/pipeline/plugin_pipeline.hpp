/**
 * @file plugin_pipeline.hpp
 * @brief Ordered, typed plugin chain for validation, transformation, routing and composition.
 *
 * Plugins run in descending priority; ties keep registration order. Each run
 * takes a snapshot of the registered plugins, so hooks may register or
 * unregister plugins without deadlocking. Exceptions thrown by a hook never
 * leave the pipeline: they become PluginFailure errors.
 */
#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include "intentmesh/core/interfaces/iplugin.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    using PluginPtr = std::shared_ptr<IIntentPlugin>;

    /**
     * @class PluginPipeline
     * @brief Plugin registry and hook runner owned by one execution context.
     */
    class PluginPipeline {
    public:
        /**
         * @brief Add a plugin. Registering the same instance twice is a no-op.
         * @param plugin Plugin instance (ignored if null)
         */
        void registerPlugin(PluginPtr plugin);

        /**
         * @brief Remove a plugin by identity.
         * @return True if it was registered
         */
        bool unregisterPlugin(const PluginPtr& plugin);

        /**
         * @brief Remove every plugin whose name() equals @p name.
         * @return Number of plugins removed
         */
        size_t unregisterPlugin(std::string_view name);

        /**
         * @brief Plugins of @p type, highest priority first.
         */
        std::vector<PluginPtr> getPluginsByType(PluginType type) const;

        /**
         * @brief All plugins in registration order.
         */
        std::vector<PluginPtr> plugins() const;

        size_t size() const;

        /**
         * @brief Thread @p intent through every validation plugin's validate hook.
         *
         * Stops at the first error and returns it unchanged.
         */
        Result<Intent> runValidate(const Intent& intent) const;

        /**
         * @brief Thread @p intent through the transform hook of transformation
         * and validation plugins, in one priority order.
         */
        Result<Intent> runTransform(const Intent& intent) const;

        /**
         * @brief Thread candidate target ids through routing plugins.
         */
        Result<std::vector<std::string>> runRoute(const Intent& intent,
                                                  std::vector<std::string> candidates) const;

        /**
         * @brief Thread an intent list through composition plugins.
         * @param strategy Name of the composition about to run
         */
        Result<std::vector<Intent>> runCompose(std::vector<Intent> intents,
                                               std::string_view strategy) const;

    private:
        std::vector<PluginPtr> snapshot(bool (*accept)(PluginType)) const;

        std::vector<PluginPtr> plugins_;
        mutable std::shared_mutex mx_;
    };

}
