/**
 * @file iplugin.hpp
 * @brief Interface for intent pipeline plugins in IntentMesh.
 *
 * A plugin overrides only the hooks it cares about; every hook defaults to
 * pass-through identity. Plugins are registered into a PluginPipeline owned by
 * the caller, never into global state.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/types.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    /**
     * @class IIntentPlugin
     * @brief Hooks into validation, transformation, routing and composition.
     *
     * Hooks may throw; the pipeline converts exceptions to PluginFailure errors.
     */
    class IIntentPlugin {
    public:
        virtual ~IIntentPlugin() = default;

        /**
         * @brief Get the name of the plugin.
         * @return Name of the plugin as a C-string
         */
        virtual const char* name() const = 0;

        virtual PluginType type() const { return PluginType::Generic; }

        /**
         * @brief Higher runs first.
         */
        virtual int priority() const { return 0; }

        /**
         * @brief Accept (possibly normalized) or reject an intent.
         */
        virtual Result<Intent> validate(const Intent& intent) { return intent; }

        virtual Result<Intent> transform(const Intent& intent) { return intent; }

        /**
         * @brief Narrow or reorder the candidate target ids for @p intent.
         */
        virtual std::vector<std::string> route(const Intent& intent, std::vector<std::string> candidates) {
            (void)intent;
            return candidates;
        }

        /**
         * @brief Reorder or rewrite an intent list before a composition named @p strategy runs.
         */
        virtual std::vector<Intent> compose(std::vector<Intent> intents, std::string_view strategy) {
            (void)strategy;
            return intents;
        }
    };

}
