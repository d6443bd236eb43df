/**
 * @file intent_router.hpp
 * @brief IntentRouter: target resolution, delegation and bounded dispatch.
 *
 * An intent is classified by an ordered table of (predicate, class) rules.
 * Each class maps to a discovery pattern; the matching components are
 * narrowed by routing plugins and one is picked by the load balancer.
 * Dispatch runs the target's handler on the router's own pool and waits at
 * most the dispatch timeout. A timed-out dispatch requests stop on the
 * handler's stop_token and reports FabricErr::Timeout; a late result is
 * discarded. A least-connections slot taken while routing is given back
 * once the handler returns, not when the caller stops waiting.
 */
#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/discovery/component_discovery.hpp"
#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/core/types.hpp"
#include "intentmesh/core/util/result.hpp"
#include "intentmesh/core/util/thread_pool.hpp"

namespace intentmesh {

    /**
     * @struct RouteRule
     * @brief One row of the routing table.
     */
    struct RouteRule {
        std::string                        name;
        std::function<bool(const Intent&)> predicate;
        std::string                        targetClass;
    };

    /**
     * @brief Rule matching intents whose type contains @p needle.
     */
    RouteRule typeContains(std::string needle, std::string targetClass);

    /**
     * @brief File -> "file", User -> "user", composite intents -> "composite".
     */
    std::vector<RouteRule> defaultRoutes();

    /**
     * @struct RouterOptions
     * @brief Runtime settings for IntentRouter.
     */
    struct RouterOptions {
        std::chrono::milliseconds dispatchTimeout{ 5'000 };
        size_t                    dispatchThreads{ 0 };                          ///< 0 = hardware concurrency
        LoadBalanceStrategy       loadBalancing{ LoadBalanceStrategy::RoundRobin };
        std::vector<RouteRule>    routes = defaultRoutes();
        std::string               defaultClass{ "default" };
        /// Pattern per class; a class without an entry matches `type == class`.
        std::map<std::string, DiscoveryPattern> classPatterns;
    };

    /**
     * @struct Outcome
     * @brief Result of processing one intent: the target reached and its effect.
     */
    struct Outcome {
        std::string            intentId;
        std::string            target;     ///< Empty if no target was resolved
        Result<nlohmann::json> effect;

        bool ok() const { return effect.has_value(); }

        /**
         * @brief `{intent_id, target, status, effect}` or `{..., status: "error", error, reason}`.
         */
        nlohmann::json toJson() const;
    };

    /**
     * @class IntentRouter
     * @brief Resolves, delegates and dispatches single intents.
     */
    class IntentRouter {
    public:
        IntentRouter(ComponentDiscovery& discovery, const PluginPipeline& pipeline, RouterOptions opts = {});
        ~IntentRouter();

        IntentRouter(const IntentRouter&) = delete;
        IntentRouter& operator=(const IntentRouter&) = delete;

        /**
         * @brief Route class of @p intent: the first matching rule, else the default class.
         */
        std::string classify(const Intent& intent) const;

        /**
         * @brief Discovery pattern used for @p targetClass.
         */
        DiscoveryPattern patternFor(const std::string& targetClass) const;

        /**
         * @brief Candidate targets for @p intent after routing plugins, best first.
         *
         * Falls back to the default class when the intent's class has no match.
         * @return NoRoute when nothing is left
         */
        Result<std::vector<ComponentMatch>> resolveTargets(const Intent& intent);

        /**
         * @brief Resolve one concrete target id with the configured load balancer.
         *
         * Under least_connections the pick takes a slot on the target; the
         * caller gives it back with ComponentDiscovery::releaseConnection.
         * @return NoRoute when no target can be resolved
         */
        Result<std::string> routeIntent(const Intent& intent);

        /**
         * @brief Copy of @p intent with `metadata.delegated_to = targetId`.
         * @return TargetProcessorNotFound if @p targetId is not registered
         */
        Result<Intent> delegateIntent(const Intent& intent, const std::string& targetId);

        /**
         * @brief Send a delegated intent to its `delegated_to` target and await the effect.
         *
         * Leaves load-balancer slots untouched.
         * @return Timeout after the dispatch deadline, TargetProcessorNotFound if the
         *         target is gone, or the handler's own error
         */
        Result<nlohmann::json> dispatch(const Intent& delegated);

        Result<Intent> validateIntent(const Intent& intent) const;
        Result<Intent> transformIntent(const Intent& intent) const;

        /**
         * @brief validate -> transform -> route -> delegate -> dispatch.
         */
        Outcome process(const Intent& intent);

        /**
         * @brief As process(), with the target given instead of routed.
         */
        Outcome processTo(const Intent& intent, const std::string& targetId);

        const RouterOptions& options() const { return opts_; }

    private:
        Result<Intent> prepare(const Intent& intent) const;
        Outcome deliver(const Intent& prepared, const std::string& originalId,
                        const std::string& targetId, bool heldSlot);
        Result<nlohmann::json> send(const Intent& delegated, bool heldSlot);
        bool takesSlot() const { return opts_.loadBalancing == LoadBalanceStrategy::LeastConnections; }
        std::vector<ComponentMatch> candidatesFor(const std::string& targetClass);

        ComponentDiscovery&   discovery_;
        const PluginPipeline& pipeline_;
        RouterOptions         opts_;
        ThreadPool            pool_;
    };

}
