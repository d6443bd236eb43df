/**
 * @file component_discovery.hpp
 * @brief ComponentDiscovery: live registry of dispatchable components.
 *
 * Answers scored, load-balanced lookup queries and caches health checks with
 * a TTL. All registry state (records, attribute index, health cache and
 * load-balancer counters) is owned by a single-worker mailbox; public calls
 * post work to it and block on the result. Health probes run outside the
 * mailbox on a separate probe pool, bounded by the probe timeout.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/capability/capability.hpp"
#include "intentmesh/core/interfaces/icomponent.hpp"
#include "intentmesh/core/types.hpp"
#include "intentmesh/core/util/result.hpp"
#include "intentmesh/core/util/thread_pool.hpp"
#include "intentmesh/core/util/time.hpp"

namespace intentmesh {

    /**
     * @struct DiscoveryOptions
     * @brief Runtime settings for ComponentDiscovery.
     */
    struct DiscoveryOptions {
        std::chrono::milliseconds healthCacheTtl{ 30'000 };        ///< Cache entry lifetime
        std::chrono::milliseconds healthProbeTimeout{ 30'000 };    ///< Bound on one IHealthProbe call
        std::optional<std::chrono::milliseconds> purgeInterval;    ///< Purge timer period, defaults to the TTL
        std::optional<uint64_t> rngSeed;                           ///< Seed for weighted/random selection
        size_t probeThreads{ 2 };                                  ///< Workers running health probes
        std::shared_ptr<const ActionGraph> actionGraph;            ///< Capability lattice, null for the standard one
    };

    /**
     * @struct DiscoveryPattern
     * @brief Lookup query. An unset field is a wildcard.
     */
    struct DiscoveryPattern {
        std::optional<std::string>              name;          ///< Substring of the handle name
        std::optional<std::string>              type;          ///< Exact type
        std::optional<std::vector<Capability>>  capabilities;  ///< Each must be implied by a provided one
        std::optional<std::string>              version;       ///< Exact version
        std::optional<Health>                   health;        ///< Exact current health
        std::optional<std::vector<std::string>> tags;          ///< All must be present

        static DiscoveryPattern any() { return {}; }
        static DiscoveryPattern ofType(std::string t) {
            DiscoveryPattern p;
            p.type = std::move(t);
            return p;
        }
    };

    /**
     * @struct ComponentRecord
     * @brief Registry entry. The handle is held weakly; the registrant owns the component.
     */
    struct ComponentRecord {
        std::string                    id;
        std::weak_ptr<IComponent>      handle;
        std::string                    handleName;
        ComponentMetadata              metadata;
        SystemClock::time_point        registeredAt;
    };

    /**
     * @struct ComponentMatch
     * @brief One scored result of a discovery query.
     */
    struct ComponentMatch {
        std::string                 id;
        std::shared_ptr<IComponent> component;   ///< Null if the handle has expired
        std::string                 handleName;
        ComponentMetadata           metadata;
        Health                      health{ Health::Unknown };
        double                      score{ 0.0 };
    };

    /**
     * @class ComponentDiscovery
     * @brief Registry, scorer, load balancer and health cache for components.
     */
    class ComponentDiscovery {
    public:
        explicit ComponentDiscovery(DiscoveryOptions opts = {});

        /**
         * @brief Stops the purge timer, then drains the mailbox and probe pool.
         */
        ~ComponentDiscovery();

        ComponentDiscovery(const ComponentDiscovery&) = delete;
        ComponentDiscovery& operator=(const ComponentDiscovery&) = delete;

        /* ---- registration ------------------------------------------------ */

        /**
         * @brief Register (or replace) a component.
         *
         * Metadata starts from defaults derived from the handle name, then the
         * handle's describe() patch, then @p overrides. Later layers win.
         * @return InvalidConfig if @p handle is null
         */
        Result<void> registerComponent(const std::string& id,
                                       std::shared_ptr<IComponent> handle,
                                       const ComponentMetadataPatch& overrides = {});

        /**
         * @brief Remove a component with its health-cache and load-balancer entries.
         * @return False if @p id was not registered
         */
        bool unregisterComponent(const std::string& id);

        /**
         * @brief Shallow-merge @p patch into the component's metadata.
         * @return ComponentNotRegistered for an unknown id
         */
        Result<void> updateComponentMetadata(const std::string& id, const ComponentMetadataPatch& patch);

        /**
         * @brief JSON form of updateComponentMetadata(). Unknown keys are ignored.
         */
        Result<void> updateComponentMetadata(const std::string& id, const nlohmann::json& partial);

        Result<ComponentMetadata> getComponentMetadata(const std::string& id);

        /**
         * @brief Registered ids, sorted.
         */
        std::vector<std::string> listComponents();

        bool contains(const std::string& id);

        /**
         * @brief Live handle for @p id, or nullptr if unknown or expired.
         */
        std::shared_ptr<IComponent> lookup(const std::string& id);

        /* ---- queries ----------------------------------------------------- */

        /**
         * @brief All components matching @p pattern, by descending score (ties by id).
         */
        std::vector<ComponentMatch> findComponents(const DiscoveryPattern& pattern);

        std::vector<ComponentMatch> findByCapabilities(const std::vector<Capability>& required);
        std::vector<ComponentMatch> findByType(const std::string& type);

        /**
         * @brief findComponents() restricted to healthy components.
         */
        std::vector<ComponentMatch> findHealthyComponents(const DiscoveryPattern& pattern = {});

        /**
         * @brief Match @p pattern and pick one result with @p strategy.
         * @return std::nullopt when nothing matches
         */
        std::optional<ComponentMatch> getBestMatch(const DiscoveryPattern& pattern,
                                                   LoadBalanceStrategy strategy = LoadBalanceStrategy::RoundRobin);

        /**
         * @brief As above; unknown strategy names fall back to round robin.
         */
        std::optional<ComponentMatch> getBestMatch(const DiscoveryPattern& pattern, std::string_view strategy);

        /**
         * @brief Apply the load balancer to a caller-filtered candidate list.
         * @return NoAvailableTargets when @p candidates is empty
         */
        Result<ComponentMatch> selectTarget(const std::vector<ComponentMatch>& candidates,
                                            LoadBalanceStrategy strategy);

        /**
         * @brief Decrement the least-connections counter of @p id after a dispatch completes.
         */
        void releaseConnection(const std::string& id);

        /**
         * @brief Recorded least-connections counter of @p id (0 if none).
         */
        uint64_t connectionCount(const std::string& id);

        /* ---- health ------------------------------------------------------ */

        /**
         * @brief Cached health, re-probed when the entry is missing or older than the TTL.
         *
         * Unknown ids yield Health::Unknown.
         */
        Health getComponentHealth(const std::string& id);

        /**
         * @brief Probe every component and swap in the new cache as one snapshot.
         */
        void refreshHealthCache();

        /**
         * @brief Drop cache entries older than the TTL. Run periodically by the purge timer.
         * @return Number of entries dropped
         */
        size_t purgeExpiredHealth();

        size_t healthCacheSize();

        /**
         * @brief Score of a component against a pattern.
         *
         * 1.0 base, +0.5 type match, +1.0/-0.5 capability filter satisfied/unsatisfied,
         * health bonus, plus major*0.1 + minor*0.01 + patch*0.001.
         */
        static double score(const ComponentMetadata& metadata, Health health,
                            const DiscoveryPattern& pattern,
                            const ActionGraph& graph = ActionGraph::standard());

        /**
         * @brief Type derived from a handle name ("FileReactor" -> "reactor", otherwise "generic").
         */
        static std::string typeFromName(std::string_view handleName);

        const DiscoveryOptions& options() const { return opts_; }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        DiscoveryOptions opts_;

        ThreadPool mailbox_{ 1, "ComponentDiscovery" };
        ThreadPool probePool_;
        std::jthread purgeThread_;

        template <typename F>
        auto serialized(F&& work) -> decltype(work());

        Health probe(const std::string& id, const std::shared_ptr<IComponent>& component);
        std::vector<ComponentMatch> withHealth(std::vector<ComponentMatch> candidates);
        void startPurgeTimer();
    };

}
