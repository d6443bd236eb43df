/**
 * @file icomponent.hpp
 * @brief Interfaces for dispatchable components and their optional health probe.
 *
 * A component is anything an intent can be delegated to. The fabric holds
 * components by weak reference; the registering collaborator owns them.
 */
#pragma once
#include <optional>
#include <stop_token>
#include <string>
#include <nlohmann/json.hpp>
#include "intentmesh/core/types.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    /**
     * @class IHealthProbe
     * @brief Optional health check a component may expose.
     *
     * Called from the discovery probe pool, bounded by the probe timeout.
     */
    class IHealthProbe {
    public:
        virtual ~IHealthProbe() = default;

        /**
         * @brief Report the component's current health.
         */
        virtual Health checkHealth() = 0;
    };

    /**
     * @class IComponent
     * @brief A registered unit that receives dispatched intents and produces effects.
     */
    class IComponent {
    public:
        virtual ~IComponent() = default;

        /**
         * @brief Identifying name of the handle, matched by DiscoveryPattern::name.
         */
        virtual std::string name() const = 0;

        /**
         * @brief Handle an intent and return its effect.
         * @param intent The (delegated) intent
         * @param stop Requested when the dispatch deadline passes
         * @return Effect value, or an Error
         */
        virtual Result<nlohmann::json> handle(const Intent& intent, std::stop_token stop) = 0;

        /**
         * @brief Liveness of the underlying handle, used when no probe is exposed.
         */
        virtual bool alive() const { return true; }

        /**
         * @brief Health probe, or nullptr to fall back to alive().
         */
        virtual IHealthProbe* healthProbe() { return nullptr; }

        /**
         * @brief Self-description consulted at registration.
         *
         * Fields left unset are derived by discovery (type from the name, version "1.0.0").
         */
        virtual ComponentMetadataPatch describe() const { return {}; }
    };

}
