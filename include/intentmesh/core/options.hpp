/**
 * @file options.hpp
 * @brief FabricOptions and its JSON configuration loader.
 *
 * Configuration document (every key optional, durations in milliseconds):
 * @code{.json}
 * {
 *   "discovery": { "health_cache_ttl_ms": 30000, "health_probe_timeout_ms": 30000,
 *                  "purge_interval_ms": 30000, "rng_seed": 42, "probe_threads": 2 },
 *   "router":    { "dispatch_timeout_ms": 5000, "dispatch_threads": 0, "branch_threads": 0,
 *                  "load_balancing": "round_robin", "default_class": "default" },
 *   "retry":     { "max_retries": 3, "retry_delay_ms": 1000, "exponential_backoff": true,
 *                  "max_delay_ms": 10000, "strategy": "sequential" },
 *   "log_level": "info"
 * }
 * @endcode
 * Unknown keys are ignored.
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "intentmesh/core/discovery/component_discovery.hpp"
#include "intentmesh/core/router/intent_composer.hpp"
#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/core/util/logger.hpp"
#include "intentmesh/core/util/result.hpp"

namespace intentmesh {

    /**
     * @struct FabricOptions
     * @brief Settings for every service owned by a Fabric.
     */
    struct FabricOptions {
        DiscoveryOptions discovery;
        RouterOptions    router;
        RetryOptions     retry;
        size_t           branchThreads{ 0 };        ///< Composer workers, 0 = hardware concurrency
        std::optional<LogLevel> logLevel;           ///< Process-wide Logger level; unset leaves it alone
    };

    /**
     * @brief Build options from a JSON document, starting from the defaults.
     * @return InvalidConfig naming the offending key on failure
     */
    Result<FabricOptions> parseOptions(const nlohmann::json& doc);

    /**
     * @brief Read a JSON file and pass it to parseOptions().
     * @return InvalidConfig if the file cannot be read or parsed
     */
    Result<FabricOptions> loadOptions(const std::string& path);

}
