#include "intentmesh/core/options.hpp"
#include <fstream>

namespace intentmesh {

namespace {

    using json = nlohmann::json;

    Error invalid(const std::string& reason) {
        LOG_ERROR("[Options] " + reason);
        return makeError(FabricErr::InvalidConfig, reason);
    }

    Result<void> readMs(const json& obj, const std::string& section, const char* key,
                        std::chrono::milliseconds& out) {
        auto it = obj.find(key);
        if (it == obj.end()) return {};
        if (!it->is_number_integer())
            return invalid(section + "." + key + " must be an integer number of milliseconds");
        auto v = it->get<int64_t>();
        if (v < 0)
            return invalid(section + "." + key + " must not be negative");
        out = std::chrono::milliseconds(v);
        return {};
    }

    template <typename T>
    Result<void> readCount(const json& obj, const std::string& section, const char* key, T& out) {
        auto it = obj.find(key);
        if (it == obj.end()) return {};
        if (!it->is_number_integer() || it->get<int64_t>() < 0)
            return invalid(section + "." + key + " must be a non-negative integer");
        out = static_cast<T>(it->get<uint64_t>());
        return {};
    }

    Result<void> readBool(const json& obj, const std::string& section, const char* key, bool& out) {
        auto it = obj.find(key);
        if (it == obj.end()) return {};
        if (!it->is_boolean())
            return invalid(section + "." + key + " must be a boolean");
        out = it->get<bool>();
        return {};
    }

    Result<std::string> readString(const json& obj, const std::string& section, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end()) return std::string{};
        if (!it->is_string())
            return invalid(section + "." + key + " must be a string");
        return it->get<std::string>();
    }

    Result<const json*> section(const json& doc, const char* key) {
        auto it = doc.find(key);
        if (it == doc.end()) return static_cast<const json*>(nullptr);
        if (!it->is_object())
            return invalid(std::string(key) + " must be an object");
        return &*it;
    }

    Result<void> parseDiscovery(const json& s, DiscoveryOptions& o) {
        const std::string name = "discovery";
        if (auto r = readMs(s, name, "health_cache_ttl_ms", o.healthCacheTtl); !r) return r;
        if (auto r = readMs(s, name, "health_probe_timeout_ms", o.healthProbeTimeout); !r) return r;
        if (s.contains("purge_interval_ms")) {
            std::chrono::milliseconds purge{ 0 };
            if (auto r = readMs(s, name, "purge_interval_ms", purge); !r) return r;
            o.purgeInterval = purge;
        }
        if (s.contains("rng_seed")) {
            uint64_t seed = 0;
            if (auto r = readCount(s, name, "rng_seed", seed); !r) return r;
            o.rngSeed = seed;
        }
        if (auto r = readCount(s, name, "probe_threads", o.probeThreads); !r) return r;
        return {};
    }

    Result<void> parseRouter(const json& s, RouterOptions& o, size_t& branchThreads) {
        const std::string name = "router";
        if (auto r = readMs(s, name, "dispatch_timeout_ms", o.dispatchTimeout); !r) return r;
        if (auto r = readCount(s, name, "dispatch_threads", o.dispatchThreads); !r) return r;
        if (auto r = readCount(s, name, "branch_threads", branchThreads); !r) return r;

        auto lb = readString(s, name, "load_balancing");
        if (!lb) return lb.error();
        if (!lb.value().empty()) {
            if (!isKnownLoadBalanceStrategy(lb.value()))
                return invalid("router.load_balancing: unknown strategy '" + lb.value() + "'");
            o.loadBalancing = parseLoadBalanceStrategy(lb.value());
        }

        auto cls = readString(s, name, "default_class");
        if (!cls) return cls.error();
        if (!cls.value().empty()) o.defaultClass = cls.value();
        return {};
    }

    Result<void> parseRetry(const json& s, RetryOptions& o) {
        const std::string name = "retry";
        if (auto r = readCount(s, name, "max_retries", o.maxRetries); !r) return r;
        if (auto r = readMs(s, name, "retry_delay_ms", o.retryDelay); !r) return r;
        if (auto r = readBool(s, name, "exponential_backoff", o.exponentialBackoff); !r) return r;
        if (auto r = readMs(s, name, "max_delay_ms", o.maxDelay); !r) return r;

        auto strategy = readString(s, name, "strategy");
        if (!strategy) return strategy.error();
        if (!strategy.value().empty()) {
            auto parsed = parseStrategy(strategy.value());
            if (!parsed)
                return invalid("retry.strategy: unknown composition strategy '" + strategy.value() + "'");
            o.strategy = *parsed;
        }
        return {};
    }

}

Result<FabricOptions> parseOptions(const nlohmann::json& doc) {
    if (!doc.is_object())
        return invalid("configuration must be a JSON object");

    FabricOptions opts;

    auto disc = section(doc, "discovery");
    if (!disc) return disc.error();
    if (disc.value())
        if (auto r = parseDiscovery(*disc.value(), opts.discovery); !r) return r.error();

    auto router = section(doc, "router");
    if (!router) return router.error();
    if (router.value())
        if (auto r = parseRouter(*router.value(), opts.router, opts.branchThreads); !r) return r.error();

    auto retry = section(doc, "retry");
    if (!retry) return retry.error();
    if (retry.value())
        if (auto r = parseRetry(*retry.value(), opts.retry); !r) return r.error();

    if (opts.retry.maxDelay < opts.retry.retryDelay)
        return invalid("retry.max_delay_ms must be >= retry.retry_delay_ms");

    if (auto it = doc.find("log_level"); it != doc.end()) {
        if (!it->is_string())
            return invalid("log_level must be a string");
        auto lvl = parseLogLevel(it->get<std::string>());
        if (!lvl)
            return invalid("log_level: unknown level '" + it->get<std::string>() + "'");
        opts.logLevel = *lvl;
    }
    return opts;
}

Result<FabricOptions> loadOptions(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        return invalid("cannot open configuration file " + path);

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded())
        return invalid("configuration file " + path + " is not valid JSON");
    return parseOptions(doc);
}

}
