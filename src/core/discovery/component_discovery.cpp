#include "intentmesh/core/discovery/component_discovery.hpp"
#include "internal/core/discovery/attribute_index.hpp"
#include "intentmesh/core/util/logger.hpp"
#include "intentmesh/core/util/time.hpp"
#include <algorithm>
#include <charconv>
#include <condition_variable>
#include <future>
#include <mutex>
#include <ankerl/unordered_dense.h>

namespace intentmesh {

namespace {

    struct HealthEntry {
        Health                  health{ Health::Unknown };
        SteadyClock::time_point at;
    };

    struct Candidate {
        ComponentMatch match;
        bool           fresh{ false };   // health taken from a live cache entry
    };

    double healthBonus(Health h) {
        switch (h) {
        case Health::Healthy:   return 0.3;
        case Health::Degraded:  return 0.0;
        case Health::Unhealthy: return -1.0;
        case Health::Unknown:   return -0.2;
        }
        return -0.2;
    }

    double versionBonus(std::string_view version) {
        int parts[3]{ 0, 0, 0 };
        const char* p = version.data();
        const char* end = version.data() + version.size();
        for (int i = 0; i < 3 && p < end; ++i) {
            auto [next, ec] = std::from_chars(p, end, parts[i]);
            if (ec != std::errc{}) return 0.0;
            p = next;
            if (p < end && *p == '.') ++p;
            else break;
        }
        return parts[0] * 0.1 + parts[1] * 0.01 + parts[2] * 0.001;
    }

    bool hasAllTags(const std::vector<std::string>& have, const std::vector<std::string>& want) {
        return std::all_of(want.begin(), want.end(), [&](const std::string& t) {
            return std::find(have.begin(), have.end(), t) != have.end();
        });
    }

}

/*──────────── state owned by the mailbox ───────────*/
struct ComponentDiscovery::Impl {
    ankerl::unordered_dense::map<std::string, ComponentRecord> records;
    AttributeIndex                                             index;
    ankerl::unordered_dense::map<std::string, HealthEntry>     health;
    ankerl::unordered_dense::map<std::string, uint64_t>        connections;
    uint64_t                                                   rrCounter{ 0 };
    std::mt19937_64                                            rng;
    const ActionGraph*                                         graph{ &ActionGraph::standard() };
    std::chrono::milliseconds                                  ttl{ 30'000 };

    void reindex(const ComponentRecord& rec) {
        index.set(rec.id, "type", { rec.metadata.type });
        index.set(rec.id, "tag", rec.metadata.tags);
    }

    void forget(const std::string& id) {
        records.erase(id);
        index.remove(id);
        health.erase(id);
        connections.erase(id);
    }

    std::optional<Health> cached(const std::string& id, SteadyClock::time_point now) const {
        auto it = health.find(id);
        if (it == health.end()) return std::nullopt;
        if (now - it->second.at >= ttl) return std::nullopt;
        return it->second.health;
    }

    bool matches(const ComponentRecord& rec, const DiscoveryPattern& p) const {
        const auto& md = rec.metadata;
        if (p.name && rec.handleName.find(*p.name) == std::string::npos) return false;
        if (p.type && md.type != *p.type) return false;
        if (p.version && md.version != *p.version) return false;
        if (p.capabilities && !validateCapabilities(*p.capabilities, md.capabilities, *graph)) return false;
        if (p.tags && !hasAllTags(md.tags, *p.tags)) return false;
        return true;
    }

    std::vector<Candidate> collect(const DiscoveryPattern& p, SteadyClock::time_point now) const {
        std::vector<const ComponentRecord*> pool;

        if (p.type || (p.tags && !p.tags->empty())) {
            std::optional<AttributeIndex::IdSet> ids;
            if (p.type) {
                const AttributeIndex::IdSet* byType = index.find("type", *p.type);
                ids = byType ? *byType : AttributeIndex::IdSet{};
            }
            if (p.tags && !p.tags->empty()) {
                auto byTags = index.findAll("tag", *p.tags);
                if (!ids) {
                    ids = std::move(byTags);
                }
                else {
                    AttributeIndex::IdSet both;
                    for (const auto& id : *ids)
                        if (byTags.contains(id)) both.insert(id);
                    ids = std::move(both);
                }
            }
            for (const auto& id : *ids)
                if (auto it = records.find(id); it != records.end()) pool.push_back(&it->second);
        }
        else {
            for (const auto& [id, rec] : records) pool.push_back(&rec);
        }

        std::vector<Candidate> out;
        for (const ComponentRecord* rec : pool) {
            if (!matches(*rec, p)) continue;
            Candidate c;
            c.match.id = rec->id;
            c.match.component = rec->handle.lock();
            c.match.handleName = rec->handleName;
            c.match.metadata = rec->metadata;
            if (auto h = cached(rec->id, now)) {
                c.match.health = *h;
                c.fresh = true;
            }
            out.push_back(std::move(c));
        }
        return out;
    }

    size_t select(const std::vector<ComponentMatch>& cands, LoadBalanceStrategy strategy) {
        const size_t n = cands.size();
        switch (strategy) {
        case LoadBalanceStrategy::LeastConnections: {
            size_t best = 0;
            uint64_t bestCount = UINT64_MAX;
            for (size_t i = 0; i < n; ++i) {
                auto it = connections.find(cands[i].id);
                uint64_t count = it == connections.end() ? 0 : it->second;
                if (count < bestCount) {
                    best = i;
                    bestCount = count;
                }
            }
            ++connections[cands[best].id];
            return best;
        }
        case LoadBalanceStrategy::WeightedRoundRobin: {
            double total = 0.0;
            for (const auto& c : cands) total += std::max(c.score, 0.0);
            if (total <= 0.0) {
                std::uniform_int_distribution<size_t> pick(0, n - 1);
                return pick(rng);
            }
            std::uniform_real_distribution<double> dist(0.0, total);
            double point = dist(rng);
            for (size_t i = 0; i < n; ++i) {
                point -= std::max(cands[i].score, 0.0);
                if (point < 0.0) return i;
            }
            return n - 1;
        }
        case LoadBalanceStrategy::Random: {
            std::uniform_int_distribution<size_t> pick(0, n - 1);
            return pick(rng);
        }
        case LoadBalanceStrategy::RoundRobin:
            break;
        }
        return static_cast<size_t>(rrCounter++ % n);
    }

    size_t purge(SteadyClock::time_point now) {
        std::vector<std::string> stale;
        for (const auto& [id, entry] : health)
            if (now - entry.at >= ttl) stale.push_back(id);
        for (const auto& id : stale) health.erase(id);
        return stale.size();
    }
};

/*──────────── construction ───────────*/
ComponentDiscovery::ComponentDiscovery(DiscoveryOptions opts)
    : impl_(std::make_unique<Impl>()),
      opts_(std::move(opts)),
      probePool_(opts_.probeThreads == 0 ? 1 : opts_.probeThreads, "HealthProbe") {
    impl_->ttl = opts_.healthCacheTtl;
    if (opts_.actionGraph) impl_->graph = opts_.actionGraph.get();
    impl_->rng.seed(opts_.rngSeed.value_or(std::random_device{}()));
    startPurgeTimer();
}

ComponentDiscovery::~ComponentDiscovery() {
    if (purgeThread_.joinable()) {
        purgeThread_.request_stop();
        purgeThread_.join();
    }
    probePool_.join();
    mailbox_.join();
}

template <typename F>
auto ComponentDiscovery::serialized(F&& work) -> decltype(work()) {
    if (mailbox_.isWorkerThread()) return work();
    return mailbox_.add(std::forward<F>(work)).get();
}

void ComponentDiscovery::startPurgeTimer() {
    auto interval = opts_.purgeInterval.value_or(opts_.healthCacheTtl);
    if (interval.count() <= 0) return;

    purgeThread_ = std::jthread([this, interval](std::stop_token stoken) {
        std::mutex m;
        std::condition_variable_any cv;
        while (!stoken.stop_requested()) {
            {
                std::unique_lock lk(m);
                if (cv.wait_for(lk, stoken, interval, [&] { return stoken.stop_requested(); }))
                    break;
            }
            try {
                mailbox_.post([this] {
                    size_t n = impl_->purge(SteadyClock::now());
                    if (n > 0)
                        LOG_DEBUG("[ComponentDiscovery] purged " + std::to_string(n) + " stale health entries");
                });
            }
            catch (const std::runtime_error& ex) {
                LOG_DEBUG("[ComponentDiscovery] purge timer stopping: " + std::string(ex.what()));
                break;
            }
        }
    });
}

/*──────────── registration ───────────*/
std::string ComponentDiscovery::typeFromName(std::string_view handleName) {
    static const std::pair<const char*, const char*> rules[]{
        { "Reactor",    "reactor" },
        { "Capability", "capability" },
        { "Context",    "context" },
        { "Intent",     "intent" },
        { "Stream",     "stream" },
        { "Temporal",   "temporal" },
        { "Web",        "web" },
    };
    for (const auto& [needle, type] : rules)
        if (handleName.find(needle) != std::string_view::npos) return type;
    return "generic";
}

Result<void> ComponentDiscovery::registerComponent(const std::string& id,
                                                   std::shared_ptr<IComponent> handle,
                                                   const ComponentMetadataPatch& overrides) {
    if (!handle)
        return makeError(FabricErr::InvalidConfig, "component handle for '" + id + "' is null");

    ComponentRecord rec;
    rec.id = id;
    rec.handle = handle;
    rec.registeredAt = SystemClock::now();

    try {
        rec.handleName = handle->name();
        rec.metadata.type = typeFromName(rec.handleName);
        handle->describe().applyTo(rec.metadata);
    }
    catch (const std::exception& ex) {
        LOG_WARN("[ComponentDiscovery] introspection of '" + id + "' failed: " + std::string(ex.what()));
    }
    overrides.applyTo(rec.metadata);

    serialized([&] {
        bool replaced = impl_->records.contains(id);
        impl_->forget(id);
        impl_->reindex(rec);
        impl_->records.insert_or_assign(id, rec);
        LOG_INFO("[ComponentDiscovery] " + std::string(replaced ? "re-registered " : "registered ") +
                 id + " (type " + rec.metadata.type + ", version " + rec.metadata.version + ")");
    });
    return {};
}

bool ComponentDiscovery::unregisterComponent(const std::string& id) {
    return serialized([&] {
        if (!impl_->records.contains(id)) return false;
        impl_->forget(id);
        LOG_INFO("[ComponentDiscovery] unregistered " + id);
        return true;
    });
}

Result<void> ComponentDiscovery::updateComponentMetadata(const std::string& id,
                                                         const ComponentMetadataPatch& patch) {
    return serialized([&]() -> Result<void> {
        auto it = impl_->records.find(id);
        if (it == impl_->records.end())
            return makeError(FabricErr::ComponentNotRegistered, id);
        patch.applyTo(it->second.metadata);
        impl_->reindex(it->second);
        LOG_INFO("[ComponentDiscovery] updated metadata of " + id);
        return {};
    });
}

Result<void> ComponentDiscovery::updateComponentMetadata(const std::string& id, const nlohmann::json& partial) {
    auto patch = ComponentMetadataPatch::fromJson(partial);
    if (!patch) return patch.error();
    return updateComponentMetadata(id, patch.value());
}

Result<ComponentMetadata> ComponentDiscovery::getComponentMetadata(const std::string& id) {
    return serialized([&]() -> Result<ComponentMetadata> {
        auto it = impl_->records.find(id);
        if (it == impl_->records.end())
            return makeError(FabricErr::NotFound, id);
        return it->second.metadata;
    });
}

std::vector<std::string> ComponentDiscovery::listComponents() {
    auto ids = serialized([&] {
        std::vector<std::string> out;
        out.reserve(impl_->records.size());
        for (const auto& [id, rec] : impl_->records) out.push_back(id);
        return out;
    });
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool ComponentDiscovery::contains(const std::string& id) {
    return serialized([&] { return impl_->records.contains(id); });
}

std::shared_ptr<IComponent> ComponentDiscovery::lookup(const std::string& id) {
    return serialized([&]() -> std::shared_ptr<IComponent> {
        auto it = impl_->records.find(id);
        if (it == impl_->records.end()) return nullptr;
        return it->second.handle.lock();
    });
}

/*──────────── health ───────────*/
Health ComponentDiscovery::probe(const std::string& id, const std::shared_ptr<IComponent>& component) {
    if (!component) return Health::Unhealthy;   // handle expired

    try {
        IHealthProbe* hp = component->healthProbe();
        if (!hp) return component->alive() ? Health::Healthy : Health::Unhealthy;

        auto fut = probePool_.add([component, hp] { return hp->checkHealth(); });
        if (fut.wait_for(opts_.healthProbeTimeout) != std::future_status::ready) {
            LOG_WARN("[ComponentDiscovery] health probe of " + id + " timed out");
            return Health::Unknown;
        }
        return fut.get();
    }
    catch (const std::exception& ex) {
        LOG_WARN("[ComponentDiscovery] health probe of " + id + " failed: " + std::string(ex.what()));
        return Health::Unknown;
    }
}

std::vector<ComponentMatch> ComponentDiscovery::withHealth(std::vector<ComponentMatch> candidates) {
    std::vector<std::pair<std::string, Health>> fresh;
    fresh.reserve(candidates.size());
    for (auto& c : candidates) {
        c.health = probe(c.id, c.component);
        fresh.emplace_back(c.id, c.health);
    }

    auto now = SteadyClock::now();
    serialized([&] {
        for (const auto& [id, h] : fresh)
            if (impl_->records.contains(id)) impl_->health[id] = HealthEntry{ h, now };
    });
    return candidates;
}

Health ComponentDiscovery::getComponentHealth(const std::string& id) {
    auto snap = serialized([&]() -> std::optional<Candidate> {
        auto it = impl_->records.find(id);
        if (it == impl_->records.end()) return std::nullopt;
        Candidate c;
        c.match.id = id;
        c.match.component = it->second.handle.lock();
        if (auto h = impl_->cached(id, SteadyClock::now())) {
            c.match.health = *h;
            c.fresh = true;
        }
        return c;
    });

    if (!snap) return Health::Unknown;
    if (snap->fresh) return snap->match.health;
    return withHealth({ std::move(snap->match) }).front().health;
}

void ComponentDiscovery::refreshHealthCache() {
    auto all = serialized([&] {
        std::vector<std::pair<std::string, std::shared_ptr<IComponent>>> out;
        for (const auto& [id, rec] : impl_->records) out.emplace_back(id, rec.handle.lock());
        return out;
    });

    ankerl::unordered_dense::map<std::string, HealthEntry> snapshot;
    for (const auto& [id, component] : all)
        snapshot[id] = HealthEntry{ probe(id, component), SteadyClock::now() };

    serialized([&] {
        std::vector<std::string> gone;
        for (const auto& [id, entry] : snapshot)
            if (!impl_->records.contains(id)) gone.push_back(id);
        for (const auto& id : gone) snapshot.erase(id);
        impl_->health = std::move(snapshot);
    });
    LOG_DEBUG("[ComponentDiscovery] health cache refreshed (" + std::to_string(all.size()) + " components)");
}

size_t ComponentDiscovery::purgeExpiredHealth() {
    return serialized([&] { return impl_->purge(SteadyClock::now()); });
}

size_t ComponentDiscovery::healthCacheSize() {
    return serialized([&] { return impl_->health.size(); });
}

/*──────────── queries ───────────*/
double ComponentDiscovery::score(const ComponentMetadata& md, Health health,
                                 const DiscoveryPattern& p, const ActionGraph& graph) {
    double s = 1.0;
    if (p.type && md.type == *p.type) s += 0.5;
    if (p.capabilities)
        s += validateCapabilities(*p.capabilities, md.capabilities, graph) ? 1.0 : -0.5;
    s += healthBonus(health);
    s += versionBonus(md.version);
    return s;
}

std::vector<ComponentMatch> ComponentDiscovery::findComponents(const DiscoveryPattern& pattern) {
    auto candidates = serialized([&] { return impl_->collect(pattern, SteadyClock::now()); });

    std::vector<ComponentMatch> cached;
    std::vector<ComponentMatch> stale;
    for (auto& c : candidates)
        (c.fresh ? cached : stale).push_back(std::move(c.match));
    if (!stale.empty()) {
        auto probed = withHealth(std::move(stale));
        std::move(probed.begin(), probed.end(), std::back_inserter(cached));
    }

    const ActionGraph& graph = opts_.actionGraph ? *opts_.actionGraph : ActionGraph::standard();
    std::vector<ComponentMatch> out;
    for (auto& m : cached) {
        if (pattern.health && m.health != *pattern.health) continue;
        m.score = score(m.metadata, m.health, pattern, graph);
        out.push_back(std::move(m));
    }
    std::sort(out.begin(), out.end(), [](const ComponentMatch& a, const ComponentMatch& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    return out;
}

std::vector<ComponentMatch> ComponentDiscovery::findByCapabilities(const std::vector<Capability>& required) {
    DiscoveryPattern p;
    p.capabilities = required;
    return findComponents(p);
}

std::vector<ComponentMatch> ComponentDiscovery::findByType(const std::string& type) {
    return findComponents(DiscoveryPattern::ofType(type));
}

std::vector<ComponentMatch> ComponentDiscovery::findHealthyComponents(const DiscoveryPattern& pattern) {
    DiscoveryPattern p = pattern;
    p.health = Health::Healthy;
    return findComponents(p);
}

Result<ComponentMatch> ComponentDiscovery::selectTarget(const std::vector<ComponentMatch>& candidates,
                                                        LoadBalanceStrategy strategy) {
    if (candidates.empty())
        return makeError(FabricErr::NoAvailableTargets);
    size_t idx = serialized([&] { return impl_->select(candidates, strategy); });
    return candidates[idx];
}

std::optional<ComponentMatch> ComponentDiscovery::getBestMatch(const DiscoveryPattern& pattern,
                                                               LoadBalanceStrategy strategy) {
    auto matches = findComponents(pattern);
    auto picked = selectTarget(matches, strategy);
    if (!picked) return std::nullopt;
    return std::move(picked).value();
}

std::optional<ComponentMatch> ComponentDiscovery::getBestMatch(const DiscoveryPattern& pattern,
                                                               std::string_view strategy) {
    return getBestMatch(pattern, parseLoadBalanceStrategy(strategy));
}

void ComponentDiscovery::releaseConnection(const std::string& id) {
    serialized([&] {
        auto it = impl_->connections.find(id);
        if (it != impl_->connections.end() && it->second > 0) --it->second;
    });
}

uint64_t ComponentDiscovery::connectionCount(const std::string& id) {
    return serialized([&]() -> uint64_t {
        auto it = impl_->connections.find(id);
        return it == impl_->connections.end() ? 0 : it->second;
    });
}

}
