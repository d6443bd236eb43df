#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "intentmesh/intentmesh.hpp"

namespace intentmesh::test {

    /*
     * Component whose handler, health and metadata are set by the test.
     * Counts calls so tests can observe how often it was reached.
     */
    class StubComponent : public IComponent, public IHealthProbe {
    public:
        using Handler = std::function<Result<nlohmann::json>(const Intent&, std::stop_token)>;

        explicit StubComponent(std::string name = "StubComponent", ComponentMetadataPatch md = {})
            : name_(std::move(name)), md_(std::move(md)) {}

        std::string name() const override { return name_; }

        Result<nlohmann::json> handle(const Intent& intent, std::stop_token stop) override {
            ++calls;
            if (handler) return handler(intent, stop);
            return nlohmann::json{ {"handled_by", name_}, {"type", intent.type()} };
        }

        bool alive() const override { return isAlive.load(); }

        IHealthProbe* healthProbe() override { return withProbe ? this : nullptr; }

        Health checkHealth() override {
            ++probes;
            if (probeDelay.count() > 0) std::this_thread::sleep_for(probeDelay);
            return health.load();
        }

        ComponentMetadataPatch describe() const override { return md_; }

        Handler                   handler;
        std::atomic<int>          calls{ 0 };
        std::atomic<int>          probes{ 0 };
        std::atomic<bool>         isAlive{ true };
        std::atomic<Health>       health{ Health::Healthy };
        bool                      withProbe{ false };
        std::chrono::milliseconds probeDelay{ 0 };

    private:
        std::string            name_;
        ComponentMetadataPatch md_;
    };

    inline ComponentMetadataPatch ofType(std::string type) {
        ComponentMetadataPatch p;
        p.type = std::move(type);
        return p;
    }

    inline ComponentMetadataPatch withCaps(std::vector<Capability> list) {
        ComponentMetadataPatch p;
        p.capabilities = std::move(list);
        return p;
    }

    /// Discovery settings for tests: no purge thread churn, small probe timeout.
    inline DiscoveryOptions quickDiscovery() {
        DiscoveryOptions o;
        o.healthProbeTimeout = std::chrono::milliseconds(200);
        o.rngSeed = 42;
        return o;
    }

}
