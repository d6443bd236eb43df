#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/plugins/file_validation_plugin.hpp"
#include "test_components.hpp"

using namespace intentmesh;
using namespace intentmesh::test;
using namespace std::chrono_literals;

namespace {

    struct RouterFixture {
        ComponentDiscovery discovery{ quickDiscovery() };
        PluginPipeline     plugins;
        IntentRouter       router;

        explicit RouterFixture(RouterOptions opts = {})
            : router(discovery, plugins, withThreads(std::move(opts))) {}

        static RouterOptions withThreads(RouterOptions o) {
            if (o.dispatchThreads == 0) o.dispatchThreads = 2;
            return o;
        }

        std::shared_ptr<StubComponent> add(const std::string& id, const std::string& type) {
            auto c = std::make_shared<StubComponent>(id, ofType(type));
            REQUIRE(discovery.registerComponent(id, c));
            return c;
        }
    };

}

TEST_CASE("classify uses the first matching rule", "[router]") {
    RouterFixture f;
    REQUIRE(f.router.classify(createIntent("FileReadIntent")) == "file");
    REQUIRE(f.router.classify(createIntent("UserProfileIntent")) == "user");
    REQUIRE(f.router.classify(createIntent("FileUserIntent")) == "file");
    REQUIRE(f.router.classify(createCompositeIntent({}).asIntent()) == "composite");
    REQUIRE(f.router.classify(createIntent("PingIntent")) == "default");
}

TEST_CASE("routeIntent picks a target of the intent's class", "[router]") {
    RouterFixture f;
    f.add("file_reactor", "file");
    f.add("user_reactor", "user");

    auto r = f.router.routeIntent(createIntent("FileReadIntent", { {"path", "/a"} }));
    REQUIRE(r);
    REQUIRE(r.value() == "file_reactor");

    r = f.router.routeIntent(createIntent("UserProfileIntent"));
    REQUIRE(r.value() == "user_reactor");
}

TEST_CASE("unmatched class falls back to the default class", "[router]") {
    RouterFixture f;
    f.add("fallback", "default");

    auto r = f.router.routeIntent(createIntent("FileReadIntent"));
    REQUIRE(r);
    REQUIRE(r.value() == "fallback");
}

TEST_CASE("no candidate at all is NoRoute", "[router]") {
    RouterFixture f;
    f.add("users", "user");

    auto r = f.router.routeIntent(createIntent("FileReadIntent"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::NoRoute);
}

TEST_CASE("class patterns override the type match", "[router]") {
    RouterOptions o;
    DiscoveryPattern readers;
    readers.capabilities = std::vector<Capability>{ caps::read("/files") };
    o.classPatterns["file"] = readers;
    RouterFixture f(o);

    auto c = std::make_shared<StubComponent>("Reader", withCaps({ caps::admin("/files") }));
    REQUIRE(f.discovery.registerComponent("admin_store", c));

    auto r = f.router.routeIntent(createIntent("FileReadIntent"));
    REQUIRE(r);
    REQUIRE(r.value() == "admin_store");
}

TEST_CASE("routing plugins narrow the candidates", "[router]") {
    class OnlySecond : public IIntentPlugin {
    public:
        const char* name() const override { return "OnlySecond"; }
        PluginType type() const override { return PluginType::Routing; }
        std::vector<std::string> route(const Intent&, std::vector<std::string>) override {
            return { "w2", "not_registered" };
        }
    };

    RouterFixture f;
    f.add("w1", "default");
    f.add("w2", "default");
    f.plugins.registerPlugin(std::make_shared<OnlySecond>());

    auto targets = f.router.resolveTargets(createIntent("PingIntent"));
    REQUIRE(targets);
    REQUIRE(targets.value().size() == 1);
    REQUIRE(targets.value()[0].id == "w2");
}

TEST_CASE("delegate_intent to an unknown target", "[router]") {
    RouterFixture f;
    auto r = f.router.delegateIntent(createIntent("PingIntent"), "ghost");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::TargetProcessorNotFound);
}

TEST_CASE("delegate_intent to a known target sets delegated_to", "[router]") {
    RouterFixture f;
    f.add("worker", "default");

    auto original = createIntent("PingIntent", { {"n", 7} });
    auto r = f.router.delegateIntent(original, "worker");
    REQUIRE(r);
    REQUIRE(r.value().delegatedTo() == std::optional<std::string>("worker"));
    REQUIRE(r.value().id() == original.id());
    REQUIRE(r.value().payload() == original.payload());
}

TEST_CASE("dispatch needs a delegated intent", "[router]") {
    RouterFixture f;
    auto r = f.router.dispatch(createIntent("PingIntent"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::NoRoute);
}

TEST_CASE("dispatch returns the handler's effect", "[router]") {
    RouterFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        return nlohmann::json{ {"echo", i.payload()["n"]} };
    };

    auto delegated = f.router.delegateIntent(createIntent("PingIntent", { {"n", 3} }), "worker");
    auto r = f.router.dispatch(delegated.value());
    REQUIRE(r);
    REQUIRE(r.value()["echo"] == 3);
}

TEST_CASE("dispatch timeout requests stop on the handler", "[router]") {
    std::atomic<bool> sawStop{ false };   // outlives the router's workers

    RouterOptions o;
    o.dispatchTimeout = 50ms;
    RouterFixture f(o);

    auto c = f.add("slow", "default");
    c->handler = [&](const Intent&, std::stop_token stop) -> Result<nlohmann::json> {
        auto until = std::chrono::steady_clock::now() + 2s;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < until)
            std::this_thread::sleep_for(1ms);
        sawStop = stop.stop_requested();
        return nlohmann::json{ {"late", true} };
    };

    auto start = std::chrono::steady_clock::now();
    Outcome o1 = f.router.processTo(createIntent("PingIntent"), "slow");
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
    REQUIRE_FALSE(o1.ok());
    REQUIRE(o1.effect.error().code == FabricErr::Timeout);

    auto deadline = std::chrono::steady_clock::now() + 1s;
    while (!sawStop && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    REQUIRE(sawStop);
}

TEST_CASE("a throwing handler is reported as Internal", "[router]") {
    RouterFixture f;
    auto c = f.add("bad", "default");
    c->handler = [](const Intent&, std::stop_token) -> Result<nlohmann::json> {
        throw std::runtime_error("disk on fire");
    };

    Outcome o = f.router.process(createIntent("PingIntent"));
    REQUIRE_FALSE(o.ok());
    REQUIRE(o.target == "bad");
    REQUIRE(o.effect.error().code == FabricErr::Internal);
}

TEST_CASE("process validates, transforms and delivers", "[router]") {
    RouterFixture f;
    f.plugins.registerPlugin(std::make_shared<FileValidationPlugin>());
    auto c = f.add("file_reactor", "file");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        return nlohmann::json{ {"path", i.payload()["path"]}, {"delegated_to", *i.delegatedTo()} };
    };

    auto intent = createIntent("FileReadIntent", { {"path", "//data//x.txt/"} });
    Outcome o = f.router.process(intent);
    REQUIRE(o.ok());
    REQUIRE(o.intentId == intent.id());
    REQUIRE(o.target == "file_reactor");
    REQUIRE(o.effect.value()["path"] == "/data/x.txt");
    REQUIRE(o.effect.value()["delegated_to"] == "file_reactor");

    auto j = o.toJson();
    REQUIRE(j["status"] == "ok");
    REQUIRE(j["target"] == "file_reactor");
}

TEST_CASE("process stops at validation", "[router]") {
    RouterFixture f;
    f.plugins.registerPlugin(std::make_shared<FileValidationPlugin>());
    auto c = f.add("file_reactor", "file");

    Outcome o = f.router.process(createIntent("FileReadIntent"));
    REQUIRE_FALSE(o.ok());
    REQUIRE(o.target.empty());
    REQUIRE(c->calls.load() == 0);

    auto j = o.toJson();
    REQUIRE(j["status"] == "error");
    REQUIRE(j["error"] == "validation");
    REQUIRE(j["reason"] == "invalid_file_path");
}

TEST_CASE("least-connections counters are released after dispatch", "[router]") {
    RouterOptions o;
    o.loadBalancing = LoadBalanceStrategy::LeastConnections;
    RouterFixture f(o);
    f.add("w1", "default");
    f.add("w2", "default");

    for (int i = 0; i < 4; ++i) {
        Outcome out = f.router.process(createIntent("PingIntent"));
        REQUIRE(out.ok());
        REQUIRE(out.target == "w1");
    }
    REQUIRE(f.discovery.connectionCount("w1") == 0);
}

TEST_CASE("dispatches that took no slot leave held slots alone", "[router]") {
    RouterFixture f;   // round robin
    f.add("w1", "default");

    auto held = f.discovery.getBestMatch(DiscoveryPattern::ofType("default"),
                                         LoadBalanceStrategy::LeastConnections);
    REQUIRE(held);
    REQUIRE(f.discovery.connectionCount("w1") == 1);

    REQUIRE(f.router.processTo(createIntent("PingIntent"), "w1").ok());
    REQUIRE(f.discovery.connectionCount("w1") == 1);

    REQUIRE(f.router.process(createIntent("PingIntent")).ok());
    REQUIRE(f.discovery.connectionCount("w1") == 1);

    auto delegated = f.router.delegateIntent(createIntent("PingIntent"), "w1");
    REQUIRE(f.router.dispatch(delegated.value()));
    REQUIRE(f.discovery.connectionCount("w1") == 1);
}

TEST_CASE("a timed-out dispatch holds its slot until the handler returns", "[router]") {
    std::atomic<bool> release{ false };   // outlives the router's workers

    RouterOptions o;
    o.dispatchTimeout = 30ms;
    o.loadBalancing = LoadBalanceStrategy::LeastConnections;
    RouterFixture f(o);

    auto c = f.add("slow", "default");
    c->handler = [&](const Intent&, std::stop_token) -> Result<nlohmann::json> {
        auto until = std::chrono::steady_clock::now() + 2s;
        while (!release && std::chrono::steady_clock::now() < until)
            std::this_thread::sleep_for(1ms);
        return nlohmann::json{ {"late", true} };
    };

    Outcome out = f.router.process(createIntent("PingIntent"));
    REQUIRE_FALSE(out.ok());
    REQUIRE(out.effect.error().code == FabricErr::Timeout);
    REQUIRE(f.discovery.connectionCount("slow") == 1);

    release = true;
    auto deadline = std::chrono::steady_clock::now() + 1s;
    while (f.discovery.connectionCount("slow") != 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    REQUIRE(f.discovery.connectionCount("slow") == 0);
}
