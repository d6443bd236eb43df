#include <catch2/catch_all.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "intentmesh/core/router/intent_composer.hpp"
#include "intentmesh/core/strategies/fixed_backoff.hpp"
#include "intentmesh/plugins/file_validation_plugin.hpp"
#include "test_components.hpp"

using namespace intentmesh;
using namespace intentmesh::test;
using namespace std::chrono_literals;

namespace {

    RetryOptions quickRetry(uint32_t maxRetries = 2) {
        RetryOptions r;
        r.maxRetries = maxRetries;
        r.retryDelay = 1ms;
        r.maxDelay = 5ms;
        return r;
    }

    struct ComposerFixture {
        ComponentDiscovery discovery{ quickDiscovery() };
        PluginPipeline     plugins;
        IntentRouter       router;
        IntentComposer     composer;

        explicit ComposerFixture(RetryOptions retry = quickRetry())
            : router(discovery, plugins, routerOptions()),
              composer(router, plugins, std::move(retry), 4) {}

        static RouterOptions routerOptions() {
            RouterOptions o;
            o.dispatchThreads = 4;
            o.dispatchTimeout = 2s;
            return o;
        }

        std::shared_ptr<StubComponent> add(const std::string& id, const std::string& type) {
            auto c = std::make_shared<StubComponent>(id, ofType(type));
            REQUIRE(discovery.registerComponent(id, c));
            return c;
        }
    };

    std::vector<Intent> pings(int n) {
        std::vector<Intent> out;
        for (int i = 0; i < n; ++i) out.push_back(createIntent("PingIntent", { {"n", i} }));
        return out;
    }

    Result<nlohmann::json> echoN(const Intent& i, std::stop_token) {
        return nlohmann::json{ {"n", i.payload()["n"]} };
    }

}

TEST_CASE("sequential runs every intent in order", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = echoN;

    auto intents = pings(3);
    auto r = f.composer.composeIntents(intents, "sequential");
    REQUIRE(r);
    REQUIRE(r.value().strategy == CompositionStrategy::Sequential);
    REQUIRE(r.value().results.size() == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(r.value().results[i].intentId == intents[i].id());
        REQUIRE(r.value().results[i].effect.value()["n"] == i);
    }
    REQUIRE(c->calls.load() == 3);
}

TEST_CASE("sequential stops at the first failure", "[composer]") {
    ComposerFixture f;
    f.plugins.registerPlugin(std::make_shared<FileValidationPlugin>());
    auto c = f.add("worker", "default");

    std::vector<Intent> intents{
        createIntent("PingIntent"),
        createIntent("FileReadIntent"),   // no path
        createIntent("PingIntent"),
    };
    auto r = f.composer.composeIntents(intents, CompositionStrategy::Sequential);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().reason == "invalid_file_path");
    REQUIRE(c->calls.load() == 1);
}

TEST_CASE("unknown strategy name is rejected", "[composer]") {
    ComposerFixture f;
    f.add("worker", "default");

    auto r = f.composer.composeIntents(pings(2), "bogus");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::UnsupportedCompositionPattern);
    REQUIRE(r.error().reason == "bogus");
}

TEST_CASE("parallel keeps input order and isolates failures", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        int n = i.payload()["n"].get<int>();
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (4 - n)));
        if (n == 2) return makeError(FabricErr::Internal, "n == 2");
        return nlohmann::json{ {"n", n} };
    };

    auto intents = pings(4);
    auto r = f.composer.composeIntents(intents, CompositionStrategy::Parallel);
    REQUIRE(r);
    const auto& results = r.value().results;
    REQUIRE(results.size() == 4);
    for (size_t i = 0; i < 4; ++i) REQUIRE(results[i].intentId == intents[i].id());
    REQUIRE(results[0].ok());
    REQUIRE(results[1].ok());
    REQUIRE_FALSE(results[2].ok());
    REQUIRE(results[3].ok());
    REQUIRE(r.value().anyFailed());
}

TEST_CASE("parallel branches run concurrently", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent&, std::stop_token) -> Result<nlohmann::json> {
        std::this_thread::sleep_for(100ms);
        return nlohmann::json::object();
    };

    auto start = std::chrono::steady_clock::now();
    auto r = f.composer.composeIntents(pings(4), CompositionStrategy::Parallel);
    REQUIRE(r);
    REQUIRE(std::chrono::steady_clock::now() - start < 350ms);
}

TEST_CASE("conditional stops when the predicate turns false", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = echoN;

    CompositionOptions opts;
    opts.condition = [](const std::vector<Outcome>& sofar) {
        return sofar.back().effect.value()["n"].get<int>() < 1;
    };

    auto r = f.composer.composeIntents(pings(4), CompositionStrategy::Conditional, opts);
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 2);
    REQUIRE(c->calls.load() == 2);
}

TEST_CASE("conditional without a predicate runs everything", "[composer]") {
    ComposerFixture f;
    f.add("worker", "default");

    auto r = f.composer.composeIntents(pings(3), "conditional");
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 3);
}

TEST_CASE("a throwing predicate fails the composition", "[composer]") {
    ComposerFixture f;
    f.add("worker", "default");

    CompositionOptions opts;
    opts.condition = [](const std::vector<Outcome>&) -> bool { throw std::runtime_error("bad predicate"); };

    auto r = f.composer.composeIntents(pings(2), CompositionStrategy::Conditional, opts);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::Internal);
}

TEST_CASE("pipeline feeds each effect into the next payload", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        const auto& ctx = i.payload()["context"];
        int total = ctx.is_object() ? ctx["total"].get<int>() : 0;
        int step = i.payload()["n"].get<int>();
        return nlohmann::json{ {"total", total + step}, {"step" + std::to_string(step), true} };
    };

    std::vector<Intent> intents;
    for (int n : { 1, 2, 3 }) intents.push_back(createIntent("PingIntent", { {"n", n} }));

    auto r = f.composer.composeIntents(intents, CompositionStrategy::Pipeline);
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 3);
    REQUIRE(r.value().results[2].effect.value()["total"] == 6);

    REQUIRE(r.value().finalResult);
    const auto& fin = *r.value().finalResult;
    REQUIRE(fin["total"] == 6);
    REQUIRE(fin["step1"] == true);
    REQUIRE(fin["step3"] == true);

    auto j = r.value().toJson();
    REQUIRE(j["type"] == "pipeline");
    REQUIRE(j["final"]["total"] == 6);
}

TEST_CASE("pipeline wraps a non-object payload", "[composer]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        return i.payload()["value"];
    };

    auto intent = createIntent("PingIntent").withPayload(42);
    auto r = f.composer.composeIntents({ intent }, CompositionStrategy::Pipeline);
    REQUIRE(r);
    REQUIRE((*r.value().finalResult)["result"] == 42);
}

TEST_CASE("fan_out reaches every target of the class", "[composer]") {
    ComposerFixture f;
    auto a = f.add("file_a", "file");
    auto b = f.add("file_b", "file");
    f.add("user", "user");

    auto intent = createIntent("FileWriteIntent", { {"path", "/x"} });
    auto r = f.composer.composeIntents({ intent }, "fan_out");
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 2);
    REQUIRE(r.value().results[0].target == "file_a");
    REQUIRE(r.value().results[1].target == "file_b");
    REQUIRE(a->calls.load() == 1);
    REQUIRE(b->calls.load() == 1);
}

TEST_CASE("fan_out to explicit targets", "[composer]") {
    ComposerFixture f;
    f.add("w1", "default");
    auto w2 = f.add("w2", "default");

    CompositionOptions opts;
    opts.targets = { "w2", "ghost" };
    auto r = f.composer.composeIntents(pings(1), CompositionStrategy::FanOut, opts);
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 2);
    REQUIRE(r.value().results[0].ok());
    REQUIRE(r.value().results[1].effect.error().code == FabricErr::TargetProcessorNotFound);
    REQUIRE(w2->calls.load() == 1);
}

TEST_CASE("fan_out with no route reports one failed outcome", "[composer]") {
    ComposerFixture f;
    auto r = f.composer.composeIntents(pings(1), CompositionStrategy::FanOut);
    REQUIRE(r);
    REQUIRE(r.value().results.size() == 1);
    REQUIRE(r.value().results[0].effect.error().code == FabricErr::NoRoute);
}

TEST_CASE("composition plugins arrange intents first", "[composer]") {
    class Reverse : public IIntentPlugin {
    public:
        const char* name() const override { return "Reverse"; }
        PluginType type() const override { return PluginType::Composition; }
        std::vector<Intent> compose(std::vector<Intent> intents, std::string_view strategy) override {
            if (strategy == "sequential") std::reverse(intents.begin(), intents.end());
            return intents;
        }
    };

    ComposerFixture f;
    f.add("worker", "default");
    f.plugins.registerPlugin(std::make_shared<Reverse>());

    auto intents = pings(3);
    auto r = f.composer.composeIntents(intents, CompositionStrategy::Sequential);
    REQUIRE(r);
    REQUIRE(r.value().results[0].intentId == intents[2].id());
}

TEST_CASE("composite intent runs with its own strategy", "[composer]") {
    ComposerFixture f;
    f.add("worker", "default");

    auto composite = createCompositeIntent(pings(2), CompositionStrategy::Sequential);
    auto r = f.composer.composeComposite(composite);
    REQUIRE(r);
    REQUIRE(r.value().strategy == CompositionStrategy::Sequential);
    REQUIRE(r.value().results.size() == 2);
}

TEST_CASE("retry makes 1 + max_retries attempts then gives up", "[composer][retry]") {
    ComposerFixture f(quickRetry(2));
    auto c = f.add("worker", "default");
    c->handler = [](const Intent&, std::stop_token) -> Result<nlohmann::json> {
        return makeError(FabricErr::Internal, "always down");
    };

    auto r = f.composer.composeWithRetry(pings(1));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::MaxRetriesExceeded);
    REQUIRE(r.error().cause);
    REQUIRE(r.error().cause->reason == "always down");
    REQUIRE(c->calls.load() == 3);
}

TEST_CASE("retry returns the first successful attempt", "[composer][retry]") {
    ComposerFixture f(quickRetry(5));
    auto c = f.add("worker", "default");
    std::atomic<int> attempts{ 0 };
    c->handler = [&attempts](const Intent&, std::stop_token) -> Result<nlohmann::json> {
        if (++attempts < 3) return makeError(FabricErr::Internal, "warming up");
        return nlohmann::json{ {"ok", true} };
    };

    auto r = f.composer.composeWithRetry(pings(1));
    REQUIRE(r);
    REQUIRE(c->calls.load() == 3);
}

TEST_CASE("retry counts failed parallel branches as a failed attempt", "[composer][retry]") {
    ComposerFixture f;
    auto c = f.add("worker", "default");
    c->handler = [](const Intent& i, std::stop_token) -> Result<nlohmann::json> {
        if (i.payload()["n"] == 1) return makeError(FabricErr::Internal, "branch 1");
        return nlohmann::json::object();
    };

    RetryOptions retry = quickRetry(1);
    retry.strategy = CompositionStrategy::Parallel;
    auto r = f.composer.composeWithRetry(pings(2), retry);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().cause->reason == "branch 1");
    REQUIRE(c->calls.load() == 4);
}

TEST_CASE("retry sleeps with the backoff strategy", "[composer][retry]") {
    RetryOptions retry;
    retry.maxRetries = 2;
    retry.backoff = std::make_shared<FixedBackoff>(40ms);

    int calls = 0;
    auto start = std::chrono::steady_clock::now();
    auto r = IntentComposer::retry([&]() -> Result<Composition> {
        ++calls;
        return makeError(FabricErr::Timeout, "slow");
    }, retry);

    REQUIRE_FALSE(r);
    REQUIRE(calls == 3);
    REQUIRE(std::chrono::steady_clock::now() - start >= 80ms);
}
