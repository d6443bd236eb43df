#include <catch2/catch_all.hpp>
#include <set>
#include "intentmesh/core/intent/intent.hpp"

using namespace intentmesh;

TEST_CASE("createIntent fills id and creation metadata", "[intent]") {
    auto i = createIntent("FileReadIntent", { {"path", "/a"} }, { caps::read("/a") });

    REQUIRE(i.id().rfind("intent_", 0) == 0);
    REQUIRE(i.type() == "FileReadIntent");
    REQUIRE(i.payload()["path"] == "/a");
    REQUIRE(i.capabilities().size() == 1);
    REQUIRE(i.metadata()["dynamic"] == true);
    REQUIRE(i.metadata().contains("created_at"));
    REQUIRE_FALSE(i.isComposite());
    REQUIRE_FALSE(i.delegatedTo());
}

TEST_CASE("intent ids are unique", "[intent]") {
    std::set<std::string> ids;
    for (int n = 0; n < 1000; ++n) ids.insert(generateIntentId());
    REQUIRE(ids.size() == 1000);
}

TEST_CASE("null payload becomes an empty object", "[intent]") {
    auto i = createIntent("PingIntent", nullptr);
    REQUIRE(i.payload().is_object());
    REQUIRE(i.payload().empty());
}

TEST_CASE("withMetadata and withPayload return modified copies", "[intent]") {
    auto i = createIntent("PingIntent", { {"n", 1} });
    auto d = i.withMetadata("delegated_to", "worker_1");

    REQUIRE(d.delegatedTo() == std::optional<std::string>("worker_1"));
    REQUIRE_FALSE(i.delegatedTo());
    REQUIRE(d.id() == i.id());

    auto p = i.withPayload({ {"n", 2} });
    REQUIRE(p.payload()["n"] == 2);
    REQUIRE(i.payload()["n"] == 1);
}

TEST_CASE("strategy names round trip", "[intent]") {
    REQUIRE(toString(CompositionStrategy::FanOut) == "fan_out");
    REQUIRE(parseStrategy("fan_out") == CompositionStrategy::FanOut);
    REQUIRE(parseStrategy("pipeline") == CompositionStrategy::Pipeline);
    REQUIRE_FALSE(parseStrategy("bogus"));
    REQUIRE_FALSE(parseStrategy("Sequential"));
}

TEST_CASE("composite intent carries sub-intent ids and composed capabilities", "[intent]") {
    auto a = createIntent("FileReadIntent", {}, { caps::read("/a") });
    auto b = createIntent("FileWriteIntent", {}, { caps::read("/a"), caps::write("/b") });

    auto c = createCompositeIntent({ a, b });
    REQUIRE(c.strategy() == CompositionStrategy::Parallel);
    REQUIRE(c.intents().size() == 2);

    auto flat = c.asIntent();
    REQUIRE(flat.type() == "composite");
    REQUIRE(flat.isComposite());
    REQUIRE(flat.id() == c.id());
    REQUIRE(flat.payload()["intents"] == nlohmann::json::array({ a.id(), b.id() }));
    REQUIRE(flat.payload()["strategy"] == "parallel");
    REQUIRE(flat.capabilities().size() == 2);
}

TEST_CASE("intent json", "[intent]") {
    auto i = createIntent("UserProfileIntent", { {"user_id", "u1"} });
    auto j = i.toJson();
    REQUIRE(j["id"] == i.id());
    REQUIRE(j["type"] == "UserProfileIntent");
    REQUIRE(j["payload"]["user_id"] == "u1");
    REQUIRE(j["capabilities"].is_array());
}
