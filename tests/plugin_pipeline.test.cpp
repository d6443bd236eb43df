#include <catch2/catch_all.hpp>
#include <algorithm>
#include <stdexcept>
#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/plugins/file_validation_plugin.hpp"
#include "intentmesh/plugins/user_validation_plugin.hpp"

using namespace intentmesh;

namespace {

    // Appends its name to payload.trail in transform.
    class TracePlugin : public IIntentPlugin {
    public:
        TracePlugin(const char* name, PluginType type, int priority)
            : name_(name), type_(type), priority_(priority) {}

        const char* name() const override { return name_; }
        PluginType type() const override { return type_; }
        int priority() const override { return priority_; }

        Result<Intent> transform(const Intent& intent) override {
            auto p = intent.payload();
            p["trail"].push_back(name_);
            return intent.withPayload(std::move(p));
        }

    private:
        const char* name_;
        PluginType  type_;
        int         priority_;
    };

    class ThrowingPlugin : public IIntentPlugin {
    public:
        const char* name() const override { return "ThrowingPlugin"; }
        PluginType type() const override { return PluginType::Validation; }
        Result<Intent> validate(const Intent&) override { throw std::runtime_error("boom"); }
    };

    class KeepLastRoute : public IIntentPlugin {
    public:
        const char* name() const override { return "KeepLastRoute"; }
        PluginType type() const override { return PluginType::Routing; }
        std::vector<std::string> route(const Intent&, std::vector<std::string> c) override {
            if (c.size() > 1) c.erase(c.begin(), c.end() - 1);
            return c;
        }
    };

    class ReverseCompose : public IIntentPlugin {
    public:
        const char* name() const override { return "ReverseCompose"; }
        PluginType type() const override { return PluginType::Composition; }
        std::vector<Intent> compose(std::vector<Intent> intents, std::string_view) override {
            std::reverse(intents.begin(), intents.end());
            return intents;
        }
    };

}

TEST_CASE("register ignores duplicates and null", "[plugins]") {
    PluginPipeline pp;
    auto file = std::make_shared<FileValidationPlugin>();
    pp.registerPlugin(file);
    pp.registerPlugin(file);
    pp.registerPlugin(nullptr);
    REQUIRE(pp.size() == 1);

    REQUIRE(pp.unregisterPlugin(file));
    REQUIRE_FALSE(pp.unregisterPlugin(file));
    REQUIRE(pp.size() == 0);
}

TEST_CASE("unregister by name removes every match", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());
    pp.registerPlugin(std::make_shared<UserValidationPlugin>());

    REQUIRE(pp.unregisterPlugin("FileValidationPlugin") == 2);
    REQUIRE(pp.size() == 1);
}

TEST_CASE("getPluginsByType orders by descending priority", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<UserValidationPlugin>());   // 8
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());   // 10
    pp.registerPlugin(std::make_shared<TracePlugin>("t", PluginType::Transformation, 50));

    auto v = pp.getPluginsByType(PluginType::Validation);
    REQUIRE(v.size() == 2);
    REQUIRE(std::string(v[0]->name()) == "FileValidationPlugin");
    REQUIRE(std::string(v[1]->name()) == "UserValidationPlugin");
    REQUIRE(pp.getPluginsByType(PluginType::Routing).empty());
}

TEST_CASE("validation rejects a file intent without a path", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());

    auto bad = pp.runValidate(createIntent("FileReadIntent", { {"path", ""} }));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().code == FabricErr::Validation);
    REQUIRE(bad.error().reason == "invalid_file_path");

    REQUIRE_FALSE(pp.runValidate(createIntent("FileReadIntent")));
    REQUIRE(pp.runValidate(createIntent("FileReadIntent", { {"path", "/a"} })));
    REQUIRE(pp.runValidate(createIntent("PingIntent")));
}

TEST_CASE("validation rejects a user intent without user_id", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<UserValidationPlugin>());

    auto bad = pp.runValidate(createIntent("UserProfileIntent"));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().reason == "invalid_user_id");
    REQUIRE(pp.runValidate(createIntent("UserProfileIntent", { {"user_id", "u1"} })));
}

TEST_CASE("transform runs validation plugins too", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());
    pp.registerPlugin(std::make_shared<UserValidationPlugin>());

    auto f = pp.runTransform(createIntent("FileReadIntent", { {"path", "//a//b/"} }));
    REQUIRE(f);
    REQUIRE(f.value().payload()["path"] == "/a/b");

    auto u = pp.runTransform(createIntent("UserProfileIntent", { {"user_id", "u1"} }));
    REQUIRE(u);
    REQUIRE(u.value().payload()["session_context"]["validated_at"].is_number_integer());
}

TEST_CASE("transform chain runs in priority order", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<TracePlugin>("low", PluginType::Transformation, 1));
    pp.registerPlugin(std::make_shared<TracePlugin>("high", PluginType::Transformation, 9));
    pp.registerPlugin(std::make_shared<TracePlugin>("mid", PluginType::Validation, 5));
    pp.registerPlugin(std::make_shared<TracePlugin>("route", PluginType::Routing, 100));

    auto r = pp.runTransform(createIntent("PingIntent"));
    REQUIRE(r);
    REQUIRE(r.value().payload()["trail"] == nlohmann::json::array({ "high", "mid", "low" }));
}

TEST_CASE("a throwing hook becomes a PluginFailure", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<ThrowingPlugin>());

    auto r = pp.runValidate(createIntent("PingIntent"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == FabricErr::PluginFailure);
    REQUIRE(r.error().reason == "ThrowingPlugin.validate: boom");
}

TEST_CASE("route and compose hooks run only for their plugin types", "[plugins]") {
    PluginPipeline pp;
    pp.registerPlugin(std::make_shared<FileValidationPlugin>());
    pp.registerPlugin(std::make_shared<KeepLastRoute>());
    pp.registerPlugin(std::make_shared<ReverseCompose>());

    auto routed = pp.runRoute(createIntent("FileReadIntent"), { "a", "file_1", "b" });
    REQUIRE(routed);
    REQUIRE(routed.value() == std::vector<std::string>{ "b" });

    auto a = createIntent("A");
    auto b = createIntent("B");
    auto composed = pp.runCompose({ a, b }, "sequential");
    REQUIRE(composed);
    REQUIRE(composed.value()[0].id() == b.id());
}

TEST_CASE("file plugin route prefers file targets", "[plugins][file]") {
    FileValidationPlugin p;
    auto file = createIntent("FileReadIntent", { {"path", "/a"} });

    REQUIRE(p.route(file, { "x", "file_store", "y" }) == std::vector<std::string>{ "file_store" });
    REQUIRE(p.route(file, { "x", "y" }) == std::vector<std::string>{ "x", "y" });
    REQUIRE(p.route(createIntent("PingIntent"), { "x", "file_store" }).size() == 2);
}

TEST_CASE("file plugin orders file_operations read, write, delete", "[plugins][file]") {
    FileValidationPlugin p;
    auto del = createIntent("FileDeleteIntent");
    auto write = createIntent("FileWriteIntent");
    auto other = createIntent("PingIntent");
    auto read = createIntent("FileReadIntent");

    auto out = p.compose({ del, write, other, read }, "file_operations");
    REQUIRE(out[0].id() == read.id());
    REQUIRE(out[1].id() == write.id());
    REQUIRE(out[2].id() == del.id());
    REQUIRE(out[3].id() == other.id());

    auto same = p.compose({ del, read }, "sequential");
    REQUIRE(same[0].id() == del.id());
}

TEST_CASE("normalizePath", "[plugins][file]") {
    REQUIRE(FileValidationPlugin::normalizePath("//a///b//") == "/a/b");
    REQUIRE(FileValidationPlugin::normalizePath("/") == "/");
    REQUIRE(FileValidationPlugin::normalizePath("a/b") == "a/b");
}
