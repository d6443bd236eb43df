// Core API - everything you always need
#include "intentmesh/intentmesh.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

using namespace intentmesh;

/*
 * Reads and writes files below a root directory. Honors the dispatch stop
 * token between chunks of a read.
 */
class FileReactor : public IComponent {
public:
    explicit FileReactor(std::filesystem::path root) : root_(std::move(root)) {}

    std::string name() const override { return "FileReactor"; }

    Result<nlohmann::json> handle(const Intent& intent, std::stop_token stop) override {
        const auto& payload = intent.payload();
        std::filesystem::path path = root_ / payload.value("path", std::string{}).substr(
            payload.value("path", std::string{}).starts_with("/") ? 1 : 0);

        if (intent.type() == "FileWriteIntent") {
            std::ofstream out(path);
            if (!out) return makeError(FabricErr::Internal, "cannot write " + path.string());
            out << payload.value("content", std::string{});
            return nlohmann::json{ {"written", path.string()} };
        }
        if (intent.type() == "FileReadIntent") {
            std::ifstream in(path);
            if (!in) return makeError(FabricErr::NotFound, path.string());
            std::string content, line;
            while (std::getline(in, line)) {
                if (stop.stop_requested()) return makeError(FabricErr::Timeout, "read cancelled");
                content += line + "\n";
            }
            return nlohmann::json{ {"content", content} };
        }
        if (intent.type() == "FileDeleteIntent") {
            std::error_code ec;
            bool removed = std::filesystem::remove(path, ec);
            if (ec) return makeError(FabricErr::Internal, ec.message());
            return nlohmann::json{ {"deleted", removed} };
        }
        return makeError(FabricErr::NoRoute, "FileReactor cannot handle " + intent.type());
    }

    ComponentMetadataPatch describe() const override {
        ComponentMetadataPatch p;
        p.type = "file";
        p.version = "1.2.0";
        p.capabilities = std::vector<Capability>{ caps::admin("/") };
        p.tags = std::vector<std::string>{ "storage", "local" };
        return p;
    }

private:
    std::filesystem::path root_;
};

class UserReactor : public IComponent, public IHealthProbe {
public:
    std::string name() const override { return "UserReactor"; }

    Result<nlohmann::json> handle(const Intent& intent, std::stop_token) override {
        std::scoped_lock lk(m_);
        ++handled_;
        return nlohmann::json{
            {"user_id", intent.payload().value("user_id", std::string{})},
            {"handled", handled_}
        };
    }

    IHealthProbe* healthProbe() override { return this; }
    Health checkHealth() override { return Health::Healthy; }

private:
    std::mutex m_;
    int handled_ = 0;
};

class EchoReactor : public IComponent {
public:
    std::string name() const override { return "EchoReactor"; }

    Result<nlohmann::json> handle(const Intent& intent, std::stop_token) override {
        return nlohmann::json{ {"echo", intent.payload()} };
    }
};

class FileCapabilities : public ICapabilityUnit {
public:
    std::string moduleName() const override { return "FileCapabilities"; }

    std::vector<CapabilityDeclaration> declarations() const override {
        CapabilityDeclaration read;
        read.id = "file_read";
        read.intent = "Read the contents of a file";
        read.requiredFields = { "path" };
        read.providedFields = { "content" };
        read.effects.push_back({ {"type", "audit_log"}, {"opts", { {"level", "info"} }} });

        CapabilityDeclaration write;
        write.id = "file_write";
        write.intent = "Write content to a file";
        write.requiredFields = { "path", "content" };
        write.providedFields = { "written" };

        return { read, write };
    }
};

int main(int argc, char** argv) {
    FabricOptions opts;
    if (argc > 1) {
        auto loaded = loadOptions(argv[1]);
        if (!loaded) {
            std::cerr << loaded.error().describe() << "\n";
            return 1;
        }
        opts = std::move(loaded).value();
    }
    opts.logLevel = LogLevel::Debug;
    opts.retry.retryDelay = std::chrono::milliseconds(50);

    Fabric fabric(opts);

    auto root = std::filesystem::temp_directory_path() / "intentmesh_example";
    std::filesystem::create_directories(root);

    auto files = std::make_shared<FileReactor>(root);
    auto users = std::make_shared<UserReactor>();
    auto echo  = std::make_shared<EchoReactor>();

    ComponentMetadataPatch userMeta;
    userMeta.type = "user";
    ComponentMetadataPatch echoMeta;
    echoMeta.type = "default";

    for (auto r : { fabric.registerComponent("file_reactor", files),
                    fabric.registerComponent("user_reactor", users, userMeta),
                    fabric.registerComponent("default_reactor", echo, echoMeta) }) {
        if (!r) {
            std::cerr << r.error().describe() << "\n";
            return 1;
        }
    }

    fabric.registerPlugin(std::make_shared<FileValidationPlugin>());
    fabric.registerPlugin(std::make_shared<UserValidationPlugin>());

    /* single intent ---------------------------------------------------- */
    auto write = createIntent("FileWriteIntent",
                              { {"path", "//notes//hello.txt/"}, {"content", "hello fabric"} },
                              { caps::write("/notes/hello.txt") });
    std::cout << fabric.processIntent(write).toJson().dump(2) << "\n";

    auto bad = createIntent("FileReadIntent", { {"path", ""} });
    std::cout << fabric.processIntent(bad).toJson().dump(2) << "\n";

    /* compositions ----------------------------------------------------- */
    std::vector<Intent> batch{
        createIntent("FileReadIntent", { {"path", "/notes/hello.txt"} }),
        createIntent("UserProfileIntent", { {"user_id", "u-42"} }),
        createIntent("PingIntent", { {"n", 1} }),
    };

    for (auto strategy : { "sequential", "parallel", "pipeline", "fan_out", "bogus" }) {
        auto c = fabric.composeIntents(batch, strategy);
        if (c) std::cout << strategy << ": " << c.value().toJson().dump() << "\n";
        else   std::cout << strategy << ": " << c.error().describe() << "\n";
    }

    auto composite = createCompositeIntent(batch, CompositionStrategy::Parallel);
    auto routed = fabric.routeIntent(composite.asIntent());
    std::cout << "composite routed to: "
              << (routed ? routed.value() : routed.error().describe()) << "\n";
    if (auto c = fabric.composeComposite(composite))
        std::cout << "composite: " << c.value().toJson().dump() << "\n";

    /* retry overlay ---------------------------------------------------- */
    auto missing = createIntent("FileReadIntent", { {"path", "/does/not/exist"} });
    auto retried = fabric.composeWithRetry({ missing });
    if (!retried) std::cout << "retry: " << retried.error().describe() << "\n";

    /* discovery -------------------------------------------------------- */
    DiscoveryPattern storage;
    storage.capabilities = std::vector<Capability>{ caps::read("/") };
    for (const auto& m : fabric.findComponents(storage))
        std::cout << m.id << " score=" << m.score << " health=" << toString(m.health) << "\n";

    /* catalog ---------------------------------------------------------- */
    FileCapabilities fileCaps;
    if (auto n = fabric.catalog().registerUnit(fileCaps); !n) {
        std::cerr << n.error().describe() << "\n";
        return 1;
    }
    for (const auto& e : fabric.catalog().discover("read"))
        std::cout << "catalog: " << e.toJson().dump() << "\n";
    for (const auto& e : fabric.catalog().discoverByCriteria({ {"requires", "written"} }))
        std::cout << "provides written: " << e.id << "\n";

    return 0;
}
