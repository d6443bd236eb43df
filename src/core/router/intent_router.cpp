#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <algorithm>
#include <future>
#include <stop_token>

namespace intentmesh {

/*──────────── routing table ───────────*/
RouteRule typeContains(std::string needle, std::string targetClass) {
    RouteRule r;
    r.name = "type contains " + needle;
    r.predicate = [needle](const Intent& i) { return i.type().find(needle) != std::string::npos; };
    r.targetClass = std::move(targetClass);
    return r;
}

std::vector<RouteRule> defaultRoutes() {
    std::vector<RouteRule> rules;
    rules.push_back(typeContains("File", "file"));
    rules.push_back(typeContains("User", "user"));
    rules.push_back(RouteRule{ "composite", [](const Intent& i) { return i.isComposite(); }, "composite" });
    return rules;
}

nlohmann::json Outcome::toJson() const {
    nlohmann::json j{ {"intent_id", intentId}, {"target", target} };
    if (effect) {
        j["status"] = "ok";
        j["effect"] = effect.value();
    }
    else {
        j["status"] = "error";
        j["error"] = toString(effect.error().code);
        j["reason"] = effect.error().reason;
    }
    return j;
}

/*──────────── IntentRouter ───────────*/
IntentRouter::IntentRouter(ComponentDiscovery& discovery, const PluginPipeline& pipeline, RouterOptions opts)
    : discovery_(discovery),
      pipeline_(pipeline),
      opts_(std::move(opts)),
      pool_(opts_.dispatchThreads, "IntentRouter") {}

IntentRouter::~IntentRouter() {
    pool_.join();
}

std::string IntentRouter::classify(const Intent& intent) const {
    for (const auto& rule : opts_.routes)
        if (rule.predicate && rule.predicate(intent)) return rule.targetClass;
    return opts_.defaultClass;
}

DiscoveryPattern IntentRouter::patternFor(const std::string& targetClass) const {
    if (auto it = opts_.classPatterns.find(targetClass); it != opts_.classPatterns.end())
        return it->second;
    return DiscoveryPattern::ofType(targetClass);
}

std::vector<ComponentMatch> IntentRouter::candidatesFor(const std::string& targetClass) {
    return discovery_.findComponents(patternFor(targetClass));
}

Result<std::vector<ComponentMatch>> IntentRouter::resolveTargets(const Intent& intent) {
    std::string cls = classify(intent);
    auto matches = candidatesFor(cls);
    if (matches.empty() && cls != opts_.defaultClass) {
        LOG_DEBUG("[IntentRouter] no '" + cls + "' target for " + intent.id() + ", trying '" +
                  opts_.defaultClass + "'");
        cls = opts_.defaultClass;
        matches = candidatesFor(cls);
    }
    if (matches.empty()) {
        LOG_WARN("[IntentRouter] no route for " + intent.type() + " (" + intent.id() + ")");
        return makeError(FabricErr::NoRoute, intent.type());
    }

    std::vector<std::string> ids;
    ids.reserve(matches.size());
    for (const auto& m : matches) ids.push_back(m.id);

    auto routed = pipeline_.runRoute(intent, std::move(ids));
    if (!routed) return routed.error();

    std::vector<ComponentMatch> out;
    for (const auto& id : routed.value()) {
        auto it = std::find_if(matches.begin(), matches.end(),
                               [&](const ComponentMatch& m) { return m.id == id; });
        if (it != matches.end()) out.push_back(*it);
    }
    if (out.empty()) {
        LOG_WARN("[IntentRouter] routing plugins left no target for " + intent.id());
        return makeError(FabricErr::NoRoute, intent.type());
    }
    return out;
}

Result<std::string> IntentRouter::routeIntent(const Intent& intent) {
    auto targets = resolveTargets(intent);
    if (!targets) return targets.error();

    auto picked = discovery_.selectTarget(targets.value(), opts_.loadBalancing);
    if (!picked) return wrapError(FabricErr::NoRoute, picked.error());

    LOG_DEBUG("[IntentRouter] " + intent.id() + " (" + intent.type() + ") -> " + picked.value().id);
    return picked.value().id;
}

Result<Intent> IntentRouter::delegateIntent(const Intent& intent, const std::string& targetId) {
    if (!discovery_.contains(targetId))
        return makeError(FabricErr::TargetProcessorNotFound, targetId);
    return intent.withMetadata("delegated_to", targetId);
}

namespace {

    /// Gives a least-connections slot back when the handler is done with it.
    struct SlotRelease {
        ComponentDiscovery* discovery;
        std::string         id;

        ~SlotRelease() {
            if (!discovery) return;
            try {
                discovery->releaseConnection(id);
            }
            catch (const std::exception& ex) {
                LOG_ERROR("[IntentRouter] could not release slot of " + id + ": " + ex.what());
            }
        }
    };

}

Result<nlohmann::json> IntentRouter::dispatch(const Intent& delegated) {
    return send(delegated, false);
}

Result<nlohmann::json> IntentRouter::send(const Intent& delegated, bool heldSlot) {
    auto targetId = delegated.delegatedTo();
    if (!targetId)
        return makeError(FabricErr::NoRoute, "intent " + delegated.id() + " is not delegated");

    auto target = discovery_.lookup(*targetId);
    if (!target) {
        if (heldSlot) discovery_.releaseConnection(*targetId);
        return makeError(FabricErr::TargetProcessorNotFound, *targetId);
    }

    std::stop_source stop;
    ComponentDiscovery* owner = heldSlot ? &discovery_ : nullptr;
    auto fut = pool_.add([target, delegated, owner, id = *targetId, token = stop.get_token()]() {
        SlotRelease slot{ owner, id };
        return target->handle(delegated, token);
    });

    if (fut.wait_for(opts_.dispatchTimeout) != std::future_status::ready) {
        stop.request_stop();
        LOG_WARN("[IntentRouter] dispatch of " + delegated.id() + " to " + *targetId + " timed out after " +
                 std::to_string(opts_.dispatchTimeout.count()) + " ms");
        return makeError(FabricErr::Timeout, *targetId);
    }

    try {
        return fut.get();
    }
    catch (const std::exception& ex) {
        LOG_ERROR("[IntentRouter] handler " + *targetId + " threw: " + std::string(ex.what()));
        return makeError(FabricErr::Internal, *targetId + ": " + ex.what());
    }
}

Result<Intent> IntentRouter::validateIntent(const Intent& intent) const {
    return pipeline_.runValidate(intent);
}

Result<Intent> IntentRouter::transformIntent(const Intent& intent) const {
    return pipeline_.runTransform(intent);
}

Result<Intent> IntentRouter::prepare(const Intent& intent) const {
    auto validated = pipeline_.runValidate(intent);
    if (!validated) return validated.error();
    return pipeline_.runTransform(validated.value());
}

Outcome IntentRouter::deliver(const Intent& prepared, const std::string& originalId,
                              const std::string& targetId, bool heldSlot) {
    auto delegated = delegateIntent(prepared, targetId);
    if (!delegated) {
        if (heldSlot) discovery_.releaseConnection(targetId);
        return Outcome{ originalId, targetId, delegated.error() };
    }
    return Outcome{ originalId, targetId, send(delegated.value(), heldSlot) };
}

Outcome IntentRouter::process(const Intent& intent) {
    auto prepared = prepare(intent);
    if (!prepared) return Outcome{ intent.id(), "", prepared.error() };

    auto target = routeIntent(prepared.value());
    if (!target) return Outcome{ intent.id(), "", target.error() };

    return deliver(prepared.value(), intent.id(), target.value(), takesSlot());
}

Outcome IntentRouter::processTo(const Intent& intent, const std::string& targetId) {
    auto prepared = prepare(intent);
    if (!prepared) return Outcome{ intent.id(), targetId, prepared.error() };
    return deliver(prepared.value(), intent.id(), targetId, false);
}

}
