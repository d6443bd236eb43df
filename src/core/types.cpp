#include "intentmesh/core/types.hpp"

namespace intentmesh {

std::string_view toString(Health h) {
    switch (h) {
    case Health::Healthy:   return "healthy";
    case Health::Degraded:  return "degraded";
    case Health::Unhealthy: return "unhealthy";
    case Health::Unknown:   return "unknown";
    }
    return "unknown";
}

std::optional<Health> parseHealth(std::string_view name) {
    if (name == "healthy")   return Health::Healthy;
    if (name == "degraded")  return Health::Degraded;
    if (name == "unhealthy") return Health::Unhealthy;
    if (name == "unknown")   return Health::Unknown;
    return std::nullopt;
}

std::string_view toString(LoadBalanceStrategy s) {
    switch (s) {
    case LoadBalanceStrategy::RoundRobin:         return "round_robin";
    case LoadBalanceStrategy::LeastConnections:   return "least_connections";
    case LoadBalanceStrategy::WeightedRoundRobin: return "weighted_round_robin";
    case LoadBalanceStrategy::Random:             return "random";
    }
    return "round_robin";
}

LoadBalanceStrategy parseLoadBalanceStrategy(std::string_view name) {
    if (name == "least_connections")    return LoadBalanceStrategy::LeastConnections;
    if (name == "weighted_round_robin") return LoadBalanceStrategy::WeightedRoundRobin;
    if (name == "random")               return LoadBalanceStrategy::Random;
    return LoadBalanceStrategy::RoundRobin;
}

bool isKnownLoadBalanceStrategy(std::string_view name) {
    return name == "round_robin" || name == "least_connections" ||
           name == "weighted_round_robin" || name == "random";
}

std::string_view toString(PluginType t) {
    switch (t) {
    case PluginType::Validation:     return "validation";
    case PluginType::Transformation: return "transformation";
    case PluginType::Routing:        return "routing";
    case PluginType::Composition:    return "composition";
    case PluginType::Generic:        return "generic";
    }
    return "generic";
}

void to_json(nlohmann::json& j, const ComponentMetadata& m) {
    j = nlohmann::json{
        {"type", m.type},
        {"version", m.version},
        {"capabilities", m.capabilities},
        {"dependencies", m.dependencies},
        {"tags", m.tags},
        {"interface", m.interface}
    };
}

void ComponentMetadataPatch::applyTo(ComponentMetadata& target) const {
    if (type)         target.type = *type;
    if (version)      target.version = *version;
    if (capabilities) target.capabilities = *capabilities;
    if (dependencies) target.dependencies = *dependencies;
    if (tags)         target.tags = *tags;
    if (interface)    target.interface = *interface;
}

bool ComponentMetadataPatch::empty() const {
    return !type && !version && !capabilities && !dependencies && !tags && !interface;
}

namespace {

    Result<std::vector<std::string>> stringList(const nlohmann::json& v, const char* key) {
        if (!v.is_array())
            return makeError(FabricErr::InvalidConfig, std::string(key) + " must be an array of strings");
        std::vector<std::string> out;
        for (const auto& e : v) {
            if (!e.is_string())
                return makeError(FabricErr::InvalidConfig, std::string(key) + " must be an array of strings");
            out.push_back(e.get<std::string>());
        }
        return out;
    }

}

Result<ComponentMetadataPatch> ComponentMetadataPatch::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
        return makeError(FabricErr::InvalidConfig, "metadata patch must be an object");

    ComponentMetadataPatch p;
    try {
        if (auto it = j.find("type"); it != j.end()) p.type = it->get<std::string>();
        if (auto it = j.find("version"); it != j.end()) p.version = it->get<std::string>();
        if (auto it = j.find("capabilities"); it != j.end())
            p.capabilities = it->get<std::vector<Capability>>();
        if (auto it = j.find("interface"); it != j.end()) p.interface = *it;
    }
    catch (const nlohmann::json::exception& ex) {
        return makeError(FabricErr::InvalidConfig, std::string("bad metadata patch: ") + ex.what());
    }

    if (auto it = j.find("dependencies"); it != j.end()) {
        auto deps = stringList(*it, "dependencies");
        if (!deps) return deps.error();
        p.dependencies = std::move(deps).value();
    }
    if (auto it = j.find("tags"); it != j.end()) {
        auto tags = stringList(*it, "tags");
        if (!tags) return tags.error();
        p.tags = std::move(tags).value();
    }
    return p;
}

}
