#include "intentmesh/core/capability/capability.hpp"
#include <algorithm>
#include <deque>
#include <iterator>
#include <unordered_set>

namespace intentmesh {

std::string toString(const Capability& c) {
    return c.action + ":" + c.resource;
}

void to_json(nlohmann::json& j, const Capability& c) {
    j = nlohmann::json{ {"action", c.action}, {"resource", c.resource} };
}

void from_json(const nlohmann::json& j, Capability& c) {
    j.at("action").get_to(c.action);
    j.at("resource").get_to(c.resource);
}

/*──────────── ActionGraph ───────────*/
const ActionGraph& ActionGraph::standard() {
    static const ActionGraph g = [] {
        ActionGraph s;
        s.addEdge("admin", "write")
         .addEdge("admin", "delete")
         .addEdge("write", "read");
        return s;
    }();
    return g;
}

ActionGraph& ActionGraph::addEdge(const std::string& stronger, const std::string& weaker) {
    auto& out = edges_[stronger];
    if (std::find(out.begin(), out.end(), weaker) == out.end())
        out.push_back(weaker);
    edges_.try_emplace(weaker);
    return *this;
}

std::vector<std::string> ActionGraph::weakerThan(const std::string& action) const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen{ action };
    std::deque<std::string> frontier{ action };

    while (!frontier.empty()) {
        auto cur = std::move(frontier.front());
        frontier.pop_front();
        auto it = edges_.find(cur);
        if (it == edges_.end()) continue;
        for (const auto& next : it->second) {
            if (seen.insert(next).second) {
                out.push_back(next);
                frontier.push_back(next);
            }
        }
    }
    return out;
}

bool ActionGraph::dominates(const std::string& stronger, const std::string& weaker) const {
    if (stronger == weaker) return true;
    auto below = weakerThan(stronger);
    return std::find(below.begin(), below.end(), weaker) != below.end();
}

std::vector<std::string> ActionGraph::actions() const {
    std::vector<std::string> out;
    out.reserve(edges_.size());
    for (const auto& [action, _] : edges_) out.push_back(action);
    return out;
}

/*──────────── constructors ───────────*/
Capability createCapability(std::string action, std::string resource) {
    return Capability{ std::move(action), std::move(resource) };
}

std::vector<Capability> createCapabilities(const std::vector<std::string>& actions,
                                           const std::string& resource) {
    std::vector<Capability> out;
    out.reserve(actions.size());
    for (const auto& a : actions) out.push_back(createCapability(a, resource));
    return out;
}

/*──────────── implication ───────────*/
bool implies(const Capability& a, const Capability& b, const ActionGraph& graph) {
    if (a == b) return true;
    if (a.resource != b.resource) return false;
    return graph.dominates(a.action, b.action);
}

CapabilitySet getImpliedCapabilities(const Capability& c, const ActionGraph& graph) {
    CapabilitySet out;
    for (auto& action : graph.weakerThan(c.action))
        out.insert(Capability{ std::move(action), c.resource });
    return out;
}

/*──────────── set operations ───────────*/
CapabilitySet composeCapabilities(const std::vector<Capability>& list) {
    return CapabilitySet(list.begin(), list.end());
}

CapabilitySet mergeCapabilitySets(const std::vector<CapabilitySet>& sets) {
    CapabilitySet out;
    for (const auto& s : sets) out.insert(s.begin(), s.end());
    return out;
}

std::vector<Capability> filterCapabilities(const std::vector<Capability>& list,
                                           const std::function<bool(const Capability&)>& pred) {
    std::vector<Capability> out;
    std::copy_if(list.begin(), list.end(), std::back_inserter(out), pred);
    return out;
}

/*──────────── validation ───────────*/
bool validateCapability(const Capability& target,
                        const std::vector<Capability>& available,
                        const ActionGraph& graph) {
    return std::any_of(available.begin(), available.end(),
        [&](const Capability& have) { return implies(have, target, graph); });
}

bool validateCapabilities(const std::vector<Capability>& required,
                          const std::vector<Capability>& available,
                          const ActionGraph& graph) {
    return std::all_of(required.begin(), required.end(),
        [&](const Capability& need) { return validateCapability(need, available, graph); });
}

/*──────────── inheritance ───────────*/
CapabilityHierarchy createInheritanceHierarchy(const std::vector<Capability>& list,
                                               const ActionGraph& graph) {
    CapabilityHierarchy out;
    for (const auto& c : list) {
        std::vector<Capability> implied;
        for (const auto& other : list) {
            if (other != c && implies(c, other, graph))
                implied.push_back(other);
        }
        if (!implied.empty()) out[c] = std::move(implied);
    }
    return out;
}

bool inheritsFrom(const Capability& c, const Capability& parent, const CapabilityHierarchy& hierarchy) {
    auto it = hierarchy.find(c);
    if (it == hierarchy.end()) return false;
    return std::find(it->second.begin(), it->second.end(), parent) != it->second.end();
}

}
