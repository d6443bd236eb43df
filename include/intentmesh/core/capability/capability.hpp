/**
 * @file capability.hpp
 * @brief Capability values and their implication lattice.
 *
 * A capability is an (action, resource) pair. Actions are ordered by a
 * data-driven ActionGraph of "stronger -> weaker" edges that applies to every
 * resource alike: a capability implies another when both name the same resource
 * and its action reaches the other's action through the graph.
 */
#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <nlohmann/json.hpp>

namespace intentmesh {

    /**
     * @struct Capability
     * @brief Authorization unit compared by structural equality.
     */
    struct Capability {
        std::string action;    ///< e.g. "read", "write", "delete", "admin"
        std::string resource;  ///< Opaque identifier such as a path

        bool operator==(const Capability& o) const {
            return action == o.action && resource == o.resource;
        }
        bool operator!=(const Capability& o) const { return !(*this == o); }
        bool operator<(const Capability& o) const {
            return std::tie(resource, action) < std::tie(o.resource, o.action);
        }
    };

    using CapabilitySet = std::set<Capability>;

    /**
     * @brief "action:resource" rendering for log messages.
     */
    std::string toString(const Capability& c);

    void to_json(nlohmann::json& j, const Capability& c);
    void from_json(const nlohmann::json& j, Capability& c);

    /**
     * @class ActionGraph
     * @brief Directed graph of action-implication edges, keyed by action name.
     *
     * New action kinds are added with addEdge() without touching the engine.
     * Cycles are tolerated; traversal visits each action once.
     */
    class ActionGraph {
    public:
        /**
         * @brief The standard lattice: admin -> write, admin -> delete, write -> read.
         */
        static const ActionGraph& standard();

        /**
         * @brief Declare that @p stronger directly implies @p weaker.
         * @return *this for chaining
         */
        ActionGraph& addEdge(const std::string& stronger, const std::string& weaker);

        /**
         * @brief True if @p stronger == @p weaker or @p weaker is reachable from @p stronger.
         */
        bool dominates(const std::string& stronger, const std::string& weaker) const;

        /**
         * @brief All actions reachable from @p action, excluding itself, in breadth-first order.
         */
        std::vector<std::string> weakerThan(const std::string& action) const;

        /**
         * @brief Every action mentioned by an edge, sorted.
         */
        std::vector<std::string> actions() const;

    private:
        std::map<std::string, std::vector<std::string>> edges_;
    };

    /* ---- constructors ---------------------------------------------------- */

    Capability createCapability(std::string action, std::string resource);
    std::vector<Capability> createCapabilities(const std::vector<std::string>& actions,
                                               const std::string& resource);

    /**
     * @brief Shorthand constructors for the standard actions.
     */
    namespace caps {
        inline Capability read(std::string resource)  { return createCapability("read", std::move(resource)); }
        inline Capability write(std::string resource) { return createCapability("write", std::move(resource)); }
        inline Capability del(std::string resource)   { return createCapability("delete", std::move(resource)); }
        inline Capability admin(std::string resource) { return createCapability("admin", std::move(resource)); }
    }

    /* ---- implication ----------------------------------------------------- */

    /**
     * @brief True iff @p a == @p b, or @p a is a stronger action on the same resource.
     */
    bool implies(const Capability& a, const Capability& b,
                 const ActionGraph& graph = ActionGraph::standard());

    /**
     * @brief Closure of capabilities implied by @p c, excluding @p c itself.
     */
    CapabilitySet getImpliedCapabilities(const Capability& c,
                                         const ActionGraph& graph = ActionGraph::standard());

    /* ---- set operations -------------------------------------------------- */

    CapabilitySet composeCapabilities(const std::vector<Capability>& list);
    CapabilitySet mergeCapabilitySets(const std::vector<CapabilitySet>& sets);
    std::vector<Capability> filterCapabilities(const std::vector<Capability>& list,
                                               const std::function<bool(const Capability&)>& pred);

    /* ---- validation ------------------------------------------------------ */

    /**
     * @brief True iff some capability in @p available implies @p target.
     */
    bool validateCapability(const Capability& target,
                            const std::vector<Capability>& available,
                            const ActionGraph& graph = ActionGraph::standard());

    /**
     * @brief True iff every required capability is implied by some available one.
     *
     * The match is existential, not positional.
     */
    bool validateCapabilities(const std::vector<Capability>& required,
                              const std::vector<Capability>& available,
                              const ActionGraph& graph = ActionGraph::standard());

    /* ---- inheritance ----------------------------------------------------- */

    using CapabilityHierarchy = std::map<Capability, std::vector<Capability>>;

    /**
     * @brief Map each capability of @p list to the other members of @p list it implies.
     *
     * Capabilities that imply nothing else in the list get no entry.
     */
    CapabilityHierarchy createInheritanceHierarchy(const std::vector<Capability>& list,
                                                   const ActionGraph& graph = ActionGraph::standard());

    bool inheritsFrom(const Capability& c, const Capability& parent, const CapabilityHierarchy& hierarchy);

}

namespace std {
    template <>
    struct hash<intentmesh::Capability> {
        size_t operator()(const intentmesh::Capability& c) const noexcept {
            size_t h = hash<string>{}(c.action);
            return h ^ (hash<string>{}(c.resource) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };
}
