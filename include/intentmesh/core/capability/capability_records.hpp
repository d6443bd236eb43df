/**
 * @file capability_records.hpp
 * @brief Delegation, revocation and temporal capability records plus context policies.
 *
 * Records are pure data. Creating one has no side effect; validity is checked
 * separately against a caller-supplied set of available capabilities or a clock.
 */
#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/capability/capability.hpp"

namespace intentmesh {

    /**
     * @struct Delegation
     * @brief A capability handed from a grantor to a grantee.
     */
    struct Delegation {
        Capability  capability;
        std::string grantor;
        std::string grantee;
    };

    /**
     * @struct Revocation
     * @brief A capability withdrawn from its holder.
     */
    struct Revocation {
        Capability  capability;
        std::string holder;
    };

    Delegation delegateCapability(const Capability& c, const std::string& grantor, const std::string& grantee);
    std::vector<Delegation> delegateCapabilities(const std::vector<Capability>& list,
                                                 const std::string& grantor,
                                                 const std::string& grantee);

    /**
     * @brief True iff the delegated capability is implied by some capability in @p available.
     */
    bool validateDelegation(const Delegation& d, const std::vector<Capability>& available,
                            const ActionGraph& graph = ActionGraph::standard());

    Revocation revokeCapability(const Capability& c, const std::string& holder);
    std::vector<Revocation> revokeCapabilities(const std::vector<Capability>& list, const std::string& holder);

    /**
     * @class TemporalCapability
     * @brief A capability valid over the half-open window [validFrom, validUntil).
     */
    class TemporalCapability {
    public:
        using TimePoint = std::chrono::system_clock::time_point;

        TemporalCapability(Capability c, TimePoint validFrom, TimePoint validUntil)
            : capability_(std::move(c)), validFrom_(validFrom), validUntil_(validUntil) {}

        const Capability& capability() const { return capability_; }
        TimePoint validFrom() const { return validFrom_; }
        TimePoint validUntil() const { return validUntil_; }

    private:
        Capability capability_;
        TimePoint  validFrom_;
        TimePoint  validUntil_;
    };

    TemporalCapability createTemporalCapability(const Capability& c,
                                                TemporalCapability::TimePoint validFrom,
                                                TemporalCapability::TimePoint validUntil);

    /**
     * @brief True iff validFrom <= now < validUntil.
     */
    bool validateTemporalCapability(const TemporalCapability& record,
                                    TemporalCapability::TimePoint now = std::chrono::system_clock::now());

    /**
     * @brief Policy deciding whether a capability may be exercised in a context.
     */
    using ContextPolicy = std::function<bool(const Capability&, const nlohmann::json& context)>;

    /**
     * @brief Policy that accepts every capability in every context.
     */
    ContextPolicy allowAllPolicy();

    /**
     * @brief Policy gating on the UTC hour of `context["time"]` (Unix seconds).
     *
     * Accepts when fromHour <= hour < untilHour. When fromHour > untilHour the
     * window wraps past midnight, so (22, 6) accepts 22:00 through 05:59.
     * A context without a numeric `time` field is accepted.
     */
    ContextPolicy timeWindowPolicy(int fromHour, int untilHour);

    /**
     * @brief Apply @p policy to @p c in @p context. A policy that throws rejects.
     */
    bool validateCapabilityInContext(const Capability& c, const nlohmann::json& context,
                                     const ContextPolicy& policy = allowAllPolicy());

}
