#include "intentmesh/core/capability/capability_records.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <ctime>

namespace intentmesh {

Delegation delegateCapability(const Capability& c, const std::string& grantor, const std::string& grantee) {
    return Delegation{ c, grantor, grantee };
}

std::vector<Delegation> delegateCapabilities(const std::vector<Capability>& list,
                                             const std::string& grantor,
                                             const std::string& grantee) {
    std::vector<Delegation> out;
    out.reserve(list.size());
    for (const auto& c : list) out.push_back(delegateCapability(c, grantor, grantee));
    return out;
}

bool validateDelegation(const Delegation& d, const std::vector<Capability>& available,
                        const ActionGraph& graph) {
    return validateCapability(d.capability, available, graph);
}

Revocation revokeCapability(const Capability& c, const std::string& holder) {
    return Revocation{ c, holder };
}

std::vector<Revocation> revokeCapabilities(const std::vector<Capability>& list, const std::string& holder) {
    std::vector<Revocation> out;
    out.reserve(list.size());
    for (const auto& c : list) out.push_back(revokeCapability(c, holder));
    return out;
}

TemporalCapability createTemporalCapability(const Capability& c,
                                            TemporalCapability::TimePoint validFrom,
                                            TemporalCapability::TimePoint validUntil) {
    return TemporalCapability(c, validFrom, validUntil);
}

bool validateTemporalCapability(const TemporalCapability& record, TemporalCapability::TimePoint now) {
    return record.validFrom() <= now && now < record.validUntil();
}

/*──────────── context policies ───────────*/
ContextPolicy allowAllPolicy() {
    return [](const Capability&, const nlohmann::json&) { return true; };
}

ContextPolicy timeWindowPolicy(int fromHour, int untilHour) {
    return [fromHour, untilHour](const Capability&, const nlohmann::json& ctx) {
        if (!ctx.is_object()) return true;
        auto it = ctx.find("time");
        if (it == ctx.end() || !it->is_number_integer()) return true;

        std::time_t secs = static_cast<std::time_t>(it->get<int64_t>());
        std::tm utc{};
        gmtime_r(&secs, &utc);
        if (fromHour <= untilHour)
            return utc.tm_hour >= fromHour && utc.tm_hour < untilHour;
        return utc.tm_hour >= fromHour || utc.tm_hour < untilHour;   // wraps past midnight
    };
}

bool validateCapabilityInContext(const Capability& c, const nlohmann::json& context,
                                 const ContextPolicy& policy) {
    if (!policy) return true;
    try {
        return policy(c, context);
    } catch (const std::exception& ex) {
        LOG_WARN("[Capability] context policy failed for " + toString(c) + ": " + ex.what());
        return false;
    }
}

}
