#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/util/time.hpp"
#include "internal/core/util/random.hpp"
#include <array>

namespace intentmesh {

std::string_view toString(CompositionStrategy s) {
    switch (s) {
    case CompositionStrategy::Sequential:  return "sequential";
    case CompositionStrategy::Parallel:    return "parallel";
    case CompositionStrategy::Conditional: return "conditional";
    case CompositionStrategy::Pipeline:    return "pipeline";
    case CompositionStrategy::FanOut:      return "fan_out";
    }
    return "sequential";
}

std::optional<CompositionStrategy> parseStrategy(std::string_view name) {
    if (name == "sequential")  return CompositionStrategy::Sequential;
    if (name == "parallel")    return CompositionStrategy::Parallel;
    if (name == "conditional") return CompositionStrategy::Conditional;
    if (name == "pipeline")    return CompositionStrategy::Pipeline;
    if (name == "fan_out")     return CompositionStrategy::FanOut;
    return std::nullopt;
}

/*──────────── Intent ───────────*/
Intent::Intent(std::string id,
               std::string type,
               nlohmann::json payload,
               std::vector<Capability> capabilities,
               nlohmann::json metadata)
    : id_(std::move(id)),
      type_(std::move(type)),
      payload_(std::move(payload)),
      capabilities_(std::move(capabilities)),
      metadata_(std::move(metadata)) {
    if (!metadata_.is_object()) metadata_ = nlohmann::json::object();
}

bool Intent::isComposite() const {
    return metadata_.value("composite", false);
}

std::optional<std::string> Intent::delegatedTo() const {
    auto it = metadata_.find("delegated_to");
    if (it == metadata_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

Intent Intent::withMetadata(const std::string& key, nlohmann::json value) const {
    Intent copy = *this;
    copy.metadata_[key] = std::move(value);
    return copy;
}

Intent Intent::withPayload(nlohmann::json payload) const {
    Intent copy = *this;
    copy.payload_ = std::move(payload);
    return copy;
}

nlohmann::json Intent::toJson() const {
    return nlohmann::json{
        {"id", id_},
        {"type", type_},
        {"payload", payload_},
        {"capabilities", capabilities_},
        {"metadata", metadata_}
    };
}

/*──────────── CompositeIntent ───────────*/
CompositeIntent::CompositeIntent(std::string id,
                                 std::vector<Intent> intents,
                                 CompositionStrategy strategy,
                                 nlohmann::json metadata)
    : id_(std::move(id)),
      intents_(std::move(intents)),
      strategy_(strategy),
      metadata_(std::move(metadata)) {}

Intent CompositeIntent::asIntent() const {
    nlohmann::json subs = nlohmann::json::array();
    std::vector<Capability> required;
    for (const auto& i : intents_) {
        subs.push_back(i.id());
        required.insert(required.end(), i.capabilities().begin(), i.capabilities().end());
    }
    auto composed = composeCapabilities(required);
    return Intent(id_, "composite",
                  nlohmann::json{ {"intents", subs}, {"strategy", toString(strategy_)} },
                  std::vector<Capability>(composed.begin(), composed.end()),
                  metadata_);
}

/*──────────── factory ───────────*/
std::string generateIntentId() {
    std::array<uint8_t, 8> tok{};
    randomFill(tok);
    return "intent_" + std::to_string(epochNanos()) + "_" + toHex(tok);
}

Intent createIntent(std::string type, nlohmann::json payload, std::vector<Capability> capabilities) {
    if (payload.is_null()) payload = nlohmann::json::object();
    nlohmann::json meta{
        {"created_at", epochNanos()},
        {"dynamic", true}
    };
    return Intent(generateIntentId(), std::move(type), std::move(payload),
                  std::move(capabilities), std::move(meta));
}

CompositeIntent createCompositeIntent(std::vector<Intent> intents, CompositionStrategy strategy) {
    nlohmann::json meta{
        {"created_at", epochNanos()},
        {"dynamic", true},
        {"composite", true}
    };
    return CompositeIntent(generateIntentId(), std::move(intents), strategy, std::move(meta));
}

}
