#include "intentmesh/plugins/user_validation_plugin.hpp"
#include "intentmesh/core/util/time.hpp"

namespace intentmesh {

namespace {

    bool isUserIntent(const Intent& intent) {
        return intent.type().find("User") != std::string::npos;
    }

}

Result<Intent> UserValidationPlugin::validate(const Intent& intent) {
    if (!isUserIntent(intent)) return intent;

    auto it = intent.payload().find("user_id");
    if (it == intent.payload().end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        return makeError(FabricErr::Validation, "invalid_user_id");
    return intent;
}

Result<Intent> UserValidationPlugin::transform(const Intent& intent) {
    if (!isUserIntent(intent)) return intent;

    nlohmann::json payload = intent.payload();
    if (!payload.is_object()) return intent;

    auto& session = payload["session_context"];
    if (!session.is_object()) session = nlohmann::json::object();
    session["validated_at"] = epochMillis();
    return intent.withPayload(std::move(payload));
}

}
