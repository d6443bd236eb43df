/**
 * @file user_validation_plugin.hpp
 * @brief UserValidationPlugin: user id checks and session stamping for user intents.
 */
#pragma once

#include "intentmesh/core/interfaces/iplugin.hpp"

namespace intentmesh {

    /**
     * @class UserValidationPlugin
     * @brief Validation plugin for intents whose type contains "User".
     *
     * validate() requires a non-empty string `user_id` ("invalid_user_id").
     * transform() stamps `payload.session_context.validated_at` (epoch ms).
     */
    class UserValidationPlugin : public IIntentPlugin {
    public:
        const char* name() const override { return "UserValidationPlugin"; }
        PluginType type() const override { return PluginType::Validation; }
        int priority() const override { return 8; }

        Result<Intent> validate(const Intent& intent) override;
        Result<Intent> transform(const Intent& intent) override;
    };

}
