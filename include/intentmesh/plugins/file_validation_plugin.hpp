/**
 * @file file_validation_plugin.hpp
 * @brief FileValidationPlugin: path checks and normalization for file intents.
 *
 * Applies to intents whose type contains "File" (FileReadIntent, FileWriteIntent,
 * FileDeleteIntent, ...). Other intents pass through untouched.
 */
#pragma once

#include "intentmesh/core/interfaces/iplugin.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace intentmesh {

    /**
     * @class FileValidationPlugin
     * @brief Validation plugin for file-handling intents.
     */
    class FileValidationPlugin : public IIntentPlugin {
    public:
        const char* name() const override { return "FileValidationPlugin"; }
        PluginType type() const override { return PluginType::Validation; }
        int priority() const override { return 10; }

        /**
         * @brief Reject file intents without a non-empty string `path` ("invalid_file_path").
         */
        Result<Intent> validate(const Intent& intent) override;

        /**
         * @brief Normalize `payload.path`: collapse repeated '/' and drop a trailing '/'.
         */
        Result<Intent> transform(const Intent& intent) override;

        /**
         * @brief Keep candidates whose id contains "file"; all candidates if none does.
         */
        std::vector<std::string> route(const Intent& intent, std::vector<std::string> candidates) override;

        /**
         * @brief Under strategy "file_operations", order reads before writes before deletes.
         */
        std::vector<Intent> compose(std::vector<Intent> intents, std::string_view strategy) override;

        static std::string normalizePath(std::string_view path);
        static bool isFileIntent(const Intent& intent);
    };

}
