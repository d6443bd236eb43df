/**
 * @file error_types.hpp
 * @brief Error type definitions for IntentMesh.
 *
 * Provides the error taxonomy shared by every service and the Error object
 * carried by Result<T>.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace intentmesh {

    /**
     * @enum FabricErr
     * @brief Error codes for registry, catalog, routing and composition operations.
     */
    enum class FabricErr : int {
        NotFound = 1,                  ///< Catalog or registry lookup miss
        NoAvailableTargets,            ///< Empty candidate set for load balancing
        UnsupportedCompositionPattern, ///< Unknown composition strategy
        TargetProcessorNotFound,       ///< Delegation to an unknown id
        ComponentNotRegistered,        ///< Metadata update on an unknown id
        Timeout,                       ///< Dispatch exceeded its deadline
        MaxRetriesExceeded,            ///< Retry overlay gave up, cause holds the last failure
        NoRoute,                       ///< No target resolvable for an intent
        Validation,                    ///< Plugin-defined validation error, reason is verbatim
        PluginFailure,                 ///< A plugin hook raised
        InvalidConfig,                 ///< Configuration rejected
        Internal = 99                  ///< Unexpected failure inside a collaborator
    };

    /**
     * @brief Snake-case name of an error code (e.g. "max_retries_exceeded").
     */
    inline std::string_view toString(FabricErr code) {
        switch (code) {
        case FabricErr::NotFound:                      return "not_found";
        case FabricErr::NoAvailableTargets:            return "no_available_targets";
        case FabricErr::UnsupportedCompositionPattern: return "unsupported_composition_pattern";
        case FabricErr::TargetProcessorNotFound:       return "target_processor_not_found";
        case FabricErr::ComponentNotRegistered:        return "component_not_registered";
        case FabricErr::Timeout:                       return "timeout";
        case FabricErr::MaxRetriesExceeded:            return "max_retries_exceeded";
        case FabricErr::NoRoute:                       return "no_route";
        case FabricErr::Validation:                    return "validation";
        case FabricErr::PluginFailure:                 return "plugin_failure";
        case FabricErr::InvalidConfig:                 return "invalid_config";
        case FabricErr::Internal:                      return "internal";
        }
        return "internal";
    }

    /**
     * @struct Error
     * @brief Error object returned by failed operations.
     *
     * `reason` is a short machine-readable kind (plugin errors such as
     * "invalid_file_path" pass through here unchanged) or a description.
     */
    struct Error {
        FabricErr                    code{ FabricErr::Internal }; ///< Error code
        std::string                  reason;                      ///< Reason or plugin-defined kind
        std::shared_ptr<const Error> cause;                       ///< Underlying failure, if any

        /**
         * @brief Render as "code: reason (caused by ...)".
         */
        std::string describe() const {
            std::string out{ toString(code) };
            if (!reason.empty()) out += ": " + reason;
            if (cause) out += " (caused by " + cause->describe() + ")";
            return out;
        }
    };

    inline Error makeError(FabricErr code, std::string reason = {}) {
        return Error{ code, std::move(reason), nullptr };
    }

    inline Error wrapError(FabricErr code, Error cause) {
        std::string reason = cause.reason.empty() ? std::string(toString(cause.code)) : cause.reason;
        return Error{ code, std::move(reason), std::make_shared<const Error>(std::move(cause)) };
    }

}
