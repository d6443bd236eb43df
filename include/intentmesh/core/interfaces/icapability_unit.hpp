/**
 * @file icapability_unit.hpp
 * @brief Interface for units that declare catalog capabilities.
 */
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace intentmesh {

    /**
     * @struct CapabilityDeclaration
     * @brief One declared capability of a unit.
     *
     * Effects are `{type, opts}` records. Extra attributes are matched by
     * catalog criteria equality.
     */
    struct CapabilityDeclaration {
        std::string              id;
        std::string              intent;          ///< Free-text description
        std::vector<std::string> requiredFields;
        std::vector<std::string> providedFields;
        nlohmann::json           effects = nlohmann::json::array();
        nlohmann::json           attributes = nlohmann::json::object();
    };

    /**
     * @class ICapabilityUnit
     * @brief A module exposing one or more capability declarations.
     */
    class ICapabilityUnit {
    public:
        virtual ~ICapabilityUnit() = default;

        /**
         * @brief Module name stored with each entry.
         */
        virtual std::string moduleName() const = 0;

        /**
         * @brief Declarations to register. May throw; the catalog reports the failure.
         */
        virtual std::vector<CapabilityDeclaration> declarations() const = 0;
    };

}
