/**
 * @file capability_catalog.hpp
 * @brief CapabilityCatalog: free-text and criteria discovery of declared capabilities.
 *
 * A simpler surface than ComponentDiscovery: entries are declarations
 * (intent text, required and provided fields, effects) registered by
 * capability units at start-up. Entries are never mutated; registering an
 * existing id overwrites it.
 */
#pragma once
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/interfaces/icapability_unit.hpp"
#include "intentmesh/core/util/result.hpp"
#include "intentmesh/core/util/time.hpp"

namespace intentmesh {

    /**
     * @struct CatalogEntry
     * @brief A registered declaration plus where and when it came from.
     */
    struct CatalogEntry {
        std::string              id;
        std::string              intent;
        std::vector<std::string> requiredFields;
        std::vector<std::string> providedFields;
        nlohmann::json           effects = nlohmann::json::array();
        std::string              module;
        SystemClock::time_point  registeredAt;
        nlohmann::json           attributes = nlohmann::json::object();

        /**
         * @brief `{id, intent, requires, provides, effects, module, registered_at}` with
         * the extra attributes merged at top level.
         */
        nlohmann::json toJson() const;
    };

    /**
     * @class CapabilityCatalog
     * @brief Thread-safe table of capability declarations.
     */
    class CapabilityCatalog {
    public:
        /**
         * @brief Register every declaration of @p unit.
         * @return Number of entries stored, or Internal if the unit failed to enumerate
         */
        Result<size_t> registerUnit(const ICapabilityUnit& unit);

        /**
         * @brief Register a batch of units. Failing units are logged and skipped.
         * @return Total entries stored
         */
        size_t registerAll(const std::vector<std::shared_ptr<ICapabilityUnit>>& units);

        /**
         * @brief Register one declaration explicitly.
         * @return InvalidConfig if the declaration has no id
         */
        Result<void> registerEntry(const CapabilityDeclaration& decl, const std::string& module);

        /**
         * @brief Entries whose intent text contains at least one query word (case-insensitive).
         */
        std::vector<CatalogEntry> discover(std::string_view query) const;

        /**
         * @brief Entries satisfying every criterion (logical AND).
         *
         * - `requires`: entry must provide every listed field
         * - `provides`: entry must require every listed field
         * - `intent`:   text match as in discover(query)
         * - any other key: equality with the entry field or attribute of that name
         *
         * A string @p criteria is treated as a free-text query.
         */
        std::vector<CatalogEntry> discoverByCriteria(const nlohmann::json& criteria) const;

        /**
         * @return NotFound for an unknown id
         */
        Result<CatalogEntry> get(const std::string& id) const;

        /**
         * @brief Every entry, ordered by id.
         */
        std::vector<CatalogEntry> listAll() const;

        size_t size() const;

        /**
         * @brief True if any whitespace-separated word of @p query occurs in @p intent.
         */
        static bool intentMatches(std::string_view intent, std::string_view query);

    private:
        void store(const CapabilityDeclaration& decl, const std::string& module);

        std::map<std::string, CatalogEntry> entries_;
        mutable std::shared_mutex mx_;
    };

}
