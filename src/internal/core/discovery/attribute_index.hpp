/**
 * @file attribute_index.hpp
 * @brief Field/value index over component ids used to pre-filter discovery queries.
 *
 * Unlike a one-value-per-field index, a component may carry several values for
 * the same field (one entry per tag). Not synchronized: owned by the discovery
 * mailbox.
 */
#pragma once
#include <string>
#include <utility>
#include <vector>
#include <ankerl/unordered_dense.h>

namespace intentmesh {

    /**
     * @class AttributeIndex
     * @brief Maps (field, value) to the set of component ids carrying it.
     */
    class AttributeIndex {
    public:
        using IdSet = ankerl::unordered_dense::set<std::string>;

        /**
         * @brief Record that component @p id carries @p value for @p field.
         */
        void add(const std::string& id, const std::string& field, const std::string& value);

        /**
         * @brief Replace every value of @p field for @p id.
         */
        void set(const std::string& id, const std::string& field, const std::vector<std::string>& values);

        /**
         * @brief Remove all index entries for a component id.
         */
        void remove(const std::string& id);

        /**
         * @brief Ids carrying @p value for @p field.
         * @return Pointer into the index, nullptr if none. Invalidated by the next mutation.
         */
        const IdSet* find(const std::string& field, const std::string& value) const;

        /**
         * @brief Ids carrying every value in @p values for @p field.
         */
        IdSet findAll(const std::string& field, const std::vector<std::string>& values) const;

        size_t trackedIds() const { return back_.size(); }

    private:
        void removeField(const std::string& id, const std::string& field);

        ankerl::unordered_dense::map<std::string,                    // field
            ankerl::unordered_dense::map<std::string, IdSet>> idx_;  // value → {id…}

        /* reverse mapping for cleanup: id → (field, value) pairs */
        ankerl::unordered_dense::map<std::string,
            std::vector<std::pair<std::string, std::string>>> back_;
    };

}
