#include "internal/core/discovery/attribute_index.hpp"
#include <algorithm>

namespace intentmesh {

    /*──────────── add ───────────*/
    void AttributeIndex::add(const std::string& id,
        const std::string& field,
        const std::string& value)
    {
        auto& hist = back_[id];
        for (const auto& fv : hist)
            if (fv.first == field && fv.second == value) return;

        idx_[field][value].insert(id);
        hist.emplace_back(field, value);
    }

    void AttributeIndex::set(const std::string& id,
        const std::string& field,
        const std::vector<std::string>& values)
    {
        removeField(id, field);
        for (const auto& v : values)
            add(id, field, v);
    }

    /*──────────── remove ───────────*/
    void AttributeIndex::removeField(const std::string& id, const std::string& field) {
        auto it = back_.find(id);
        if (it == back_.end()) return;

        auto& hist = it->second;
        for (const auto& [f, v] : hist) {
            if (f != field) continue;
            auto fit = idx_.find(f);
            if (fit == idx_.end()) continue;

            auto& valueMap = fit->second;
            if (auto vit = valueMap.find(v); vit != valueMap.end()) {
                vit->second.erase(id);
                if (vit->second.empty())
                    valueMap.erase(vit);
            }
            if (valueMap.empty())
                idx_.erase(fit);
        }
        hist.erase(std::remove_if(hist.begin(), hist.end(),
                                  [&](const auto& fv) { return fv.first == field; }),
                   hist.end());
    }

    void AttributeIndex::remove(const std::string& id) {
        auto it = back_.find(id);
        if (it == back_.end()) return;

        for (const auto& [f, v] : it->second) {
            auto fit = idx_.find(f);
            if (fit == idx_.end()) continue;

            auto& valueMap = fit->second;
            if (auto vit = valueMap.find(v); vit != valueMap.end()) {
                vit->second.erase(id);
                if (vit->second.empty())
                    valueMap.erase(vit);
            }
            if (valueMap.empty())
                idx_.erase(fit);
        }

        back_.erase(it);
    }

    /*──────────── lookup ────────────*/
    const AttributeIndex::IdSet* AttributeIndex::find(const std::string& field,
        const std::string& value) const
    {
        auto fit = idx_.find(field);
        if (fit == idx_.end()) return nullptr;
        auto vit = fit->second.find(value);
        if (vit == fit->second.end()) return nullptr;
        return &vit->second;
    }

    AttributeIndex::IdSet AttributeIndex::findAll(const std::string& field,
        const std::vector<std::string>& values) const
    {
        IdSet out;
        if (values.empty()) return out;

        const IdSet* first = find(field, values.front());
        if (!first) return out;

        for (const auto& id : *first) {
            bool all = std::all_of(values.begin() + 1, values.end(), [&](const std::string& v) {
                const IdSet* s = find(field, v);
                return s && s->contains(id);
            });
            if (all) out.insert(id);
        }
        return out;
    }

}
