#include "intentmesh/core/catalog/capability_catalog.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace intentmesh {

namespace {

    std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::vector<std::string> listWrap(const nlohmann::json& v) {
        std::vector<std::string> out;
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        }
        else if (v.is_array()) {
            for (const auto& e : v)
                if (e.is_string()) out.push_back(e.get<std::string>());
        }
        return out;
    }

    bool containsAll(const std::vector<std::string>& have, const std::vector<std::string>& want) {
        return std::all_of(want.begin(), want.end(), [&](const std::string& w) {
            return std::find(have.begin(), have.end(), w) != have.end();
        });
    }

}

nlohmann::json CatalogEntry::toJson() const {
    nlohmann::json j = attributes.is_object() ? attributes : nlohmann::json::object();
    j["id"] = id;
    j["intent"] = intent;
    j["requires"] = requiredFields;
    j["provides"] = providedFields;
    j["effects"] = effects;
    j["module"] = module;
    j["registered_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        registeredAt.time_since_epoch()).count();
    return j;
}

bool CapabilityCatalog::intentMatches(std::string_view intent, std::string_view query) {
    std::string text = lower(intent);
    std::istringstream words{ lower(query) };
    std::string word;
    while (words >> word)
        if (text.find(word) != std::string::npos) return true;
    return false;
}

void CapabilityCatalog::store(const CapabilityDeclaration& decl, const std::string& module) {
    CatalogEntry e;
    e.id = decl.id;
    e.intent = decl.intent;
    e.requiredFields = decl.requiredFields;
    e.providedFields = decl.providedFields;
    e.effects = decl.effects;
    e.module = module;
    e.registeredAt = SystemClock::now();
    e.attributes = decl.attributes;

    std::unique_lock w(mx_);
    entries_.insert_or_assign(decl.id, std::move(e));
}

Result<size_t> CapabilityCatalog::registerUnit(const ICapabilityUnit& unit) {
    std::string module;
    std::vector<CapabilityDeclaration> decls;
    try {
        module = unit.moduleName();
        decls = unit.declarations();
    }
    catch (const std::exception& ex) {
        LOG_ERROR("[CapabilityCatalog] failed to register capabilities from " + module + ": " + ex.what());
        return makeError(FabricErr::Internal, module + ": " + ex.what());
    }

    size_t count = 0;
    for (const auto& d : decls) {
        if (d.id.empty()) {
            LOG_WARN("[CapabilityCatalog] skipping declaration without id from " + module);
            continue;
        }
        store(d, module);
        ++count;
    }
    LOG_INFO("[CapabilityCatalog] registered " + std::to_string(count) + " capabilities from module " + module);
    return count;
}

size_t CapabilityCatalog::registerAll(const std::vector<std::shared_ptr<ICapabilityUnit>>& units) {
    size_t total = 0;
    for (const auto& u : units) {
        if (!u) continue;
        auto r = registerUnit(*u);
        if (r) total += r.value();
    }
    return total;
}

Result<void> CapabilityCatalog::registerEntry(const CapabilityDeclaration& decl, const std::string& module) {
    if (decl.id.empty())
        return makeError(FabricErr::InvalidConfig, "capability declaration has no id");
    store(decl, module);
    LOG_INFO("[CapabilityCatalog] registered " + decl.id + " from module " + module);
    return {};
}

std::vector<CatalogEntry> CapabilityCatalog::discover(std::string_view query) const {
    std::shared_lock r(mx_);
    std::vector<CatalogEntry> out;
    for (const auto& [id, e] : entries_)
        if (intentMatches(e.intent, query)) out.push_back(e);
    return out;
}

std::vector<CatalogEntry> CapabilityCatalog::discoverByCriteria(const nlohmann::json& criteria) const {
    if (criteria.is_string()) return discover(criteria.get<std::string>());
    if (!criteria.is_object()) return {};

    std::shared_lock r(mx_);
    std::vector<CatalogEntry> out;
    for (const auto& [id, e] : entries_) {
        nlohmann::json view;   // built lazily for equality keys
        bool ok = true;
        for (const auto& [key, value] : criteria.items()) {
            if (key == "requires") {
                ok = containsAll(e.providedFields, listWrap(value));
            }
            else if (key == "provides") {
                ok = containsAll(e.requiredFields, listWrap(value));
            }
            else if (key == "intent") {
                ok = value.is_string() && intentMatches(e.intent, value.get<std::string>());
            }
            else {
                if (view.is_null()) view = e.toJson();
                auto it = view.find(key);
                ok = it != view.end() && *it == value;
            }
            if (!ok) break;
        }
        if (ok) out.push_back(e);
    }
    return out;
}

Result<CatalogEntry> CapabilityCatalog::get(const std::string& id) const {
    std::shared_lock r(mx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return makeError(FabricErr::NotFound, id);
    return it->second;
}

std::vector<CatalogEntry> CapabilityCatalog::listAll() const {
    std::shared_lock r(mx_);
    std::vector<CatalogEntry> out;
    out.reserve(entries_.size());
    for (const auto& [id, e] : entries_) out.push_back(e);
    return out;
}

size_t CapabilityCatalog::size() const {
    std::shared_lock r(mx_);
    return entries_.size();
}

}
