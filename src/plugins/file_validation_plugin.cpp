#include "intentmesh/plugins/file_validation_plugin.hpp"
#include <algorithm>
#include <iterator>

namespace intentmesh {

namespace {

    int operationRank(const std::string& type) {
        if (type.find("Read") != std::string::npos)   return 1;
        if (type.find("Write") != std::string::npos)  return 2;
        if (type.find("Delete") != std::string::npos) return 3;
        return 4;
    }

}

bool FileValidationPlugin::isFileIntent(const Intent& intent) {
    return intent.type().find("File") != std::string::npos;
}

std::string FileValidationPlugin::normalizePath(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

Result<Intent> FileValidationPlugin::validate(const Intent& intent) {
    if (!isFileIntent(intent)) return intent;

    auto it = intent.payload().find("path");
    if (it == intent.payload().end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        return makeError(FabricErr::Validation, "invalid_file_path");
    return intent;
}

Result<Intent> FileValidationPlugin::transform(const Intent& intent) {
    if (!isFileIntent(intent)) return intent;

    auto it = intent.payload().find("path");
    if (it == intent.payload().end() || !it->is_string()) return intent;

    nlohmann::json payload = intent.payload();
    payload["path"] = normalizePath(it->get_ref<const std::string&>());
    return intent.withPayload(std::move(payload));
}

std::vector<std::string> FileValidationPlugin::route(const Intent& intent, std::vector<std::string> candidates) {
    if (!isFileIntent(intent)) return candidates;

    std::vector<std::string> fileTargets;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(fileTargets),
                 [](const std::string& id) { return id.find("file") != std::string::npos; });
    return fileTargets.empty() ? candidates : fileTargets;
}

std::vector<Intent> FileValidationPlugin::compose(std::vector<Intent> intents, std::string_view strategy) {
    if (strategy != "file_operations") return intents;

    std::stable_sort(intents.begin(), intents.end(), [](const Intent& a, const Intent& b) {
        return operationRank(a.type()) < operationRank(b.type());
    });
    return intents;
}

}
