#include "core/model_normalizer.h"

#include <algorithm>

namespace chatgw {

ModelNormalizer::ModelNormalizer()
    : ModelNormalizer(kDefaultModel, builtinAliases()) {}

ModelNormalizer::ModelNormalizer(std::string default_model, std::map<std::string, std::string> aliases)
    : default_model_(std::move(default_model)), aliases_(std::move(aliases)) {
    if (default_model_.empty()) {
        default_model_ = kDefaultModel;
    }
}

std::map<std::string, std::string> ModelNormalizer::builtinAliases() {
    return {{"llama3.1", kDefaultModel}};
}

std::string ModelNormalizer::normalize(const std::optional<std::string>& model) const {
    if (!model) {
        return default_model_;
    }

    const std::string& name = *model;
    auto alias = aliases_.find(name);
    if (alias != aliases_.end()) {
        return alias->second;
    }

    // "major.minor" style names are coerced into "name:tag"
    if (name.find('.') != std::string::npos && name.find(':') == std::string::npos) {
        std::string out = name;
        std::replace(out.begin(), out.end(), '.', ':');
        return out;
    }
    return name;
}

std::string normalize_model(const std::optional<std::string>& model) {
    static const ModelNormalizer normalizer;
    return normalizer.normalize(model);
}

}  // namespace chatgw
