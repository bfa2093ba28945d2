#include "asr/model_preset.hpp"
#include <algorithm>
#include <cctype>

namespace asr {

const char* to_string(ModelPreset preset) {
    switch (preset) {
    case ModelPreset::Tiny:   return "tiny";
    case ModelPreset::Base:   return "base";
    case ModelPreset::Small:  return "small";
    case ModelPreset::Medium: return "medium";
    case ModelPreset::Large:  return "large";
    }
    return "base";
}

std::optional<ModelPreset> parse_preset(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    for (ModelPreset p : all_presets()) {
        if (lower == to_string(p)) return p;
    }
    return std::nullopt;
}

std::vector<ModelPreset> all_presets() {
    return {ModelPreset::Tiny, ModelPreset::Base, ModelPreset::Small,
            ModelPreset::Medium, ModelPreset::Large};
}

int recommended_workers(ModelPreset preset, int max_workers) {
    int n = 2;
    if (preset == ModelPreset::Medium || preset == ModelPreset::Large) {
        n = 1;
    }
    return std::max(1, std::min(n, max_workers));
}

} // namespace asr
