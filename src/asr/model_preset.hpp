#pragma once
#include <optional>
#include <string>
#include <vector>

namespace asr {

// Whisper model sizes, ordered from fastest/least accurate to slowest/most accurate.
enum class ModelPreset {
    Tiny,
    Base,
    Small,
    Medium,
    Large
};

const char* to_string(ModelPreset preset);

// Case-insensitive ("Base", "base"); nullopt for unknown names.
std::optional<ModelPreset> parse_preset(const std::string& name);

std::vector<ModelPreset> all_presets();

// Concurrent inference calls worth running for a preset. Heavier models get
// fewer workers to bound memory (each worker holds its own decoder state).
int recommended_workers(ModelPreset preset, int max_workers);

} // namespace asr
