#pragma once
#include "asr/transcription_engine.hpp"
#include <string>
#include <vector>

namespace asr {

struct WhisperOptions {
    std::string model_dir = "models";
    std::string language = "en";
    int n_threads = 0;     // per inference call; 0 = hardware threads / workers
    int workers = 2;       // expected concurrent calls, used for the auto thread count
    bool use_gpu = false;
};

// whisper.cpp model loader. Each loaded preset owns one whisper_context and a
// pool of whisper_state objects so several chunks can be decoded concurrently.
class WhisperBackend : public IModelBackend {
public:
    explicit WhisperBackend(WhisperOptions options);

    std::unique_ptr<IRecognitionModel> load(ModelPreset preset) override;

    // Candidate model files for a preset under model_dir, in lookup order.
    std::vector<std::string> candidate_paths(ModelPreset preset) const;

private:
    WhisperOptions options_;
};

// Trim whitespace and drop non-speech markers ("[BLANK_AUDIO]", "[ Silence ]", ...).
std::string clean_segment_text(const std::string& raw);

}
