#pragma once

#include "tts/speech_synthesizer.hpp"

#include <mutex>
#include <string>

struct piper_synthesizer;

namespace tts {

/**
 * @brief ISpeechEngine backed by libpiper (ONNX voice + espeak-ng phonemizer)
 *
 * The voice config is read from "<voice>.json" next to the model.
 * Throws core::Error(SynthesisFailed) if the voice cannot be loaded.
 */
class PiperEngine : public ISpeechEngine {
public:
    explicit PiperEngine(const std::string& voice_path, const std::string& espeak_data_path = "");
    ~PiperEngine() override;

    PiperEngine(const PiperEngine&) = delete;
    PiperEngine& operator=(const PiperEngine&) = delete;

    int sample_rate() const override { return sample_rate_; }
    void synthesize(const std::string& text, float length_scale, const ChunkCallback& on_chunk) override;

private:
    piper_synthesizer* synth_ = nullptr;
    std::mutex mutex_;          // piper synthesizers are not reentrant
    int sample_rate_ = 22050;
};

} // namespace tts
