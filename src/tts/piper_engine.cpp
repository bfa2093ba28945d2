#include "tts/piper_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <piper.h>

#include <filesystem>

namespace tts {

PiperEngine::PiperEngine(const std::string& voice_path, const std::string& espeak_data_path) {
    if (!std::filesystem::exists(voice_path)) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "voice model not found: " + voice_path);
    }
    const std::string config_path = voice_path + ".json";
    synth_ = piper_create(voice_path.c_str(),
                          std::filesystem::exists(config_path) ? config_path.c_str() : nullptr,
                          espeak_data_path.empty() ? nullptr : espeak_data_path.c_str());
    if (!synth_) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "piper could not load voice " + voice_path);
    }

    // Sample rate comes with the first chunk; probe it once so the output can be opened up front
    piper_synthesize_options options = piper_default_synthesize_options(synth_);
    if (piper_synthesize_start(synth_, ".", &options) == PIPER_OK) {
        piper_audio_chunk chunk;
        int rc = PIPER_OK;
        while ((rc = piper_synthesize_next(synth_, &chunk)) == PIPER_OK) {
            if (chunk.sample_rate > 0) sample_rate_ = chunk.sample_rate;
            if (chunk.is_last) break;
        }
    }
    core::log_info("[tts] piper voice " + voice_path + " loaded (" + std::to_string(sample_rate_) + " Hz)");
}

PiperEngine::~PiperEngine() {
    if (synth_) {
        piper_free(synth_);
    }
}

void PiperEngine::synthesize(const std::string& text, float length_scale, const ChunkCallback& on_chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    piper_synthesize_options options = piper_default_synthesize_options(synth_);
    if (length_scale > 0.0f) {
        options.length_scale = length_scale;
    }
    if (piper_synthesize_start(synth_, text.c_str(), &options) != PIPER_OK) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "piper rejected the text");
    }

    piper_audio_chunk chunk;
    bool keep_going = true;
    while (true) {
        const int rc = piper_synthesize_next(synth_, &chunk);
        if (rc == PIPER_DONE) break;
        if (rc != PIPER_OK) {
            throw core::Error(core::ErrorCode::SynthesisFailed, "piper synthesis failed (" + std::to_string(rc) + ")");
        }
        // After a cancel the remaining sentences are still drained, unplayed
        if (keep_going && chunk.num_samples > 0) {
            keep_going = on_chunk(chunk.samples, chunk.num_samples);
        }
        if (chunk.is_last) break;
    }
}

} // namespace tts
