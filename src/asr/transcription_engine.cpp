#include "asr/transcription_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <chrono>

namespace asr {

TranscriptionEngine::TranscriptionEngine(std::shared_ptr<IModelBackend> backend)
    : backend_(std::move(backend)) {}

std::shared_ptr<const ModelHandle> TranscriptionEngine::load_preset(ModelPreset preset) {
    std::lock_guard<std::mutex> load_lock(load_mutex_);
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        if (current_ && current_->preset == preset) {
            return current_;
        }
    }
    if (!backend_) {
        throw core::Error(core::ErrorCode::ModelLoadError, "no model backend configured");
    }

    loading_.store(true);
    core::log_info(std::string("[asr] loading model preset '") + to_string(preset) + "'");
    auto t0 = std::chrono::steady_clock::now();
    std::unique_ptr<IRecognitionModel> model;
    try {
        model = backend_->load(preset);
    } catch (...) {
        loading_.store(false);
        throw;
    }
    loading_.store(false);
    if (!model) {
        throw core::Error(core::ErrorCode::ModelLoadError,
                          std::string("backend returned no model for '") + to_string(preset) + "'");
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    auto handle = std::make_shared<ModelHandle>();
    handle->preset = preset;
    handle->generation = next_generation_++;
    handle->model = std::shared_ptr<const IRecognitionModel>(std::move(model));
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        current_ = handle;
    }
    core::log_info(std::string("[asr] model '") + to_string(preset) + "' ready (generation " +
                   std::to_string(handle->generation) + ", " + std::to_string(secs) + " s)");
    return handle;
}

std::shared_ptr<const ModelHandle> TranscriptionEngine::current() const {
    std::lock_guard<std::mutex> lock(current_mutex_);
    return current_;
}

TranscriptionResult TranscriptionEngine::transcribe(const ModelHandle& handle, const audio::AudioChunk& chunk) const {
    TranscriptionResult result;
    result.sequence = chunk.sequence;
    result.timestamp_ms = chunk.timestamp_ms;
    result.is_final = true;
    if (chunk.size() > 0 && handle.model) {
        result.text = handle.model->transcribe(chunk.data(), chunk.size(), chunk.sample_rate);
    }
    return result;
}

} // namespace asr
