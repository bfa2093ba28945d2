#pragma once

#include "asr/model_preset.hpp"
#include "audio/chunker.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace asr {

/// Recognized text for one chunk. Every chunk result is final (no partial refinement).
struct TranscriptionResult {
    uint64_t sequence = 0;
    std::string text;          ///< Possibly empty (silence)
    int64_t timestamp_ms = 0;  ///< Start of the chunk, ms from session start
    bool is_final = true;
};

/// A loaded recognition model. Implementations must allow concurrent transcribe() calls.
class IRecognitionModel {
public:
    virtual ~IRecognitionModel() = default;
    virtual std::string transcribe(const int16_t* samples, size_t count, int sample_rate) const = 0;
};

/// Loads models for presets. load() may take seconds and throws core::Error(ModelLoadError).
class IModelBackend {
public:
    virtual ~IModelBackend() = default;
    virtual std::unique_ptr<IRecognitionModel> load(ModelPreset preset) = 0;
};

/// Read-only handle to one loaded preset. Kept alive by every inference using it.
struct ModelHandle {
    ModelPreset preset;
    uint64_t generation;                              ///< Increases with every load
    std::shared_ptr<const IRecognitionModel> model;
};

/**
 * @brief Owns the current model handle and serializes reloads
 *
 * load_preset() never mutates a handle in place: it builds a new one and swaps
 * the "current" pointer. Inference already running against the previous handle
 * keeps it alive through its shared_ptr and completes normally.
 */
class TranscriptionEngine {
public:
    explicit TranscriptionEngine(std::shared_ptr<IModelBackend> backend);

    /// Blocking. At most one load runs at a time; concurrent callers wait their turn.
    /// Reloading the already-current preset is a no-op.
    std::shared_ptr<const ModelHandle> load_preset(ModelPreset preset);

    /// Snapshot of the handle new chunks should use (nullptr before the first load).
    std::shared_ptr<const ModelHandle> current() const;

    /// Blocking inference for one chunk; pure with respect to handle and chunk.
    TranscriptionResult transcribe(const ModelHandle& handle, const audio::AudioChunk& chunk) const;

    bool is_loading() const { return loading_.load(); }

private:
    std::shared_ptr<IModelBackend> backend_;
    std::mutex load_mutex_;                         // one load in flight
    mutable std::mutex current_mutex_;
    std::shared_ptr<const ModelHandle> current_;
    uint64_t next_generation_ = 1;
    std::atomic<bool> loading_{false};
};

} // namespace asr
