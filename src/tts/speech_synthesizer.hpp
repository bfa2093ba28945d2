#pragma once

#include "audio/audio_output.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tts {

/// Receives synthesized audio (mono float in [-1, 1]). Return false to stop synthesis.
using ChunkCallback = std::function<bool(const float* samples, size_t count)>;

/**
 * @brief Text-to-speech engine (piper, or a fake in tests)
 *
 * synthesize() produces audio incrementally (one sentence at a time for piper)
 * and throws core::Error(SynthesisFailed) on engine errors.
 */
class ISpeechEngine {
public:
    virtual ~ISpeechEngine() = default;
    virtual int sample_rate() const = 0;
    virtual void synthesize(const std::string& text, float length_scale, const ChunkCallback& on_chunk) = 0;
};

struct SpeechOptions {
    float length_scale = 1.0f;   ///< > 1 speaks slower
    float volume = 0.9f;         ///< Linear gain applied before conversion to PCM16
};

/**
 * @brief Speaks text through an engine and an audio output
 *
 * One utterance plays at a time. cancel() may be called from any thread and stops
 * the current utterance between two synthesized pieces (playback is aborted at once).
 * Independent from the transcription session.
 */
class SpeechSynthesizer {
public:
    using ErrorHandler = std::function<void(const std::string& message)>;

    SpeechSynthesizer(std::unique_ptr<ISpeechEngine> engine,
                      std::unique_ptr<audio::IAudioOutput> output,
                      SpeechOptions options = {});
    ~SpeechSynthesizer();

    SpeechSynthesizer(const SpeechSynthesizer&) = delete;
    SpeechSynthesizer& operator=(const SpeechSynthesizer&) = delete;

    /// Blocks until playback finished (true) or was cancelled (false).
    /// Throws core::Error(SynthesisFailed).
    bool speak(const std::string& text);

    /// Queues text on the speaker thread, cancelling whatever is playing.
    /// Failures go to the error handler.
    void speak_async(const std::string& text);

    void cancel();
    bool is_speaking() const { return speaking_.load(); }

    void set_options(const SpeechOptions& options);
    SpeechOptions options() const;
    void set_error_handler(ErrorHandler handler);

    /// Applies gain and clamps to int16.
    static std::vector<int16_t> to_pcm16(const float* samples, size_t count, float volume);

private:
    bool speak_at(const std::string& text, uint64_t generation);
    void speaker_loop();

    std::unique_ptr<ISpeechEngine> engine_;
    std::unique_ptr<audio::IAudioOutput> output_;

    mutable std::mutex options_mutex_;
    SpeechOptions options_;
    ErrorHandler on_error_;

    std::mutex speak_mutex_;               // one utterance at a time
    std::atomic<uint64_t> generation_{0};  // bumped by cancel()
    std::atomic<bool> speaking_{false};

    std::mutex request_mutex_;
    std::condition_variable request_cv_;
    std::optional<std::pair<std::string, uint64_t>> request_;   // text, generation
    bool shutdown_ = false;
    std::thread speaker_;
};

} // namespace tts
