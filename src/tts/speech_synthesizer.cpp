#include "tts/speech_synthesizer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>

namespace tts {

SpeechSynthesizer::SpeechSynthesizer(std::unique_ptr<ISpeechEngine> engine,
                                     std::unique_ptr<audio::IAudioOutput> output,
                                     SpeechOptions options)
    : engine_(std::move(engine))
    , output_(std::move(output))
    , options_(options) {
    if (!engine_ || !output_) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "speech synthesizer needs an engine and an output");
    }
    speaker_ = std::thread([this] { speaker_loop(); });
}

SpeechSynthesizer::~SpeechSynthesizer() {
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        shutdown_ = true;
        request_.reset();
    }
    cancel();
    request_cv_.notify_all();
    if (speaker_.joinable()) {
        speaker_.join();
    }
}

std::vector<int16_t> SpeechSynthesizer::to_pcm16(const float* samples, size_t count, float volume) {
    std::vector<int16_t> pcm(count);
    for (size_t i = 0; i < count; ++i) {
        const float v = std::clamp(samples[i] * volume, -1.0f, 1.0f);
        pcm[i] = static_cast<int16_t>(std::lround(v * 32767.0f));
    }
    return pcm;
}

bool SpeechSynthesizer::speak(const std::string& text) {
    return speak_at(text, generation_.load());
}

bool SpeechSynthesizer::speak_at(const std::string& text, uint64_t generation) {
    std::lock_guard<std::mutex> lock(speak_mutex_);
    if (generation_.load() != generation) {
        return false;   // cancelled while waiting for the previous utterance
    }
    if (text.empty()) {
        return true;
    }
    const SpeechOptions opts = options();

    speaking_.store(true);
    struct SpeakingReset {
        std::atomic<bool>& flag;
        ~SpeakingReset() { flag.store(false); }
    } reset{speaking_};

    if (!output_->start(engine_->sample_rate(), 1)) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "cannot open audio output");
    }

    bool device_ok = true;
    auto on_chunk = [&](const float* samples, size_t count) {
        if (generation_.load() != generation) return false;
        const auto pcm = to_pcm16(samples, count, opts.volume);
        if (!output_->write(pcm.data(), pcm.size())) {
            device_ok = generation_.load() != generation;   // a cancel aborts the stream too
            return false;
        }
        return generation_.load() == generation;
    };

    try {
        engine_->synthesize(text, opts.length_scale, on_chunk);
    } catch (const std::exception&) {
        output_->abort();
        throw;
    }

    const bool cancelled = generation_.load() != generation;
    if (cancelled || !device_ok) {
        output_->abort();
    } else {
        output_->stop();
    }
    if (!device_ok) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "audio output write failed");
    }
    core::log_debug(cancelled ? "[tts] speech cancelled" : "[tts] speech finished");
    return !cancelled;
}

void SpeechSynthesizer::speak_async(const std::string& text) {
    cancel();
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        if (shutdown_) return;
        request_.emplace(text, generation_.load());
    }
    request_cv_.notify_one();
}

void SpeechSynthesizer::cancel() {
    ++generation_;
    if (speaking_.load()) {
        output_->abort();
    }
}

void SpeechSynthesizer::speaker_loop() {
    while (true) {
        std::pair<std::string, uint64_t> request;
        {
            std::unique_lock<std::mutex> lock(request_mutex_);
            request_cv_.wait(lock, [this] { return shutdown_ || request_.has_value(); });
            if (shutdown_) return;
            request = std::move(*request_);
            request_.reset();
        }
        try {
            speak_at(request.first, request.second);
        } catch (const std::exception& e) {
            core::log_error(std::string("[tts] ") + e.what());
            ErrorHandler handler;
            {
                std::lock_guard<std::mutex> lock(options_mutex_);
                handler = on_error_;
            }
            if (handler) handler(e.what());
        }
    }
}

void SpeechSynthesizer::set_options(const SpeechOptions& options) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_ = options;
}

SpeechOptions SpeechSynthesizer::options() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_;
}

void SpeechSynthesizer::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    on_error_ = std::move(handler);
}

} // namespace tts
