#include "asr/whisper_backend.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include "whisper.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <thread>

namespace asr {

namespace {
// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    case GGML_LOG_LEVEL_INFO:
    case GGML_LOG_LEVEL_DEBUG:
    default:
        if (core::is_verbose()) std::fputs(text, stderr);
        break;
    }
}

class WhisperModel : public IRecognitionModel {
public:
    WhisperModel(whisper_context* ctx, std::string language, int n_threads)
        : ctx_(ctx), language_(std::move(language)), n_threads_(n_threads) {}

    ~WhisperModel() override {
        for (whisper_state* s : idle_states_) {
            whisper_free_state(s);
        }
        whisper_free(ctx_);
    }

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::string transcribe(const int16_t* data, size_t samples, int sample_rate) const override {
        if (!data || samples == 0) return {};
        if (sample_rate != WHISPER_SAMPLE_RATE) {
            throw core::Error(core::ErrorCode::InferenceFailed,
                "whisper expects " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz, got " + std::to_string(sample_rate));
        }

        whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        wparams.print_realtime   = false;
        wparams.print_progress   = false;
        wparams.print_timestamps = false;
        wparams.print_special    = false;
        wparams.translate        = false;
        wparams.language         = language_.c_str();
        wparams.detect_language  = false;
        wparams.n_threads        = n_threads_;
        wparams.no_context       = true;   // chunks are independent; hard cuts between them
        wparams.single_segment   = false;
        wparams.greedy.best_of   = 1;

        // Convert int16 PCM to float [-1,1]
        std::vector<float> pcm_f32;
        pcm_f32.reserve(samples);
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t i = 0; i < samples; ++i) {
            pcm_f32.push_back(static_cast<float>(data[i]) * scale);
        }

        StateLease lease(*this);
        const int ret = whisper_full_with_state(ctx_, lease.state, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
        if (ret != 0) {
            throw core::Error(core::ErrorCode::InferenceFailed, "whisper_full failed, ret=" + std::to_string(ret));
        }

        std::string out;
        const int n = whisper_full_n_segments_from_state(lease.state);
        for (int i = 0; i < n; ++i) {
            const char* txt = whisper_full_get_segment_text_from_state(lease.state, i);
            if (!txt) continue;
            std::string s = clean_segment_text(txt);
            if (s.empty()) continue;
            if (!out.empty()) out.push_back(' ');
            out += s;
        }
        return out;
    }

private:
    // Borrow a decoder state for one call; states are created lazily, one per concurrent caller.
    struct StateLease {
        explicit StateLease(const WhisperModel& m) : model(m), state(m.acquire_state()) {}
        ~StateLease() { model.release_state(state); }
        const WhisperModel& model;
        whisper_state* state;
    };

    whisper_state* acquire_state() const {
        {
            std::lock_guard<std::mutex> lock(states_mutex_);
            if (!idle_states_.empty()) {
                whisper_state* s = idle_states_.back();
                idle_states_.pop_back();
                return s;
            }
        }
        whisper_state* s = whisper_init_state(ctx_);
        if (!s) {
            throw core::Error(core::ErrorCode::InferenceFailed, "whisper_init_state failed");
        }
        return s;
    }

    void release_state(whisper_state* s) const {
        std::lock_guard<std::mutex> lock(states_mutex_);
        idle_states_.push_back(s);
    }

    whisper_context* ctx_;
    std::string language_;
    int n_threads_;
    mutable std::mutex states_mutex_;
    mutable std::vector<whisper_state*> idle_states_;
};
} // namespace

std::string clean_segment_text(const std::string& raw) {
    std::string s = raw;
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    s = s.substr(a, b - a + 1);
    // Skip strings that are just a single bracketed/parenthesized token
    // ("[BLANK_AUDIO]", "[ Silence ]", "(music)")
    if (s.size() >= 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'))) {
        if (s.find_first_of("[(", 1) == std::string::npos) {
            return {};
        }
    }
    return s;
}

WhisperBackend::WhisperBackend(WhisperOptions options) : options_(std::move(options)) {
    // Set logging verbosity before creating contexts to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);
}

std::vector<std::string> WhisperBackend::candidate_paths(ModelPreset preset) const {
    const std::string name = to_string(preset);
    const std::filesystem::path dir(options_.model_dir);
    std::vector<std::string> names = {
        "ggml-" + name + ".bin",
        "ggml-" + name + ".en.bin",
        "ggml-" + name + "-q5_1.bin",
        name + ".bin",
        "ggml-" + name + ".gguf",
        name + ".gguf",
    };
    if (preset == ModelPreset::Large) {
        // whisper.cpp ships large as versioned files
        names.insert(names.begin() + 1, {"ggml-large-v3.bin", "ggml-large-v3-turbo.bin", "ggml-large-v2.bin"});
    }
    std::vector<std::string> out;
    for (const auto& n : names) {
        out.push_back((dir / n).string());
    }
    return out;
}

std::unique_ptr<IRecognitionModel> WhisperBackend::load(ModelPreset preset) {
    std::string path;
    for (const auto& candidate : candidate_paths(preset)) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            path = candidate;
            break;
        }
    }
    if (path.empty()) {
        throw core::Error(core::ErrorCode::ModelLoadError,
            std::string("no model file for preset '") + to_string(preset) + "' under " + options_.model_dir +
            " (expected e.g. ggml-" + to_string(preset) + ".bin)");
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options_.use_gpu;
    core::log_debug("[whisper] init from: " + path);
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        throw core::Error(core::ErrorCode::ModelLoadError, "whisper init failed for " + path);
    }
    if (core::is_verbose()) {
        core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    }

    int threads = options_.n_threads;
    if (threads <= 0) {
        const unsigned hw = std::max(1u, std::thread::hardware_concurrency());
        threads = std::max(1, static_cast<int>(hw) / std::max(1, options_.workers));
    }
    return std::make_unique<WhisperModel>(ctx, options_.language, threads);
}

}
