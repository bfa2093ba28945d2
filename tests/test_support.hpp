// Test doubles shared by the unit and integration tests.
// Nothing here touches real audio hardware or model files.
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "app/result_bus.hpp"
#include "asr/transcription_engine.hpp"
#include "audio/audio_output.hpp"
#include "audio/audio_source.hpp"
#include "core/errors.hpp"
#include "tts/speech_synthesizer.hpp"

namespace test {

using namespace std::chrono_literals;

// Poll until pred() holds or the timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

// Frame of `count` samples all equal to `value`.
inline std::vector<int16_t> frame_of(int16_t value, size_t count) {
    return std::vector<int16_t>(count, value);
}

//==============================================================================
// Audio source
//==============================================================================

// Shared script for a fake device. The test keeps a reference and pushes frames
// while the pipeline reads them from its own thread.
struct ScriptedAudio {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<int16_t>> frames;
    bool open = false;
    bool fail_when_empty = false;                    // simulate unplug once the script runs dry
    core::ErrorCode empty_error = core::ErrorCode::DeviceUnavailable;
    bool open_fails = false;
    core::ErrorCode open_error = core::ErrorCode::DeviceUnavailable;
    int opens = 0;
    int closes = 0;
    size_t frame_size = 0;
    int sample_rate = 0;

    void push(std::vector<int16_t> frame) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(std::move(frame));
        }
        cv.notify_all();
    }

    // Whole frames of a constant value covering `samples` samples.
    void push_samples(int16_t value, size_t samples, size_t frame) {
        for (size_t done = 0; done < samples; done += frame) {
            push(frame_of(value, std::min(frame, samples - done)));
        }
    }

    bool is_open() {
        std::lock_guard<std::mutex> lock(mutex);
        return open;
    }

    size_t remaining() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
};

class ScriptedSource : public audio::IAudioSource {
public:
    explicit ScriptedSource(std::shared_ptr<ScriptedAudio> script) : script_(std::move(script)) {}
    ~ScriptedSource() override { close(); }

    void open(const std::string& device_id, int sample_rate, size_t frame_size) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->open_fails) {
            throw core::Error(script_->open_error, "scripted open failure for '" + device_id + "'");
        }
        device_id_ = device_id;
        script_->open = true;
        script_->sample_rate = sample_rate;
        script_->frame_size = frame_size;
        ++script_->opens;
        mine_open_ = true;
    }

    std::vector<int16_t> read_frame() override {
        std::unique_lock<std::mutex> lock(script_->mutex);
        script_->cv.wait(lock, [this] {
            return !mine_open_ || !script_->frames.empty() || script_->fail_when_empty;
        });
        if (!mine_open_) {
            throw core::Error(core::ErrorCode::SourceClosed, "scripted source closed");
        }
        if (script_->frames.empty()) {
            throw core::Error(script_->empty_error, "scripted device gone");
        }
        auto frame = std::move(script_->frames.front());
        script_->frames.pop_front();
        return frame;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            if (!mine_open_) return;
            mine_open_ = false;
            script_->open = false;
            ++script_->closes;
        }
        script_->cv.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return mine_open_;
    }

    audio::AudioDeviceInfo device_info() const override {
        audio::AudioDeviceInfo info;
        info.id = device_id_;
        info.name = "Scripted " + device_id_;
        info.driver = "Test";
        return info;
    }

private:
    std::shared_ptr<ScriptedAudio> script_;
    std::string device_id_;
    bool mine_open_ = false;   // guarded by script_->mutex
};

class ScriptedFactory : public audio::IAudioSourceFactory {
public:
    std::shared_ptr<ScriptedAudio> add(const std::string& id) {
        auto script = std::make_shared<ScriptedAudio>();
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[id] = script;
        return script;
    }

    std::vector<audio::AudioDeviceInfo> enumerate_devices() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<audio::AudioDeviceInfo> out;
        for (const auto& kv : devices_) {
            audio::AudioDeviceInfo info;
            info.id = kv.first;
            info.name = "Scripted " + kv.first;
            info.driver = "Test";
            out.push_back(info);
        }
        return out;
    }

    std::unique_ptr<audio::IAudioSource> create(const std::string& device_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) return nullptr;
        return std::make_unique<ScriptedSource>(it->second);
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ScriptedAudio>> devices_;
};

//==============================================================================
// Recognition model
//==============================================================================

// Knobs shared by every model a FakeBackend loads.
struct FakeModelScript {
    std::mutex mutex;
    std::map<int16_t, std::chrono::milliseconds> delay_for_value;   // by first sample
    std::set<int16_t> fail_values;
    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    void set_delay(int16_t value, std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex);
        delay_for_value[value] = d;
    }
    void set_failing(int16_t value) {
        std::lock_guard<std::mutex> lock(mutex);
        fail_values.insert(value);
    }

    std::chrono::milliseconds delay(int16_t value) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = delay_for_value.find(value);
        return it == delay_for_value.end() ? 0ms : it->second;
    }
    bool fails(int16_t value) {
        std::lock_guard<std::mutex> lock(mutex);
        return fail_values.count(value) != 0;
    }
};

// Text is "" for silence, otherwise "<preset>:<first sample value>".
class FakeModel : public asr::IRecognitionModel {
public:
    FakeModel(asr::ModelPreset preset, std::shared_ptr<FakeModelScript> script)
        : preset_(preset), script_(std::move(script)) {}

    std::string transcribe(const int16_t* samples, size_t count, int sample_rate) const override {
        (void)sample_rate;
        ++script_->calls;
        const int now = ++script_->active;
        int prev = script_->max_active.load();
        while (now > prev && !script_->max_active.compare_exchange_weak(prev, now)) {}

        const int16_t value = count ? samples[0] : 0;
        const auto delay = script_->delay(value);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --script_->active;
        if (script_->fails(value)) {
            throw core::Error(core::ErrorCode::InferenceFailed, "scripted failure");
        }
        if (value == 0) return "";
        return std::string(asr::to_string(preset_)) + ":" + std::to_string(value);
    }

private:
    asr::ModelPreset preset_;
    std::shared_ptr<FakeModelScript> script_;
};

class FakeBackend : public asr::IModelBackend {
public:
    std::shared_ptr<FakeModelScript> script = std::make_shared<FakeModelScript>();
    std::atomic<int> loads{0};
    std::atomic<int> loading_now{0};
    std::atomic<int> max_concurrent_loads{0};
    std::chrono::milliseconds load_delay{0};
    std::set<asr::ModelPreset> missing;

    std::unique_ptr<asr::IRecognitionModel> load(asr::ModelPreset preset) override {
        const int now = ++loading_now;
        int prev = max_concurrent_loads.load();
        while (now > prev && !max_concurrent_loads.compare_exchange_weak(prev, now)) {}
        if (load_delay.count() > 0) std::this_thread::sleep_for(load_delay);
        --loading_now;
        if (missing.count(preset)) {
            throw core::Error(core::ErrorCode::ModelLoadError,
                              std::string("no weights for ") + asr::to_string(preset));
        }
        ++loads;
        return std::make_unique<FakeModel>(preset, script);
    }
};

//==============================================================================
// Sinks
//==============================================================================

class CollectingSink : public app::ResultSink {
public:
    void on_result(const asr::TranscriptionResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(result);
    }
    void on_event(const app::SessionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<asr::TranscriptionResult> results() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_;
    }
    std::vector<app::SessionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    size_t result_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }
    size_t count_events(app::SessionEvent::Kind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) n += e.kind == kind ? 1 : 0;
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<asr::TranscriptionResult> results_;
    std::vector<app::SessionEvent> events_;
};

//==============================================================================
// Speech
//==============================================================================

// Produces `pieces` chunks of 0.5f samples per request, pausing between them.
class FakeSpeechEngine : public tts::ISpeechEngine {
public:
    int pieces = 3;
    size_t samples_per_piece = 2205;
    std::chrono::milliseconds piece_delay{5};
    std::atomic<bool> fail{false};
    std::atomic<int> requests{0};
    std::atomic<int> pieces_accepted{0};
    float last_length_scale = 0.0f;

    int sample_rate() const override { return 22050; }

    void synthesize(const std::string& text, float length_scale, const tts::ChunkCallback& on_chunk) override {
        (void)text;
        ++requests;
        last_length_scale = length_scale;
        if (fail) throw core::Error(core::ErrorCode::SynthesisFailed, "scripted engine failure");
        std::vector<float> piece(samples_per_piece, 0.5f);
        for (int i = 0; i < pieces; ++i) {
            std::this_thread::sleep_for(piece_delay);
            if (!on_chunk(piece.data(), piece.size())) return;
            ++pieces_accepted;
        }
    }
};

struct FakeOutputState {
    std::mutex mutex;
    std::vector<int16_t> played;
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> aborts{0};
    std::atomic<bool> aborted{false};
    std::atomic<bool> draining{false};
    std::chrono::milliseconds write_delay{5};
    std::chrono::milliseconds drain_delay{0};   // stop() plays out this long unless aborted
};

class FakeOutput : public audio::IAudioOutput {
public:
    explicit FakeOutput(std::shared_ptr<FakeOutputState> state) : state_(std::move(state)) {}

    bool start(int sample_rate, int channels) override {
        (void)sample_rate;
        (void)channels;
        state_->aborted = false;
        ++state_->starts;
        return true;
    }
    bool write(const int16_t* data, size_t frames) override {
        std::this_thread::sleep_for(state_->write_delay);
        if (state_->aborted) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->played.insert(state_->played.end(), data, data + frames);
        return true;
    }
    void stop() override {
        state_->draining = true;
        const auto deadline = std::chrono::steady_clock::now() + state_->drain_delay;
        while (!state_->aborted && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        state_->draining = false;
        ++state_->stops;
    }
    void abort() override {
        state_->aborted = true;
        ++state_->aborts;
    }

private:
    std::shared_ptr<FakeOutputState> state_;
};

} // namespace test
