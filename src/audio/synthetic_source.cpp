#include "audio/synthetic_source.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <cmath>

namespace audio {

SyntheticSource::SyntheticSource(bool realtime, bool loop)
    : realtime_(realtime), loop_(loop) {}

SyntheticSource::~SyntheticSource() {
    close();
}

bool SyntheticSource::handles(const std::string& device_id) {
    return device_id.rfind(kPrefix, 0) == 0;
}

std::vector<AudioDeviceInfo> SyntheticSource::enumerate() {
    std::vector<AudioDeviceInfo> devices;
    AudioDeviceInfo silence;
    silence.id = "synthetic:silence";
    silence.name = "Synthetic Device (Silence)";
    silence.driver = "Synthetic";
    devices.push_back(silence);

    AudioDeviceInfo tone;
    tone.id = "synthetic:tone";
    tone.name = "Synthetic Device (440 Hz Tone)";
    tone.driver = "Synthetic";
    devices.push_back(tone);
    return devices;
}

void SyntheticSource::open(const std::string& device_id, int sample_rate, size_t frame_size) {
    if (!handles(device_id)) {
        throw core::Error(core::ErrorCode::DeviceUnavailable, "not a synthetic device: " + device_id);
    }
    if (sample_rate <= 0 || frame_size == 0) {
        throw core::Error(core::ErrorCode::UnsupportedFormat, "invalid sample rate or frame size");
    }
    const std::string what = device_id.substr(std::string(kPrefix).size());

    std::lock_guard<std::mutex> lock(mutex_);
    if (what == "silence") {
        mode_ = Mode::Silence;
    } else if (what == "tone") {
        mode_ = Mode::Tone;
    } else {
        if (!wav_.load(what)) {
            throw core::Error(core::ErrorCode::DeviceUnavailable, "cannot read PCM16 WAV file: " + what);
        }
        if (wav_.sample_rate() != sample_rate || wav_.channels() != 1) {
            throw core::Error(core::ErrorCode::UnsupportedFormat,
                what + " is " + std::to_string(wav_.sample_rate()) + " Hz/" +
                std::to_string(wav_.channels()) + " ch, need " + std::to_string(sample_rate) + " Hz mono");
        }
        mode_ = Mode::File;
    }
    device_id_ = device_id;
    sample_rate_ = sample_rate;
    frame_size_ = frame_size;
    samples_emitted_ = 0;
    next_frame_time_ = std::chrono::steady_clock::now();
    open_ = true;
    core::log_debug("[synthetic] opened " + device_id);
}

std::vector<int16_t> SyntheticSource::read_frame() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!open_) {
        throw core::Error(core::ErrorCode::SourceClosed, device_id_.empty() ? "source not open" : device_id_);
    }
    if (realtime_) {
        // Sleep until the frame would have been captured; close() wakes us early
        cv_.wait_until(lock, next_frame_time_, [this] { return !open_; });
        if (!open_) {
            throw core::Error(core::ErrorCode::SourceClosed, device_id_);
        }
        const auto frame_duration = std::chrono::duration<double>(
            static_cast<double>(frame_size_) / sample_rate_);
        next_frame_time_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(frame_duration);
    }
    return next_frame_locked();
}

std::vector<int16_t> SyntheticSource::next_frame_locked() {
    std::vector<int16_t> frame;
    switch (mode_) {
    case Mode::Silence:
        frame.assign(frame_size_, 0);
        break;
    case Mode::Tone: {
        frame.resize(frame_size_);
        const double two_pi_f = 2.0 * 3.14159265358979323846 * 440.0;
        for (size_t i = 0; i < frame_size_; ++i) {
            const double t = static_cast<double>(samples_emitted_ + i) / sample_rate_;
            frame[i] = static_cast<int16_t>(std::lrint(8192.0 * std::sin(two_pi_f * t)));
        }
        break;
    }
    case Mode::File:
        frame = wav_.read(frame_size_);
        if (frame.size() < frame_size_) {
            if (!loop_) {
                // A partial last frame is dropped: read_frame() only returns full frames
                open_ = false;
                cv_.notify_all();
                throw core::Error(core::ErrorCode::SourceClosed, "end of file " + wav_.source_path());
            }
            wav_.rewind();
            auto rest = wav_.read(frame_size_ - frame.size());
            frame.insert(frame.end(), rest.begin(), rest.end());
            frame.resize(frame_size_, 0);
        }
        break;
    }
    samples_emitted_ += frame_size_;
    return frame;
}

void SyntheticSource::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return;
        open_ = false;
    }
    cv_.notify_all();
    core::log_debug("[synthetic] closed " + device_id_);
}

bool SyntheticSource::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

AudioDeviceInfo SyntheticSource::device_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AudioDeviceInfo info;
    info.id = device_id_;
    info.name = mode_ == Mode::File ? "Synthetic Device (File: " + wav_.source_path() + ")"
                                    : "Synthetic Device";
    info.driver = "Synthetic";
    info.default_sample_rate = sample_rate_;
    info.max_channels = 1;
    info.is_default = false;
    return info;
}

} // namespace audio
