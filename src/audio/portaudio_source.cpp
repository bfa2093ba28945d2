#include "audio/portaudio_source.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <portaudio.h>
#include <stdexcept>

namespace audio {

namespace {
// ~4 s of 1024-sample frames at 16 kHz before the oldest frame is overwritten
constexpr size_t kFrameQueueDepth = 64;

int pa_callback(const void* input, void* /*output*/, unsigned long frame_count,
                const PaStreamCallbackTimeInfo* /*time_info*/, PaStreamCallbackFlags /*flags*/,
                void* user_data) {
    auto* self = static_cast<PortAudioSource*>(user_data);
    if (input) {
        self->on_audio(static_cast<const int16_t*>(input), frame_count);
    }
    return paContinue;
}

void pa_finished(void* user_data) {
    static_cast<PortAudioSource*>(user_data)->on_stream_finished();
}

std::string host_api_name(const PaDeviceInfo* info) {
    const PaHostApiInfo* api = info ? Pa_GetHostApiInfo(info->hostApi) : nullptr;
    return api && api->name ? api->name : "PortAudio";
}

PaDeviceIndex resolve_device(const std::string& device_id) {
    if (device_id.empty() || device_id == "default") {
        return Pa_GetDefaultInputDevice();
    }
    try {
        size_t pos = 0;
        int index = std::stoi(device_id, &pos);
        if (pos != device_id.size()) return paNoDevice;
        if (index < 0 || index >= Pa_GetDeviceCount()) return paNoDevice;
        return static_cast<PaDeviceIndex>(index);
    } catch (const std::exception&) {
        return paNoDevice;
    }
}
} // namespace

PortAudioSource::PortAudioSource() = default;

PortAudioSource::~PortAudioSource() {
    close();
}

std::vector<AudioDeviceInfo> PortAudioSource::enumerate() {
    std::vector<AudioDeviceInfo> devices;
    const PaDeviceIndex default_input = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        AudioDeviceInfo dev;
        dev.id = std::to_string(i);
        dev.name = info->name ? info->name : "Unknown";
        dev.driver = host_api_name(info);
        dev.default_sample_rate = static_cast<int>(info->defaultSampleRate);
        dev.max_channels = info->maxInputChannels;
        dev.is_default = (i == default_input);
        devices.push_back(dev);
    }
    return devices;
}

void PortAudioSource::open(const std::string& device_id, int sample_rate, size_t frame_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        throw core::Error(core::ErrorCode::DeviceUnavailable, "source already open: " + info_.id);
    }

    const PaDeviceIndex index = resolve_device(device_id);
    const PaDeviceInfo* info = (index == paNoDevice) ? nullptr : Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0) {
        throw core::Error(core::ErrorCode::DeviceUnavailable, "no input device '" + device_id + "'");
    }

    PaStreamParameters in{};
    in.device = index;
    in.channelCount = 1;
    in.sampleFormat = paInt16;
    in.suggestedLatency = info->defaultLowInputLatency;
    in.hostApiSpecificStreamInfo = nullptr;

    if (Pa_IsFormatSupported(&in, nullptr, sample_rate) != paFormatIsSupported) {
        throw core::Error(core::ErrorCode::UnsupportedFormat,
            std::string(info->name) + " cannot capture mono PCM16 at " + std::to_string(sample_rate) + " Hz");
    }

    frames_ = std::make_shared<core::BoundedQueue<std::vector<int16_t>>>(kFrameQueueDepth);
    frame_size_ = frame_size;
    closing_.store(false);
    device_lost_.store(false);

    PaStream* stream = nullptr;
    PaError e = Pa_OpenStream(&stream, &in, nullptr, sample_rate, static_cast<unsigned long>(frame_size),
                              paClipOff, &pa_callback, this);
    if (e != paNoError) {
        frames_.reset();
        const auto code = (e == paInvalidSampleRate || e == paSampleFormatNotSupported ||
                           e == paInvalidChannelCount)
            ? core::ErrorCode::UnsupportedFormat : core::ErrorCode::DeviceUnavailable;
        throw core::Error(code, std::string("Pa_OpenStream: ") + Pa_GetErrorText(e));
    }
    Pa_SetStreamFinishedCallback(stream, &pa_finished);

    e = Pa_StartStream(stream);
    if (e != paNoError) {
        Pa_CloseStream(stream);
        frames_.reset();
        throw core::Error(core::ErrorCode::DeviceUnavailable, std::string("Pa_StartStream: ") + Pa_GetErrorText(e));
    }
    stream_ = stream;

    info_.id = device_id;
    info_.name = info->name ? info->name : "Unknown";
    info_.driver = host_api_name(info);
    info_.default_sample_rate = sample_rate;
    info_.max_channels = 1;
    info_.is_default = (index == Pa_GetDefaultInputDevice());
    core::log_info("[capture] opened " + info_.name + " (" + info_.driver + ") at " +
                   std::to_string(sample_rate) + " Hz, " + std::to_string(frame_size) + " samples/frame");
}

void PortAudioSource::on_audio(const int16_t* samples, unsigned long frames) {
    // Called on the PortAudio thread. frames == frame_size_ because the stream
    // was opened with a fixed framesPerBuffer.
    auto queue = frames_;
    if (!queue || frames != frame_size_) return;
    queue->push(std::vector<int16_t>(samples, samples + frames));
}

void PortAudioSource::on_stream_finished() {
    if (!closing_.load()) {
        device_lost_.store(true);
        if (auto queue = frames_) queue->stop();
    }
}

std::vector<int16_t> PortAudioSource::read_frame() {
    std::shared_ptr<core::BoundedQueue<std::vector<int16_t>>> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue = frames_;
    }
    if (!queue) {
        throw core::Error(core::ErrorCode::SourceClosed, "source not open");
    }
    std::vector<int16_t> frame;
    if (!queue->pop(frame)) {
        if (device_lost_.load() && !closing_.load()) {
            throw core::Error(core::ErrorCode::DeviceUnavailable, info_.name + " stopped delivering audio");
        }
        throw core::Error(core::ErrorCode::SourceClosed, info_.name);
    }
    return frame;
}

void PortAudioSource::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closing_.store(true);
    if (frames_) {
        frames_->stop();   // wake a blocked read_frame() first
    }
    close_stream();
    frames_.reset();
}

void PortAudioSource::close_stream() {
    if (!stream_) return;
    auto* stream = static_cast<PaStream*>(stream_);
    PaError e = Pa_AbortStream(stream);
    if (e != paNoError && e != paStreamIsStopped) {
        core::log_warn(std::string("[capture] Pa_AbortStream: ") + Pa_GetErrorText(e));
    }
    e = Pa_CloseStream(stream);
    if (e != paNoError) {
        core::log_warn(std::string("[capture] Pa_CloseStream: ") + Pa_GetErrorText(e));
    }
    stream_ = nullptr;
    core::log_info("[capture] closed " + info_.name);
}

bool PortAudioSource::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ != nullptr;
}

AudioDeviceInfo PortAudioSource::device_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

size_t PortAudioSource::dropped_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_ ? frames_->dropped_count() : 0;
}

} // namespace audio
