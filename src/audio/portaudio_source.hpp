#pragma once

#include "audio/audio_source.hpp"
#include "audio/portaudio_session.hpp"
#include "core/bounded_queue.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace audio {

/**
 * @brief Live microphone capture through a PortAudio callback stream
 *
 * The driver callback never blocks: it copies each buffer into a bounded frame
 * queue (drop-oldest when the reader falls behind) and read_frame() pops from it.
 * Device ids are PortAudio device indices ("0", "3") or "default".
 */
class PortAudioSource : public IAudioSource {
public:
    PortAudioSource();
    ~PortAudioSource() override;

    void open(const std::string& device_id, int sample_rate, size_t frame_size) override;
    std::vector<int16_t> read_frame() override;
    void close() override;
    bool is_open() const override;
    AudioDeviceInfo device_info() const override;
    size_t dropped_frames() const override;

    // Input-capable devices (maxInputChannels > 0)
    static std::vector<AudioDeviceInfo> enumerate();

    // Callback entry points (public for the C trampolines)
    void on_audio(const int16_t* samples, unsigned long frames);
    void on_stream_finished();

private:
    void close_stream();

    PortAudioSession pa_;
    mutable std::mutex mutex_;
    void* stream_ = nullptr;                 // PaStream*
    std::shared_ptr<core::BoundedQueue<std::vector<int16_t>>> frames_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> device_lost_{false};
    size_t frame_size_ = 0;
    AudioDeviceInfo info_;
};

} // namespace audio
