#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace audio {

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Device identifier passed to open() ("3", "default", "synthetic:tone")
    std::string name;            // Human-readable name ("USB Microphone")
    std::string driver;          // Host API name ("ALSA", "PulseAudio", "Synthetic")
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported input channels
    bool is_default;             // Is this the system default device?

    AudioDeviceInfo()
        : default_sample_rate(16000)
        , max_channels(1)
        , is_default(false) {}
};

/**
 * @brief Blocking source of fixed-size mono PCM16 frames
 *
 * Implementations:
 * - PortAudioSource (live microphone)
 * - SyntheticSource (silence, tone or WAV file paced in real time)
 *
 * Contract:
 * - open() throws core::Error(DeviceUnavailable) if the device cannot be claimed and
 *   core::Error(UnsupportedFormat) if it cannot deliver sample_rate/frame_size as-is.
 * - read_frame() blocks until exactly frame_size samples are available. Once the source
 *   is closed it throws core::Error(SourceClosed).
 * - close() is idempotent and may be called from another thread while read_frame() is
 *   blocked; the blocked call wakes and throws SourceClosed.
 * - A closed source may be opened again.
 */
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    virtual void open(const std::string& device_id, int sample_rate, size_t frame_size) = 0;
    virtual std::vector<int16_t> read_frame() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual AudioDeviceInfo device_info() const = 0;

    /// Frames lost inside the source (driver overrun), if the source can tell.
    virtual size_t dropped_frames() const { return 0; }
};

/**
 * @brief Creates sources by device id and enumerates devices
 */
class IAudioSourceFactory {
public:
    virtual ~IAudioSourceFactory() = default;

    virtual std::vector<AudioDeviceInfo> enumerate_devices() = 0;

    /// @return an unopened source able to handle device_id, or nullptr if no
    ///         implementation knows the id
    virtual std::unique_ptr<IAudioSource> create(const std::string& device_id) = 0;
};

} // namespace audio
