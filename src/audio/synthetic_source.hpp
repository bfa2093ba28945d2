#pragma once

#include "audio/audio_source.hpp"
#include "audio/wav_reader.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace audio {

/**
 * @brief Simulated microphone for demos and tests
 *
 * Device ids:
 * - "synthetic:silence"      all-zero frames
 * - "synthetic:tone"         440 Hz sine at -12 dBFS
 * - "synthetic:<file.wav>"   PCM16 mono WAV at the requested sample rate
 *
 * Frames are paced at the sample rate (like a real device) unless realtime is false.
 * At the end of a WAV file read_frame() throws SourceClosed, or rewinds if loop is set.
 */
class SyntheticSource : public IAudioSource {
public:
    static constexpr const char* kPrefix = "synthetic:";

    explicit SyntheticSource(bool realtime = true, bool loop = false);
    ~SyntheticSource() override;

    void open(const std::string& device_id, int sample_rate, size_t frame_size) override;
    std::vector<int16_t> read_frame() override;
    void close() override;
    bool is_open() const override;
    AudioDeviceInfo device_info() const override;

    static bool handles(const std::string& device_id);
    static std::vector<AudioDeviceInfo> enumerate();

private:
    enum class Mode { Silence, Tone, File };

    std::vector<int16_t> next_frame_locked();

    const bool realtime_;
    const bool loop_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    Mode mode_ = Mode::Silence;
    std::string device_id_;
    int sample_rate_ = 0;
    size_t frame_size_ = 0;
    uint64_t samples_emitted_ = 0;
    WavReader wav_;
    std::chrono::steady_clock::time_point next_frame_time_;
};

} // namespace audio
