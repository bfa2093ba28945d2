#pragma once
#include <cstddef>
#include <cstdint>

namespace audio {

// Blocking PCM16 playback used by the speech synthesizer.
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    virtual bool start(int sample_rate, int channels = 1) = 0;
    // Blocks until the samples are queued to the device; false on device error or abort.
    virtual bool write(const int16_t* data, size_t frames) = 0;
    // Let queued audio finish playing, then release the device.
    virtual void stop() = 0;
    // Drop queued audio immediately; safe to call from another thread during write().
    virtual void abort() = 0;
};

} // namespace audio
