#pragma once

#include "audio/audio_output.hpp"
#include "audio/portaudio_session.hpp"
#include <atomic>
#include <mutex>

namespace audio {

class PortAudioOutput : public IAudioOutput {
public:
    PortAudioOutput();
    ~PortAudioOutput() override;

    bool start(int sample_rate, int channels = 1) override;
    bool write(const int16_t* data, size_t frames) override;
    void stop() override;
    void abort() override;

private:
    void release(bool drain);

    PortAudioSession pa_;
    std::mutex mutex_;
    void* stream_ = nullptr;   // PaStream*
    void* draining_ = nullptr; // stream being stopped by release()
    int channels_ = 1;
    std::atomic<bool> aborted_{false};
};

} // namespace audio
