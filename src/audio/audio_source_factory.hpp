#pragma once

#include "audio/audio_source.hpp"

namespace audio {

/**
 * @brief Default factory: PortAudio microphones plus the synthetic devices
 *
 * Device ids:
 * - "" or "default"             system default microphone
 * - "<index>"                   PortAudio device index from enumerate_devices()
 * - "synthetic:..."             SyntheticSource (see synthetic_source.hpp)
 */
class AudioSourceFactory : public IAudioSourceFactory {
public:
    explicit AudioSourceFactory(bool loop_synthetic_files = false);

    std::vector<AudioDeviceInfo> enumerate_devices() override;
    std::unique_ptr<IAudioSource> create(const std::string& device_id) override;

private:
    bool loop_synthetic_files_;
};

} // namespace audio
