#include "audio/audio_source_factory.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/synthetic_source.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace audio {

AudioSourceFactory::AudioSourceFactory(bool loop_synthetic_files)
    : loop_synthetic_files_(loop_synthetic_files) {}

std::vector<AudioDeviceInfo> AudioSourceFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices;
    try {
        PortAudioSession pa;
        devices = PortAudioSource::enumerate();
    } catch (const core::Error& e) {
        core::log_warn(std::string("[devices] microphone scan failed: ") + e.what());
    }

    // Always add synthetic devices
    auto synthetic = SyntheticSource::enumerate();
    devices.insert(devices.end(), synthetic.begin(), synthetic.end());
    return devices;
}

std::unique_ptr<IAudioSource> AudioSourceFactory::create(const std::string& device_id) {
    if (SyntheticSource::handles(device_id)) {
        return std::make_unique<SyntheticSource>(true, loop_synthetic_files_);
    }
    return std::make_unique<PortAudioSource>();
}

} // namespace audio
