#pragma once

namespace audio {

// RAII Pa_Initialize()/Pa_Terminate() pair. PortAudio reference-counts nested
// initialization, so every source and output can hold its own instance.
class PortAudioSession {
public:
    PortAudioSession();   // throws core::Error(DeviceUnavailable) if PortAudio cannot start
    ~PortAudioSession();

    PortAudioSession(const PortAudioSession&) = delete;
    PortAudioSession& operator=(const PortAudioSession&) = delete;
};

} // namespace audio
