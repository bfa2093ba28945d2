#include "audio/portaudio_session.hpp"
#include "core/errors.hpp"
#include <portaudio.h>
#include <string>

namespace audio {

PortAudioSession::PortAudioSession() {
    PaError e = Pa_Initialize();
    if (e != paNoError) {
        throw core::Error(core::ErrorCode::DeviceUnavailable,
                          std::string("Pa_Initialize: ") + Pa_GetErrorText(e));
    }
}

PortAudioSession::~PortAudioSession() {
    Pa_Terminate();
}

} // namespace audio
