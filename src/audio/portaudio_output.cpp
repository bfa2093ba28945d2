#include "audio/portaudio_output.hpp"
#include "core/logging.hpp"
#include <portaudio.h>
#include <algorithm>
#include <string>

namespace audio {

PortAudioOutput::PortAudioOutput() = default;

PortAudioOutput::~PortAudioOutput() {
    release(false);
}

bool PortAudioOutput::start(int sample_rate, int channels) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        // Left over from an aborted utterance
        auto* old = static_cast<PaStream*>(stream_);
        Pa_AbortStream(old);
        Pa_CloseStream(old);
        stream_ = nullptr;
    }
    aborted_.store(false);
    PaStream* stream = nullptr;
    PaError e = Pa_OpenDefaultStream(&stream, 0, channels, paInt16, sample_rate,
                                     paFramesPerBufferUnspecified, nullptr, nullptr);
    if (e != paNoError) {
        core::log_error(std::string("[playback] Pa_OpenDefaultStream: ") + Pa_GetErrorText(e));
        return false;
    }
    e = Pa_StartStream(stream);
    if (e != paNoError) {
        core::log_error(std::string("[playback] Pa_StartStream: ") + Pa_GetErrorText(e));
        Pa_CloseStream(stream);
        return false;
    }
    stream_ = stream;
    channels_ = channels;
    return true;
}

bool PortAudioOutput::write(const int16_t* data, size_t frames) {
    PaStream* stream = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = static_cast<PaStream*>(stream_);
    }
    if (!stream) return false;
    // Write in ~64 ms slices so abort() takes effect quickly
    const size_t slice = 1024;
    size_t done = 0;
    while (done < frames) {
        if (aborted_.load()) return false;
        const size_t n = std::min(slice, frames - done);
        PaError e = Pa_WriteStream(stream, data + done * channels_, static_cast<unsigned long>(n));
        if (e != paNoError && e != paOutputUnderflowed) {
            if (!aborted_.load()) {
                core::log_error(std::string("[playback] Pa_WriteStream: ") + Pa_GetErrorText(e));
            }
            return false;
        }
        done += n;
    }
    return !aborted_.load();
}

void PortAudioOutput::stop() {
    release(true);
}

void PortAudioOutput::abort() {
    aborted_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        // Unblocks a concurrent Pa_WriteStream
        Pa_AbortStream(static_cast<PaStream*>(stream_));
    }
    if (draining_) {
        // Cuts a concurrent Pa_StopStream short
        Pa_AbortStream(static_cast<PaStream*>(draining_));
    }
}

void PortAudioOutput::release(bool drain) {
    PaStream* stream = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return;
        stream = static_cast<PaStream*>(stream_);
        stream_ = nullptr;
        draining_ = stream;
    }
    // Outside the lock so abort() can interrupt the drain
    if (drain && !aborted_.load()) {
        Pa_StopStream(stream);    // waits for queued buffers to play out
    } else {
        Pa_AbortStream(stream);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Pa_CloseStream(stream);
    draining_ = nullptr;
}

} // namespace audio
