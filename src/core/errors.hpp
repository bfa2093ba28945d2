// Copyright (c) 2025 VAM Desktop Live Whisper
// Error taxonomy shared by the audio, asr, app and tts modules

#pragma once

#include <stdexcept>
#include <string>

namespace core {

enum class ErrorCode {
    DeviceUnavailable,   ///< Device in use, permission denied or not found
    UnsupportedFormat,   ///< Device cannot deliver the requested rate/frame size
    SourceClosed,        ///< Audio source was closed (or reached its end)
    ModelLoadError,      ///< Missing weights or incompatible preset
    StallTimeout,        ///< Capture or inference exceeded the watchdog bound
    StartError,          ///< Session start failed (see StartError::cause())
    SinkFailure,         ///< A result sink threw while handling an event
    IOError,             ///< Transcript export failed
    Overrun,             ///< Chunk dropped because inference fell behind
    InferenceFailed,     ///< A single chunk could not be transcribed
    SessionActive,       ///< start() called while a session is running
    InvalidState,        ///< Operation not valid in the current controller state
    InvalidConfig,       ///< Rejected configuration value
    SynthesisFailed      ///< Text-to-speech engine or playback failure
};

const char* to_string(ErrorCode code);

/// Base exception for every failure the pipeline reports to a caller.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Thrown by TranscriptionController::start_transcription(); cause() names the
/// failure that aborted the start (DeviceUnavailable, ModelLoadError, ...).
class StartError : public Error {
public:
    StartError(ErrorCode cause, const std::string& message);

    ErrorCode cause() const noexcept { return cause_; }

private:
    ErrorCode cause_;
};

} // namespace core
