// Copyright (c) 2025 VAM Desktop Live Whisper

#include "core/errors.hpp"

namespace core {

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
    case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorCode::SourceClosed:      return "SourceClosed";
    case ErrorCode::ModelLoadError:    return "ModelLoadError";
    case ErrorCode::StallTimeout:      return "StallTimeout";
    case ErrorCode::StartError:        return "StartError";
    case ErrorCode::SinkFailure:       return "SinkFailure";
    case ErrorCode::IOError:           return "IOError";
    case ErrorCode::Overrun:           return "Overrun";
    case ErrorCode::InferenceFailed:   return "InferenceFailed";
    case ErrorCode::SessionActive:     return "SessionActive";
    case ErrorCode::InvalidState:      return "InvalidState";
    case ErrorCode::InvalidConfig:     return "InvalidConfig";
    case ErrorCode::SynthesisFailed:   return "SynthesisFailed";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message)
    , code_(code) {}

StartError::StartError(ErrorCode cause, const std::string& message)
    : Error(ErrorCode::StartError, message)
    , cause_(cause) {}

} // namespace core
