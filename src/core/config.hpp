#pragma once
#include <cstddef>
#include <string>

namespace core {
struct Config {
    // Session
    std::string device_id = "default";      // PortAudio index, "default" or "synthetic:..."
    std::string model_preset = "base";      // tiny, base, small, medium, large
    double chunk_seconds = 3.0;
    int sample_rate = 16000;                // Whisper expects 16 kHz mono
    size_t frame_size = 1024;               // samples per read_frame()

    // Pipeline
    size_t queue_depth = 8;                 // chunks waiting for inference before drop-oldest
    int watchdog_ms = 10000;
    int max_workers = 2;

    // Model and output
    std::string model_dir = "models";
    std::string transcript_path = "transcription.txt"; // empty = no autosave

    // Text-to-speech
    std::string tts_voice = "voices/en_US-lessac-medium.onnx";
    std::string espeak_data;                // empty = piper built-in
    float tts_length_scale = 1.0f;          // >1 slower, <1 faster
    float tts_volume = 0.9f;

    bool list_devices = false;
    bool verbose = false;
};

// Environment overrides: LWT_MODEL_DIR, LWT_TTS_VOICE, LWT_DEBUG
void apply_env(Config& cfg);

// Command line overrides. Throws core::Error(InvalidConfig) on unknown flags or bad values.
void parse_args(int argc, char** argv, Config& cfg);

// Throws core::Error(InvalidConfig) if a value is out of range.
void validate(const Config& cfg);

// Defaults, then environment, then command line; validated.
Config load_config(int argc, char** argv);

std::string usage();
}
