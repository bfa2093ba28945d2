#include "core/config.hpp"
#include "core/errors.hpp"
#include "asr/model_preset.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {
const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

double to_double(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        double d = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return d;
    } catch (const std::exception&) {
        throw Error(ErrorCode::InvalidConfig, flag + " expects a number, got '" + value + "'");
    }
}

long to_long(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        long n = std::stol(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw Error(ErrorCode::InvalidConfig, flag + " expects an integer, got '" + value + "'");
    }
}
}

void apply_env(Config& cfg) {
    if (const char* v = env_or_null("LWT_MODEL_DIR")) cfg.model_dir = v;
    if (const char* v = env_or_null("LWT_TTS_VOICE")) cfg.tts_voice = v;
    if (env_or_null("LWT_DEBUG")) cfg.verbose = true;
}

void parse_args(int argc, char** argv, Config& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw Error(ErrorCode::InvalidConfig, flag + " requires a value");
            }
            return argv[++i];
        };
        if (a == "-v" || a == "--verbose") { cfg.verbose = true; continue; }
        if (a == "--list-devices") { cfg.list_devices = true; continue; }
        if (a == "--device") { cfg.device_id = value(a); continue; }
        if (a == "--model") { cfg.model_preset = value(a); continue; }
        if (a == "--chunk") { cfg.chunk_seconds = to_double(a, value(a)); continue; }
        if (a == "--model-dir") { cfg.model_dir = value(a); continue; }
        if (a == "--output") { cfg.transcript_path = value(a); continue; }
        if (a == "--voice") { cfg.tts_voice = value(a); continue; }
        if (a == "--espeak-data") { cfg.espeak_data = value(a); continue; }
        if (a == "--watchdog-ms") { cfg.watchdog_ms = static_cast<int>(to_long(a, value(a))); continue; }
        if (a == "--queue-depth") { cfg.queue_depth = static_cast<size_t>(to_long(a, value(a))); continue; }
        if (a == "--workers") { cfg.max_workers = static_cast<int>(to_long(a, value(a))); continue; }
        throw Error(ErrorCode::InvalidConfig, "unknown option '" + a + "'");
    }
}

void validate(const Config& cfg) {
    if (!(cfg.chunk_seconds > 0.0)) {
        throw Error(ErrorCode::InvalidConfig, "chunk seconds must be positive");
    }
    if (!asr::parse_preset(cfg.model_preset)) {
        throw Error(ErrorCode::InvalidConfig, "unknown model preset '" + cfg.model_preset + "'");
    }
    if (cfg.sample_rate <= 0 || cfg.frame_size == 0) {
        throw Error(ErrorCode::InvalidConfig, "sample rate and frame size must be positive");
    }
    if (cfg.watchdog_ms <= 0) {
        throw Error(ErrorCode::InvalidConfig, "watchdog must be positive");
    }
    if (cfg.queue_depth == 0 || cfg.max_workers <= 0) {
        throw Error(ErrorCode::InvalidConfig, "queue depth and worker count must be positive");
    }
    if (cfg.tts_volume < 0.0f || cfg.tts_volume > 1.0f) {
        throw Error(ErrorCode::InvalidConfig, "volume must be within [0, 1]");
    }
}

Config load_config(int argc, char** argv) {
    Config cfg;
    apply_env(cfg);
    parse_args(argc, argv, cfg);
    validate(cfg);
    return cfg;
}

std::string usage() {
    std::ostringstream os;
    os << "Usage: live_whisper [options]\n"
       << "  --device <id>        input device (index, 'default', 'synthetic:silence|tone|<file.wav>')\n"
       << "  --model <preset>     tiny | base | small | medium | large (default base)\n"
       << "  --chunk <seconds>    audio chunk length (default 3)\n"
       << "  --model-dir <dir>    whisper model directory (default models)\n"
       << "  --output <file>      transcript autosave path, '' to disable\n"
       << "  --voice <file.onnx>  piper voice model\n"
       << "  --espeak-data <dir>  espeak-ng data directory\n"
       << "  --watchdog-ms <n>    stall timeout (default 10000)\n"
       << "  --queue-depth <n>    pending chunks before drop-oldest (default 8)\n"
       << "  --workers <n>        maximum concurrent inference calls (default 2)\n"
       << "  --list-devices       print input devices and exit\n"
       << "  -v, --verbose        debug logging\n";
    return os.str();
}

}
