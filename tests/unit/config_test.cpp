#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/errors.hpp"

static core::Config parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static std::string prog = "live_whisper";
    argv.push_back(&prog[0]);
    for (auto& a : args) argv.push_back(&a[0]);
    core::Config cfg;
    core::parse_args(static_cast<int>(argv.size()), argv.data(), cfg);
    core::validate(cfg);
    return cfg;
}

static bool rejects(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const core::Error& e) {
        return e.code() == core::ErrorCode::InvalidConfig;
    }
    return false;
}

int main() {
    core::Config defaults;
    assert(defaults.device_id == "default");
    assert(defaults.model_preset == "base");
    assert(defaults.chunk_seconds == 3.0);
    assert(defaults.sample_rate == 16000);
    assert(defaults.transcript_path == "transcription.txt");
    assert(defaults.tts_volume == 0.9f);

    auto cfg = parse({"--device", "synthetic:tone", "--model", "Small", "--chunk", "1.5",
                      "--queue-depth", "4", "--workers", "3", "--watchdog-ms", "2500", "--output", "", "-v"});
    assert(cfg.device_id == "synthetic:tone");
    assert(cfg.model_preset == "Small");
    assert(cfg.chunk_seconds == 1.5);
    assert(cfg.queue_depth == 4);
    assert(cfg.max_workers == 3);
    assert(cfg.watchdog_ms == 2500);
    assert(cfg.transcript_path.empty());
    assert(cfg.verbose);

    assert(rejects({"--chunk", "0"}));
    assert(rejects({"--chunk", "-2"}));
    assert(rejects({"--chunk", "abc"}));
    assert(rejects({"--model", "gigantic"}));
    assert(rejects({"--workers", "0"}));
    assert(rejects({"--device"}));
    assert(rejects({"--frobnicate"}));

    setenv("LWT_MODEL_DIR", "/opt/models", 1);
    core::Config env_cfg;
    core::apply_env(env_cfg);
    assert(env_cfg.model_dir == "/opt/models");
    unsetenv("LWT_MODEL_DIR");

    assert(core::usage().find("--chunk") != std::string::npos);
    return 0;
}
