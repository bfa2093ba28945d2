// Live transcription console: microphone (or simulated microphone) -> whisper,
// controlled with line commands on stdin.
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "app/transcription_controller.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/audio_source_factory.hpp"
#include "audio/portaudio_output.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "tts/piper_engine.hpp"
#include "tts/speech_synthesizer.hpp"

namespace {

const char* kHelp =
    "Commands:\n"
    "  start              start transcribing with the current settings\n"
    "  stop               stop transcribing\n"
    "  device <id>        select input device (switches live while running)\n"
    "  model <preset>     tiny | base | small | medium | large\n"
    "  chunk <seconds>    audio per inference call\n"
    "  save [path]        export the transcript\n"
    "  speak [text]       speak text, or the whole transcript\n"
    "  hush               stop speaking\n"
    "  devices            list input devices\n"
    "  status             show pipeline state and counters\n"
    "  clear              clear the transcript\n"
    "  quit               exit\n";

void print_devices(const std::vector<audio::AudioDeviceInfo>& devices) {
    for (const auto& d : devices) {
        std::cout << (d.is_default ? " * " : "   ") << std::left << std::setw(28) << d.id
                  << d.name << " [" << d.driver << ", " << d.default_sample_rate << " Hz, "
                  << d.max_channels << " ch]\n";
    }
}

void print_status(const app::TranscriptionStatus& s) {
    std::cout << "state:      " << app::to_string(s.state);
    if (s.session_id) std::cout << " (session " << s.session_id << ", " << s.elapsed_ms / 1000 << " s)";
    std::cout << "\n";
    std::cout << "device:     " << (s.current_device.empty() ? "-" : s.current_device) << "\n";
    std::cout << "model:      " << s.model_preset << (s.model_loading ? " (loading)" : "") << "\n";
    if (s.session_id) {
        std::cout << "chunk:      " << s.chunk_seconds << " s\n";
        std::cout << "chunks:     " << s.chunks_captured << " captured, " << s.results_delivered << " delivered, "
                  << s.chunks_dropped << " dropped, " << s.inference_failures << " failed\n";
        std::cout << "inference:  " << s.inferences_in_flight << "/" << s.worker_limit << " busy, "
                  << s.chunks_queued << " queued\n";
    }
    std::cout << "transcript: " << s.transcript_lines << " line(s)" << (s.speaking ? ", speaking" : "") << "\n";
}

std::shared_ptr<tts::SpeechSynthesizer> make_speech(const core::Config& cfg) {
    try {
        auto engine = std::make_unique<tts::PiperEngine>(cfg.tts_voice, cfg.espeak_data);
        tts::SpeechOptions options;
        options.length_scale = cfg.tts_length_scale;
        options.volume = cfg.tts_volume;
        return std::make_shared<tts::SpeechSynthesizer>(std::move(engine), std::make_unique<audio::PortAudioOutput>(),
                                                        options);
    } catch (const core::Error& e) {
        core::log_warn(std::string("[tts] speech disabled: ") + e.what());
        return nullptr;
    }
}

// Applies one command; returns false on quit.
bool run_command(const std::string& line, app::TranscriptionController& controller, core::Config& cfg) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    std::string arg;
    std::getline(in >> std::ws, arg);

    const bool running = controller.get_state() == app::SessionState::Running;

    if (cmd.empty()) return true;
    if (cmd == "quit" || cmd == "exit") return false;
    if (cmd == "help" || cmd == "?") { std::cout << kHelp; return true; }

    if (cmd == "start") {
        app::TranscriptionConfig config;
        config.device_id = cfg.device_id;
        config.preset = *asr::parse_preset(cfg.model_preset);
        config.chunk_seconds = cfg.chunk_seconds;
        controller.start_transcription(config);
        std::cout << "Transcribing... type 'stop' to end" << std::endl;
    } else if (cmd == "stop") {
        controller.stop_transcription();
    } else if (cmd == "device") {
        if (arg.empty()) throw core::Error(core::ErrorCode::InvalidConfig, "usage: device <id>");
        if (running) {
            app::ReconfigureRequest request;
            request.device_id = arg;
            controller.reconfigure(request);
        }
        cfg.device_id = arg;
    } else if (cmd == "model") {
        const auto preset = asr::parse_preset(arg);
        if (!preset) throw core::Error(core::ErrorCode::InvalidConfig, "unknown model preset '" + arg + "'");
        if (running) {
            app::ReconfigureRequest request;
            request.preset = *preset;
            controller.reconfigure(request);
        }
        cfg.model_preset = asr::to_string(*preset);
    } else if (cmd == "chunk") {
        double seconds = 0.0;
        std::istringstream num(arg);
        if (!(num >> seconds) || seconds <= 0.0) {
            throw core::Error(core::ErrorCode::InvalidConfig, "usage: chunk <seconds> (positive)");
        }
        if (running) {
            app::ReconfigureRequest request;
            request.chunk_seconds = seconds;
            controller.reconfigure(request);
        }
        cfg.chunk_seconds = seconds;
    } else if (cmd == "save") {
        const std::string path = arg.empty() ? cfg.transcript_path : arg;
        controller.export_transcript(path.empty() ? "transcription.txt" : path);
    } else if (cmd == "speak") {
        if (!controller.speak_async(arg)) std::cout << "Nothing to speak" << std::endl;
    } else if (cmd == "hush") {
        controller.stop_speaking();
    } else if (cmd == "devices") {
        print_devices(controller.list_audio_devices());
    } else if (cmd == "status") {
        print_status(controller.get_status());
    } else if (cmd == "clear") {
        controller.clear_transcript();
    } else {
        std::cerr << "Unknown command '" << cmd << "' (type 'help')\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    core::Config cfg;
    try {
        cfg = core::load_config(argc, argv);
    } catch (const core::Error& e) {
        std::cerr << e.what() << "\n\n" << core::usage();
        return 2;
    }
    if (cfg.verbose) core::set_verbose(true);

    auto sources = std::make_shared<audio::AudioSourceFactory>();
    if (cfg.list_devices) {
        print_devices(sources->enumerate_devices());
        return 0;
    }

    asr::WhisperOptions whisper_options;
    whisper_options.model_dir = cfg.model_dir;
    whisper_options.workers = cfg.max_workers;
    auto models = std::make_shared<asr::WhisperBackend>(whisper_options);

    app::ControllerSettings settings;
    settings.sample_rate = cfg.sample_rate;
    settings.frame_size = cfg.frame_size;
    settings.queue_depth = cfg.queue_depth;
    settings.watchdog = std::chrono::milliseconds(cfg.watchdog_ms);
    settings.max_workers = cfg.max_workers;
    settings.transcript_path = cfg.transcript_path;

    app::TranscriptionController controller(sources, models, settings, make_speech(cfg));

    controller.subscribe_to_results([](const asr::TranscriptionResult& r) {
        if (r.text.empty()) return;
        std::cout << "[" << std::setw(4) << r.sequence << " @ " << std::fixed << std::setprecision(1)
                  << r.timestamp_ms / 1000.0 << "s] " << r.text << std::endl;
    });
    controller.subscribe_to_events([](const app::SessionEvent& e) {
        if (e.kind == app::SessionEvent::Kind::Overrun) {
            std::cerr << "[overrun] chunk " << e.sequence << " dropped\n";
        } else if (e.kind == app::SessionEvent::Kind::StateChanged) {
            core::log_debug(std::string("[state] ") + app::to_string(e.state));
        }
    });
    controller.subscribe_to_errors([](const app::TranscriptionError& e) {
        const char* level = e.severity == app::TranscriptionError::Severity::ERROR ? "[ERROR] " : "[WARN] ";
        std::cerr << level << e.message << ": " << e.details << "\n";
    });

    std::cout << "live_whisper: device '" << cfg.device_id << "', model '" << cfg.model_preset << "', chunk "
              << cfg.chunk_seconds << " s. Type 'help' for commands." << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        try {
            if (!run_command(line, controller, cfg)) break;
        } catch (const core::Error& e) {
            std::cerr << e.what() << "\n";
        }
    }
    controller.stop_speaking();
    controller.stop_transcription();
    return 0;
}
