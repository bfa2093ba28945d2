// Copyright (c) 2025 VAM Desktop Live Whisper
// Application API - Transcription Controller Interface
//
// Provides the control surface for live transcription: session lifecycle,
// mid-session reconfiguration, result subscriptions, transcript export and
// speech playback. Front-ends (console, tests) only talk to this class.

#pragma once

#include "app/result_bus.hpp"
#include "asr/model_preset.hpp"
#include "audio/audio_source.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace asr {
class IModelBackend;
}

namespace tts {
class SpeechSynthesizer;
}

namespace app {

// Forward declarations
class TranscriptionControllerImpl;

//==============================================================================
// Configuration Structures
//==============================================================================

/// Process-wide settings, fixed for the controller's lifetime
struct ControllerSettings {
    int sample_rate = 16000;                          ///< Capture rate (whisper expects 16 kHz)
    size_t frame_size = 1024;                         ///< Samples per read_frame()
    size_t queue_depth = 8;                           ///< Chunks waiting for inference before overrun
    std::chrono::milliseconds watchdog{10000};        ///< Stall bound for capture and inference
    int max_workers = 2;                              ///< Upper bound for the inference pool
    std::string transcript_path;                      ///< Autosave target, empty disables autosave
};

/// Parameters of one transcription session
struct TranscriptionConfig {
    std::string device_id = "default";                ///< From list_audio_devices()
    asr::ModelPreset preset = asr::ModelPreset::Base; ///< Whisper model size
    double chunk_seconds = 3.0;                       ///< Audio per inference call
};

/// Partial update for a running session. Unset fields keep their value.
struct ReconfigureRequest {
    std::optional<std::string> device_id;
    std::optional<asr::ModelPreset> preset;
    std::optional<double> chunk_seconds;
};

//==============================================================================
// Event Structures
//==============================================================================

/// Transcription status information
struct TranscriptionStatus {
    SessionState state = SessionState::Idle;          ///< Current controller state
    uint64_t session_id = 0;                          ///< 0 when idle
    int64_t elapsed_ms = 0;                           ///< Time since the session started
    std::string current_device;                       ///< Device being captured
    std::string model_preset;                         ///< Preset new chunks are transcribed with
    double chunk_seconds = 0.0;

    // Pipeline counters (current session)
    uint64_t chunks_captured = 0;
    uint64_t results_delivered = 0;
    uint64_t chunks_dropped = 0;                      ///< Overruns
    uint64_t inference_failures = 0;
    size_t chunks_queued = 0;
    int inferences_in_flight = 0;
    int worker_limit = 0;

    size_t transcript_lines = 0;
    bool model_loading = false;
    bool speaking = false;
};

/// Error/warning event
struct TranscriptionError {
    /// Error severity level
    enum class Severity {
        WARNING,                                      ///< Non-fatal, session continues
        ERROR                                         ///< Session stopped or operation failed
    };

    Severity severity = Severity::WARNING;
    core::ErrorCode code = core::ErrorCode::InvalidState;
    std::string message;                              ///< Human-readable error message
    std::string details;                              ///< Technical details for debugging
    int64_t timestamp_ms = 0;                         ///< ms since the controller was created
};

//==============================================================================
// Callback Types
//==============================================================================

using ErrorCallback = std::function<void(const TranscriptionError&)>;

//==============================================================================
// Main Controller Class
//==============================================================================

/// Main controller for live transcription
///
/// State machine: Idle -> Starting -> Running -> Stopping -> Idle, and
/// Running -> Reconfiguring -> Running. Only one session runs at a time.
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Result and event callbacks run on per-subscriber dispatcher threads
/// - Error callbacks run on whichever thread detected the error
///
/// Example:
/// @code
/// TranscriptionController controller(factory, backend);
///
/// controller.subscribe_to_results([](const asr::TranscriptionResult& r) {
///     std::cout << "[" << r.sequence << "] " << r.text << "\n";
/// });
///
/// TranscriptionConfig config;
/// controller.start_transcription(config);
/// // ... let it run ...
/// controller.stop_transcription();
/// @endcode
class TranscriptionController {
public:
    //==========================================================================
    // Lifecycle
    //==========================================================================

    /// @param sources Creates and enumerates capture devices
    /// @param models Loads recognition models for presets
    /// @param settings Process-wide settings
    /// @param speech Optional text-to-speech; speak() fails without it
    TranscriptionController(std::shared_ptr<audio::IAudioSourceFactory> sources,
                            std::shared_ptr<asr::IModelBackend> models,
                            ControllerSettings settings = {},
                            std::shared_ptr<tts::SpeechSynthesizer> speech = nullptr);

    /// Destructor (stops transcription if running)
    ~TranscriptionController();

    // Non-copyable, non-movable
    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;
    TranscriptionController(TranscriptionController&&) = delete;
    TranscriptionController& operator=(TranscriptionController&&) = delete;

    //==========================================================================
    // Device Management
    //==========================================================================

    /// Get list of available audio input devices
    /// @return Input-capable devices plus the synthetic ones
    std::vector<audio::AudioDeviceInfo> list_audio_devices();

    //==========================================================================
    // Transcription Control
    //==========================================================================

    /// Start a transcription session: load the preset, open the device, spawn
    /// the pipeline threads.
    /// @throws core::StartError with cause SessionActive, InvalidConfig,
    ///         ModelLoadError, DeviceUnavailable or UnsupportedFormat.
    ///         The controller is back in Idle when it throws (except for
    ///         SessionActive, which leaves the running session untouched).
    void start_transcription(const TranscriptionConfig& config);

    /// Stop transcription session. Queued audio is discarded; the device is
    /// closed before this returns.
    /// @note Safe to call even if not running
    void stop_transcription();

    /// Change device, preset and/or chunk length of the running session.
    /// Sequence numbering continues across the change.
    /// @throws core::Error(InvalidState) when not Running,
    ///         core::Error(InvalidConfig) for a bad chunk length, and the
    ///         device/model error when the new device or preset fails. The
    ///         session keeps running on its previous device/model in that case.
    void reconfigure(const ReconfigureRequest& request);

    /// Check if a session is active (Starting, Running or Reconfiguring)
    bool is_running() const;

    SessionState get_state() const;

    /// Get current transcription status
    /// @return Status structure with state and counters
    TranscriptionStatus get_status() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    /// Subscribe to ordered transcription results
    /// @return Id usable with remove_sink()
    ResultBus::SinkId subscribe_to_results(ResultCallback callback);

    /// Subscribe to state changes, overruns, chunk failures and terminations
    ResultBus::SinkId subscribe_to_events(EventCallback callback);

    /// Subscribe to error/warning events
    void subscribe_to_errors(ErrorCallback callback);

    /// Register a custom sink; it gets results and events on its own thread
    ResultBus::SinkId add_sink(std::shared_ptr<ResultSink> sink, const std::string& name);
    bool remove_sink(ResultBus::SinkId id);

    /// Wait until every sink has handled everything published so far
    bool flush_sinks(std::chrono::milliseconds timeout);

    //==========================================================================
    // Transcript
    //==========================================================================

    /// Space-joined transcript text
    std::string get_transcript() const;
    std::vector<std::string> get_transcript_lines() const;

    /// Write the transcript (one line per result) atomically.
    /// @throws core::Error(IOError); the transcript is kept either way
    void export_transcript(const std::string& path);

    void clear_transcript();

    //==========================================================================
    // Speech
    //==========================================================================

    /// Speak text, or the whole transcript when text is empty. Blocks until
    /// playback ends.
    /// @return false when there was nothing to speak or playback was cancelled
    /// @throws core::Error(SynthesisFailed)
    bool speak(const std::string& text);

    /// Non-blocking variant; a new request replaces the current one.
    /// @return false when there was nothing to speak
    bool speak_async(const std::string& text);

    /// Cancel speech playback. Never touches the transcription session.
    void stop_speaking();

    bool is_speaking() const;

private:
    std::unique_ptr<TranscriptionControllerImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
