// Copyright (c) 2025 VAM Desktop Live Whisper
// Application API - Transcription Controller Implementation

#include "app/transcription_controller.hpp"
#include "app/session.hpp"
#include "app/transcript_sink.hpp"
#include "asr/transcription_engine.hpp"
#include "audio/chunker.hpp"
#include "core/logging.hpp"
#include "tts/speech_synthesizer.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace app {

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class TranscriptionControllerImpl {
public:
    TranscriptionControllerImpl(std::shared_ptr<audio::IAudioSourceFactory> sources,
                                std::shared_ptr<asr::IModelBackend> models,
                                ControllerSettings settings,
                                std::shared_ptr<tts::SpeechSynthesizer> speech);
    ~TranscriptionControllerImpl();

    // Device Management
    std::vector<audio::AudioDeviceInfo> list_audio_devices();

    // Transcription Control
    void start(const TranscriptionConfig& config);
    void stop();
    void reconfigure(const ReconfigureRequest& request);
    SessionState get_state() const;
    TranscriptionStatus get_status() const;

    // Event Subscription
    ResultBus::SinkId add_sink(std::shared_ptr<ResultSink> sink, const std::string& name);
    bool remove_sink(ResultBus::SinkId id);
    bool flush_sinks(std::chrono::milliseconds timeout);
    void subscribe_to_errors(ErrorCallback callback);

    // Transcript
    std::shared_ptr<TranscriptSink> transcript() const { return transcript_; }
    void export_transcript(const std::string& path);

    // Speech
    bool speak(const std::string& text, bool wait);
    void stop_speaking();
    bool is_speaking() const;

private:
    // Internal methods
    void set_state(SessionState state);
    void teardown(const std::shared_ptr<Session>& session);
    void on_session_failure(const std::shared_ptr<Session>& session, core::ErrorCode code, const std::string& message);
    void reap(const std::shared_ptr<Session>& session, core::ErrorCode code, const std::string& message);
    std::unique_ptr<audio::IAudioSource> open_source(const std::string& device_id);
    void emit_error(TranscriptionError::Severity severity, core::ErrorCode code,
                    const std::string& message, const std::string& details);
    int64_t get_elapsed_ms() const;

    std::shared_ptr<audio::IAudioSourceFactory> sources_;
    std::shared_ptr<asr::TranscriptionEngine> engine_;
    ControllerSettings settings_;
    std::shared_ptr<tts::SpeechSynthesizer> speech_;
    const std::chrono::steady_clock::time_point created_at_;

    std::shared_ptr<ResultBus> bus_;
    std::shared_ptr<TranscriptSink> transcript_;
    ResultBus::SinkId transcript_sink_id_ = 0;

    // Serializes start/stop/reconfigure (released while a preset loads)
    std::mutex control_mutex_;

    // Snapshot read by get_status() without waiting for control operations
    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Idle;
    std::shared_ptr<Session> session_;
    asr::ModelPreset preset_ = asr::ModelPreset::Base;
    uint64_t next_session_id_ = 1;

    // Failure teardown runs off the session threads
    struct Reaper {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex reapers_mutex_;
    std::vector<Reaper> reapers_;
    bool shutting_down_ = false;

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<ErrorCallback> error_callbacks_;
};

TranscriptionControllerImpl::TranscriptionControllerImpl(std::shared_ptr<audio::IAudioSourceFactory> sources,
                                                         std::shared_ptr<asr::IModelBackend> models,
                                                         ControllerSettings settings,
                                                         std::shared_ptr<tts::SpeechSynthesizer> speech)
    : sources_(std::move(sources))
    , engine_(std::make_shared<asr::TranscriptionEngine>(std::move(models)))
    , settings_(std::move(settings))
    , speech_(std::move(speech))
    , created_at_(std::chrono::steady_clock::now()) {
    if (!sources_) {
        throw core::Error(core::ErrorCode::InvalidConfig, "no audio source factory");
    }
    bus_ = std::make_shared<ResultBus>([this](ResultBus::SinkId id, const std::string& name, const std::string& cause) {
        emit_error(TranscriptionError::Severity::WARNING, core::ErrorCode::SinkFailure,
                   "sink '" + name + "' (#" + std::to_string(id) + ") failed", cause);
    });
    transcript_ = std::make_shared<TranscriptSink>(settings_.transcript_path);
    transcript_sink_id_ = bus_->add_sink(transcript_, "transcript");

    if (speech_) {
        speech_->set_error_handler([this](const std::string& message) {
            emit_error(TranscriptionError::Severity::WARNING, core::ErrorCode::SynthesisFailed,
                       "speech playback failed", message);
        });
    }
}

TranscriptionControllerImpl::~TranscriptionControllerImpl() {
    std::vector<Reaper> reapers;
    {
        std::lock_guard<std::mutex> lock(reapers_mutex_);
        shutting_down_ = true;
        reapers.swap(reapers_);
    }
    for (auto& r : reapers) {
        if (r.thread.joinable()) r.thread.join();
    }
    stop();
    if (speech_) {
        speech_->cancel();
        speech_->set_error_handler({});
    }
    // A detached session thread may still hold the bus; no callbacks into this object after here
    bus_->clear();
}

//==============================================================================
// Device Management Implementation
//==============================================================================

std::vector<audio::AudioDeviceInfo> TranscriptionControllerImpl::list_audio_devices() {
    return sources_->enumerate_devices();
}

std::unique_ptr<audio::IAudioSource> TranscriptionControllerImpl::open_source(const std::string& device_id) {
    auto source = sources_->create(device_id);
    if (!source) {
        throw core::Error(core::ErrorCode::DeviceUnavailable, "unknown device '" + device_id + "'");
    }
    source->open(device_id, settings_.sample_rate, settings_.frame_size);
    return source;
}

//==============================================================================
// Transcription Control Implementation
//==============================================================================

void TranscriptionControllerImpl::set_state(SessionState state) {
    uint64_t session_id = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == state) return;
        state_ = state;
        session_id = session_ ? session_->id() : 0;
    }
    core::log_debug(std::string("[controller] state -> ") + to_string(state));

    SessionEvent event;
    event.kind = SessionEvent::Kind::StateChanged;
    event.state = state;
    event.session_id = session_id;
    bus_->publish(event);
}

void TranscriptionControllerImpl::start(const TranscriptionConfig& config) {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Idle) {
            throw core::StartError(core::ErrorCode::SessionActive,
                                   std::string("session already ") + to_string(state_));
        }
    }

    set_state(SessionState::Starting);
    try {
        audio::Chunker::samples_for(config.chunk_seconds, settings_.sample_rate);

        // Model first: a missing model must not leave the device claimed
        engine_->load_preset(config.preset);
        auto source = open_source(config.device_id);

        SessionConfig session_config;
        session_config.device_id = config.device_id;
        session_config.chunk_seconds = config.chunk_seconds;
        session_config.sample_rate = settings_.sample_rate;
        session_config.frame_size = settings_.frame_size;
        session_config.queue_depth = settings_.queue_depth;
        session_config.watchdog = settings_.watchdog;
        session_config.max_workers = settings_.max_workers;
        session_config.worker_limit = asr::recommended_workers(config.preset, settings_.max_workers);

        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            id = next_session_id_++;
        }
        auto session = std::make_shared<Session>(
            id, session_config, engine_, bus_,
            [this](const std::shared_ptr<Session>& s, core::ErrorCode code, const std::string& message) {
                on_session_failure(s, code, message);
            });
        session->start(std::move(source));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_ = session;
            preset_ = config.preset;
        }
    } catch (const core::Error& e) {
        set_state(SessionState::Idle);
        emit_error(TranscriptionError::Severity::ERROR, e.code(), "failed to start transcription", e.what());
        throw core::StartError(e.code(), e.what());
    } catch (const std::exception& e) {
        set_state(SessionState::Idle);
        emit_error(TranscriptionError::Severity::ERROR, core::ErrorCode::StartError,
                   "failed to start transcription", e.what());
        throw core::StartError(core::ErrorCode::StartError, e.what());
    }
    set_state(SessionState::Running);
    core::log_info("[controller] transcribing from '" + config.device_id + "' with preset '" +
                   asr::to_string(config.preset) + "'");
}

void TranscriptionControllerImpl::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session = session_;
    }
    if (!session) {
        return;
    }
    teardown(session);
}

// Caller holds control_mutex_
void TranscriptionControllerImpl::teardown(const std::shared_ptr<Session>& session) {
    set_state(SessionState::Stopping);
    session->stop();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_.reset();
    }
    set_state(SessionState::Idle);
}

void TranscriptionControllerImpl::reconfigure(const ReconfigureRequest& request) {
    std::unique_lock<std::mutex> control(control_mutex_);
    std::shared_ptr<Session> session;
    asr::ModelPreset current_preset;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Running || !session_) {
            throw core::Error(core::ErrorCode::InvalidState,
                              std::string("reconfigure needs a running session (state is ") + to_string(state_) + ")");
        }
        session = session_;
        current_preset = preset_;
    }
    if (request.chunk_seconds) {
        audio::Chunker::samples_for(*request.chunk_seconds, settings_.sample_rate);
    }

    const bool device_change = request.device_id && *request.device_id != session->device_id();
    const bool preset_change = request.preset && *request.preset != current_preset;
    if (device_change || preset_change) {
        set_state(SessionState::Reconfiguring);
    }

    // Everything that can fail happens before the session is touched:
    // the new device opens while the old one keeps capturing
    std::unique_ptr<audio::IAudioSource> source;
    if (device_change) {
        try {
            source = open_source(*request.device_id);
        } catch (const core::Error& e) {
            set_state(SessionState::Running);
            emit_error(TranscriptionError::Severity::WARNING, e.code(),
                       "cannot switch to device '" + *request.device_id + "'", e.what());
            throw;
        }
    }

    if (preset_change) {
        const asr::ModelPreset preset = *request.preset;

        // Inference continues on the old handle while the new model loads;
        // stop() may run meanwhile
        control.unlock();
        std::exception_ptr load_failure;
        std::string load_error;
        core::ErrorCode load_code = core::ErrorCode::ModelLoadError;
        try {
            engine_->load_preset(preset);
        } catch (const core::Error& e) {
            load_failure = std::current_exception();
            load_error = e.what();
            load_code = e.code();
        }
        control.lock();

        bool still_current = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            still_current = session_ == session && state_ == SessionState::Reconfiguring;
        }
        if (!still_current) {
            if (source) source->close();
            core::log_info("[controller] session ended while preset '" + std::string(asr::to_string(preset)) +
                           "' was loading");
            return;
        }
        if (load_failure) {
            if (source) source->close();
            set_state(SessionState::Running);
            emit_error(TranscriptionError::Severity::WARNING, load_code,
                       "cannot switch to preset '" + std::string(asr::to_string(preset)) + "'", load_error);
            std::rethrow_exception(load_failure);
        }
    }

    // Commit
    if (source) {
        session->switch_source(std::move(source), *request.device_id);
    }
    if (request.chunk_seconds) {
        session->set_chunk_seconds(*request.chunk_seconds);
    }
    if (preset_change) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            preset_ = *request.preset;
        }
        session->set_worker_limit(asr::recommended_workers(*request.preset, settings_.max_workers));
    }
    set_state(SessionState::Running);
}

SessionState TranscriptionControllerImpl::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TranscriptionStatus TranscriptionControllerImpl::get_status() const {
    TranscriptionStatus status;
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status.state = state_;
        session = session_;
        status.model_preset = asr::to_string(preset_);
    }
    if (session) {
        const SessionStats stats = session->stats();
        status.session_id = session->id();
        status.elapsed_ms = stats.elapsed_ms;
        status.current_device = stats.device_id;
        status.chunk_seconds = stats.chunk_seconds;
        status.chunks_captured = stats.chunks_captured;
        status.results_delivered = stats.results_delivered;
        status.chunks_dropped = stats.chunks_dropped;
        status.inference_failures = stats.inference_failures;
        status.chunks_queued = stats.chunks_queued;
        status.inferences_in_flight = stats.inferences_in_flight;
        status.worker_limit = stats.worker_limit;
    }
    status.transcript_lines = transcript_->size();
    status.model_loading = engine_->is_loading();
    status.speaking = speech_ && speech_->is_speaking();
    return status;
}

//==============================================================================
// Session failure handling
//==============================================================================

void TranscriptionControllerImpl::on_session_failure(const std::shared_ptr<Session>& session,
                                                     core::ErrorCode code,
                                                     const std::string& message) {
    // Runs on a session thread, which Session::stop() would wait for
    std::lock_guard<std::mutex> lock(reapers_mutex_);
    if (shutting_down_) return;

    // Join reapers from earlier failures that have finished
    for (auto it = reapers_.begin(); it != reapers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = reapers_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, session, code, message, done] {
        reap(session, code, message);
        done->store(true);
    });
    reapers_.push_back(Reaper{std::move(thread), std::move(done)});
}

void TranscriptionControllerImpl::reap(const std::shared_ptr<Session>& session,
                                       core::ErrorCode code,
                                       const std::string& message) {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_ != session) {
            return;   // already stopped by the user
        }
    }
    teardown(session);

    SessionEvent event;
    event.kind = SessionEvent::Kind::Terminated;
    event.state = SessionState::Idle;
    event.code = code;
    event.session_id = session->id();
    event.message = message;
    bus_->publish(event);

    emit_error(TranscriptionError::Severity::ERROR, code, "transcription stopped", message);
}

//==============================================================================
// Event Subscription Implementation
//==============================================================================

ResultBus::SinkId TranscriptionControllerImpl::add_sink(std::shared_ptr<ResultSink> sink, const std::string& name) {
    return bus_->add_sink(std::move(sink), name);
}

bool TranscriptionControllerImpl::remove_sink(ResultBus::SinkId id) {
    if (id == transcript_sink_id_) {
        return false;
    }
    return bus_->remove_sink(id);
}

bool TranscriptionControllerImpl::flush_sinks(std::chrono::milliseconds timeout) {
    return bus_->flush_all(timeout);
}

void TranscriptionControllerImpl::subscribe_to_errors(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::emit_error(TranscriptionError::Severity severity, core::ErrorCode code,
                                             const std::string& message, const std::string& details) {
    TranscriptionError error;
    error.severity = severity;
    error.code = code;
    error.message = message;
    error.details = details;
    error.timestamp_ms = get_elapsed_ms();

    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = error_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            core::log_error(std::string("[controller] error callback exception: ") + e.what());
        }
    }
}

int64_t TranscriptionControllerImpl::get_elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - created_at_).count();
}

//==============================================================================
// Transcript and Speech Implementation
//==============================================================================

void TranscriptionControllerImpl::export_transcript(const std::string& path) {
    // Include results already published but still queued for the transcript sink
    bus_->flush(transcript_sink_id_, std::chrono::milliseconds(1000));
    try {
        transcript_->export_to(path);
    } catch (const core::Error& e) {
        emit_error(TranscriptionError::Severity::WARNING, e.code(), "transcript export failed", e.what());
        throw;
    }
}

bool TranscriptionControllerImpl::speak(const std::string& text, bool wait) {
    if (!speech_) {
        throw core::Error(core::ErrorCode::SynthesisFailed, "no speech engine configured");
    }
    std::string to_say = text;
    if (to_say.empty()) {
        bus_->flush(transcript_sink_id_, std::chrono::milliseconds(1000));
        to_say = transcript_->text();
    }
    if (to_say.empty()) {
        core::log_info("[tts] nothing to speak");
        return false;
    }
    if (!wait) {
        speech_->speak_async(to_say);
        return true;
    }
    return speech_->speak(to_say);
}

void TranscriptionControllerImpl::stop_speaking() {
    if (speech_) {
        speech_->cancel();
    }
}

bool TranscriptionControllerImpl::is_speaking() const {
    return speech_ && speech_->is_speaking();
}

//==============================================================================
// TranscriptionController Public Interface (Forwarding to PIMPL)
//==============================================================================

TranscriptionController::TranscriptionController(std::shared_ptr<audio::IAudioSourceFactory> sources,
                                                 std::shared_ptr<asr::IModelBackend> models,
                                                 ControllerSettings settings,
                                                 std::shared_ptr<tts::SpeechSynthesizer> speech)
    : impl_(std::make_unique<TranscriptionControllerImpl>(std::move(sources), std::move(models),
                                                          std::move(settings), std::move(speech))) {
}

TranscriptionController::~TranscriptionController() = default;

std::vector<audio::AudioDeviceInfo> TranscriptionController::list_audio_devices() {
    return impl_->list_audio_devices();
}

void TranscriptionController::start_transcription(const TranscriptionConfig& config) {
    impl_->start(config);
}

void TranscriptionController::stop_transcription() {
    impl_->stop();
}

void TranscriptionController::reconfigure(const ReconfigureRequest& request) {
    impl_->reconfigure(request);
}

bool TranscriptionController::is_running() const {
    return impl_->get_state() != SessionState::Idle;
}

SessionState TranscriptionController::get_state() const {
    return impl_->get_state();
}

TranscriptionStatus TranscriptionController::get_status() const {
    return impl_->get_status();
}

ResultBus::SinkId TranscriptionController::subscribe_to_results(ResultCallback callback) {
    return impl_->add_sink(std::make_shared<CallbackSink>(std::move(callback)), "results-callback");
}

ResultBus::SinkId TranscriptionController::subscribe_to_events(EventCallback callback) {
    return impl_->add_sink(std::make_shared<CallbackSink>(ResultCallback{}, std::move(callback)), "events-callback");
}

void TranscriptionController::subscribe_to_errors(ErrorCallback callback) {
    impl_->subscribe_to_errors(std::move(callback));
}

ResultBus::SinkId TranscriptionController::add_sink(std::shared_ptr<ResultSink> sink, const std::string& name) {
    return impl_->add_sink(std::move(sink), name);
}

bool TranscriptionController::remove_sink(ResultBus::SinkId id) {
    return impl_->remove_sink(id);
}

bool TranscriptionController::flush_sinks(std::chrono::milliseconds timeout) {
    return impl_->flush_sinks(timeout);
}

std::string TranscriptionController::get_transcript() const {
    return impl_->transcript()->text();
}

std::vector<std::string> TranscriptionController::get_transcript_lines() const {
    return impl_->transcript()->lines();
}

void TranscriptionController::export_transcript(const std::string& path) {
    impl_->export_transcript(path);
}

void TranscriptionController::clear_transcript() {
    impl_->transcript()->clear();
}

bool TranscriptionController::speak(const std::string& text) {
    return impl_->speak(text, true);
}

bool TranscriptionController::speak_async(const std::string& text) {
    return impl_->speak(text, false);
}

void TranscriptionController::stop_speaking() {
    impl_->stop_speaking();
}

bool TranscriptionController::is_speaking() const {
    return impl_->is_speaking();
}

} // namespace app
