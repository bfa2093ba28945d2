// Copyright (c) 2025 VAM Desktop Live Whisper
// ResultBus - ordered fan-out of transcription results to independent sinks

#pragma once

#include "asr/transcription_engine.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace app {

/// Lifecycle of the pipeline controller
enum class SessionState {
    Idle,           ///< No session
    Starting,       ///< Loading model / opening device
    Running,        ///< Capturing and transcribing
    Reconfiguring,  ///< Running, switching preset or device
    Stopping        ///< Tearing down
};

const char* to_string(SessionState state);

/// Non-result events delivered through the same ordered channel as results
struct SessionEvent {
    enum class Kind {
        StateChanged,   ///< Controller state changed (state)
        Overrun,        ///< Chunk dropped before inference (sequence)
        ChunkFailed,    ///< Inference failed for a chunk (sequence)
        Terminated      ///< Session ended on its own because of a failure (code, message)
    };

    Kind kind = Kind::StateChanged;
    SessionState state = SessionState::Idle;
    core::ErrorCode code = core::ErrorCode::InvalidState;
    uint64_t session_id = 0;
    uint64_t sequence = 0;
    std::string message;
};

/// Consumer of the ordered result stream. Called from the sink's own dispatcher
/// thread, so a slow sink only delays itself. Exceptions are caught and reported.
class ResultSink {
public:
    virtual ~ResultSink() = default;
    virtual void on_result(const asr::TranscriptionResult& result) = 0;
    virtual void on_event(const SessionEvent& event) { (void)event; }
};

using ResultCallback = std::function<void(const asr::TranscriptionResult&)>;
using EventCallback = std::function<void(const SessionEvent&)>;

/// Adapts std::function subscriptions to ResultSink
class CallbackSink : public ResultSink {
public:
    CallbackSink(ResultCallback on_result, EventCallback on_event = {});
    void on_result(const asr::TranscriptionResult& result) override;
    void on_event(const SessionEvent& event) override;

private:
    ResultCallback on_result_;
    EventCallback on_event_;
};

/**
 * @brief Fan-out of results and events to every registered sink
 *
 * publish() never blocks on a sink: each sink owns a FIFO and a dispatcher thread.
 * Items reach every sink in publish() order. A sink that throws is reported through
 * the failure handler (SinkFailure) and keeps receiving subsequent items.
 */
class ResultBus {
public:
    using SinkId = uint64_t;
    using FailureHandler = std::function<void(SinkId id, const std::string& sink_name, const std::string& cause)>;

    explicit ResultBus(FailureHandler on_failure = {});
    ~ResultBus();

    ResultBus(const ResultBus&) = delete;
    ResultBus& operator=(const ResultBus&) = delete;

    SinkId add_sink(std::shared_ptr<ResultSink> sink, const std::string& name);

    /// Stops the sink's dispatcher; items still queued for it are discarded.
    bool remove_sink(SinkId id);

    /// Removes every sink (no further deliveries or failure reports).
    void clear();

    void publish(const asr::TranscriptionResult& result);
    void publish(const SessionEvent& event);

    /// Wait until the sink has handled everything published so far.
    bool flush(SinkId id, std::chrono::milliseconds timeout);
    bool flush_all(std::chrono::milliseconds timeout);

    size_t sink_count() const;
    size_t failure_count(SinkId id) const;

private:
    using Item = std::variant<asr::TranscriptionResult, SessionEvent>;

    struct Dispatcher {
        SinkId id = 0;
        std::string name;
        std::shared_ptr<ResultSink> sink;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Item> queue;
        bool busy = false;
        bool stopping = false;
        size_t failures = 0;
        std::thread thread;          // joined or detached by stop_dispatcher() only
        std::thread::id thread_id;   // guarded by mutex
    };

    void enqueue(const Item& item);
    void run(Dispatcher& d);
    void stop_dispatcher(const std::shared_ptr<Dispatcher>& d);
    std::shared_ptr<Dispatcher> find(SinkId id) const;

    FailureHandler on_failure_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<Dispatcher>> dispatchers_;
    SinkId next_id_ = 1;
};

} // namespace app
