// Copyright (c) 2025 VAM Desktop Live Whisper
// Session - one running capture -> chunk -> inference -> ordered delivery pipeline

#pragma once

#include "app/result_bus.hpp"
#include "asr/transcription_engine.hpp"
#include "audio/audio_source.hpp"
#include "audio/chunker.hpp"
#include "core/bounded_queue.hpp"
#include "core/reorder_buffer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace app {

/// Parameters fixed when a session starts (chunk length, device and worker
/// limit can still change through the setters below)
struct SessionConfig {
    std::string device_id = "default";
    double chunk_seconds = 3.0;
    int sample_rate = 16000;
    size_t frame_size = 1024;
    size_t queue_depth = 8;                          ///< Chunks waiting for a worker
    std::chrono::milliseconds watchdog{10000};       ///< Max read_frame / transcribe duration
    int max_workers = 2;                             ///< Threads in the inference pool
    int worker_limit = 2;                            ///< Concurrent inferences allowed (<= max_workers)
};

/// Counters exposed through TranscriptionController::get_status()
struct SessionStats {
    uint64_t chunks_captured = 0;
    uint64_t results_delivered = 0;
    uint64_t chunks_dropped = 0;       ///< Evicted from the chunk queue (overrun)
    uint64_t inference_failures = 0;
    size_t chunks_queued = 0;
    int inferences_in_flight = 0;
    int worker_limit = 0;
    size_t source_dropped_frames = 0;  ///< Lost inside the device driver
    std::string device_id;
    double chunk_seconds = 0.0;
    int64_t elapsed_ms = 0;
};

/**
 * @brief A single running pipeline
 *
 * Threads:
 * - capture: the only caller of IAudioSource::read_frame(), feeds the Chunker and
 *   pushes chunks into a bounded queue (never blocks on inference)
 * - inference pool: max_workers threads, at most worker_limit transcribing at once;
 *   each claim snapshots the engine's current model handle
 * - watchdog: fails the session with StallTimeout when a read or a transcribe call
 *   exceeds the watchdog bound
 *
 * Results pass through a reorder buffer and reach the bus in sequence order.
 * Dropped chunks (queue overrun) and failed chunks are skipped in the reorder
 * buffer and reported as events.
 *
 * Every thread holds a shared_ptr to the session, so stop() can give up on a
 * stuck thread after the watchdog bound and detach it safely.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    /// Invoked once, from a session thread, when the session cannot continue.
    /// The handler must not call stop() on the calling thread.
    using FailureHandler = std::function<void(const std::shared_ptr<Session>& session,
                                              core::ErrorCode code,
                                              const std::string& message)>;

    Session(uint64_t id,
            SessionConfig config,
            std::shared_ptr<asr::TranscriptionEngine> engine,
            std::shared_ptr<ResultBus> bus,
            FailureHandler on_failure);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Takes an already opened source and spawns the threads.
    void start(std::unique_ptr<audio::IAudioSource> source);

    /// Cancels, discards queued chunks, closes the source, then waits for the
    /// threads at most the watchdog bound. Idempotent.
    void stop();

    /// Applied by the capture thread at the next chunk boundary.
    /// Throws core::Error(InvalidConfig) for non-positive values.
    void set_chunk_seconds(double chunk_seconds);

    /// Hands an opened source to the capture thread and closes the current one,
    /// so the capture thread swaps the new one in before its next read.
    void switch_source(std::unique_ptr<audio::IAudioSource> source, const std::string& device_id);

    /// Clamped to [1, max_workers].
    void set_worker_limit(int limit);

    uint64_t id() const { return id_; }
    bool stopped() const { return cancel_.load(); }
    bool failed() const { return failed_.load(); }
    std::string device_id() const;
    double chunk_seconds() const { return chunk_seconds_.load(); }
    SessionStats stats() const;

private:
    struct WorkerSlot {
        std::atomic<int64_t> busy_since_ms{0};   // 0 while idle
    };

    void capture_loop();
    void worker_loop(size_t index);
    void watchdog_loop();
    void thread_exit();

    void enqueue(audio::AudioChunk&& chunk);
    void deliver(asr::TranscriptionResult&& result);
    void skip(uint64_t sequence, SessionEvent::Kind kind, core::ErrorCode code, const std::string& message);
    void fail(core::ErrorCode code, const std::string& message);

    audio::IAudioSource* swap_in_pending_source();

    static int64_t now_ms();

    const uint64_t id_;
    const SessionConfig config_;
    std::shared_ptr<asr::TranscriptionEngine> engine_;
    std::shared_ptr<ResultBus> bus_;
    FailureHandler on_failure_;

    std::atomic<bool> cancel_{false};
    std::atomic<bool> failed_{false};
    std::chrono::steady_clock::time_point started_at_;

    // Source and its pending replacement
    mutable std::mutex source_mutex_;
    std::unique_ptr<audio::IAudioSource> source_;
    std::unique_ptr<audio::IAudioSource> pending_source_;
    std::string device_id_;
    std::string pending_device_id_;
    std::atomic<int64_t> read_since_ms_{0};      // 0 while not inside read_frame()

    // Capture thread state
    audio::Chunker chunker_;
    std::atomic<double> chunk_seconds_;
    std::atomic<bool> chunk_change_pending_{false};

    // Hand-off to the inference pool
    core::BoundedQueue<audio::AudioChunk> queue_;
    mutable std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    int in_flight_ = 0;
    std::atomic<int> worker_limit_;
    std::vector<std::unique_ptr<WorkerSlot>> slots_;

    // Ordered delivery
    std::mutex reorder_mutex_;
    core::ReorderBuffer<asr::TranscriptionResult> reorder_;

    // Counters
    std::atomic<uint64_t> chunks_captured_{0};
    std::atomic<uint64_t> results_delivered_{0};
    std::atomic<uint64_t> chunks_dropped_{0};
    std::atomic<uint64_t> inference_failures_{0};

    // Thread bookkeeping
    std::mutex threads_mutex_;
    std::condition_variable threads_cv_;
    std::vector<std::thread> threads_;
    int live_threads_ = 0;
    std::condition_variable watchdog_cv_;
};

} // namespace app
