// Copyright (c) 2025 VAM Desktop Live Whisper

#include "app/session.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <system_error>

namespace app {

namespace {
int clamp_limit(int limit, int max_workers) {
    return std::clamp(limit, 1, std::max(1, max_workers));
}
}

Session::Session(uint64_t id,
                 SessionConfig config,
                 std::shared_ptr<asr::TranscriptionEngine> engine,
                 std::shared_ptr<ResultBus> bus,
                 FailureHandler on_failure)
    : id_(id)
    , config_(std::move(config))
    , engine_(std::move(engine))
    , bus_(std::move(bus))
    , on_failure_(std::move(on_failure))
    , device_id_(config_.device_id)
    , chunker_(config_.sample_rate, config_.chunk_seconds)
    , chunk_seconds_(config_.chunk_seconds)
    , queue_(config_.queue_depth)
    , worker_limit_(clamp_limit(config_.worker_limit, config_.max_workers)) {
    const int pool = std::max(1, config_.max_workers);
    for (int i = 0; i < pool; ++i) {
        slots_.push_back(std::make_unique<WorkerSlot>());
    }
}

Session::~Session() {
    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
}

int64_t Session::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

//==============================================================================
// Lifecycle
//==============================================================================

void Session::start(std::unique_ptr<audio::IAudioSource> source) {
    if (!source || !source->is_open()) {
        throw core::Error(core::ErrorCode::InvalidState, "session needs an opened audio source");
    }
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        source_ = std::move(source);
    }
    started_at_ = std::chrono::steady_clock::now();

    auto self = shared_from_this();
    std::lock_guard<std::mutex> lock(threads_mutex_);
    try {
        ++live_threads_;
        threads_.emplace_back([self] { self->capture_loop(); self->thread_exit(); });
        for (size_t i = 0; i < slots_.size(); ++i) {
            ++live_threads_;
            threads_.emplace_back([self, i] { self->worker_loop(i); self->thread_exit(); });
        }
        ++live_threads_;
        threads_.emplace_back([self] { self->watchdog_loop(); self->thread_exit(); });
    } catch (const std::system_error& e) {
        // The failed emplace never started its thread
        --live_threads_;
        core::log_error("[session " + std::to_string(id_) + "] cannot spawn threads: " + e.what());
        cancel_.store(true);
        queue_.stop();
        slot_cv_.notify_all();
        watchdog_cv_.notify_all();
        {
            std::lock_guard<std::mutex> src_lock(source_mutex_);
            source_->close();
        }
        throw;
    }
    core::log_info("[session " + std::to_string(id_) + "] started on '" + config_.device_id + "' with " +
                   std::to_string(slots_.size()) + " inference thread(s), chunk " +
                   std::to_string(config_.chunk_seconds) + " s");
}

void Session::stop() {
    if (cancel_.exchange(true)) {
        return;
    }
    core::log_info("[session " + std::to_string(id_) + "] stopping");

    queue_.stop();
    const size_t discarded = queue_.drain().size();
    { std::lock_guard<std::mutex> lock(slot_mutex_); }
    slot_cv_.notify_all();
    { std::lock_guard<std::mutex> lock(threads_mutex_); }
    watchdog_cv_.notify_all();

    // Wakes a capture thread blocked in read_frame()
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (source_) source_->close();
        if (pending_source_) pending_source_->close();
    }
    size_t pending_results = 0;
    {
        std::lock_guard<std::mutex> lock(reorder_mutex_);
        pending_results = reorder_.pending();
        reorder_.clear();
    }

    std::unique_lock<std::mutex> lock(threads_mutex_);
    const bool finished = threads_cv_.wait_for(lock, config_.watchdog, [this] { return live_threads_ == 0; });
    std::vector<std::thread> threads;
    threads.swap(threads_);
    lock.unlock();

    for (auto& t : threads) {
        if (!t.joinable()) continue;
        if (finished && t.get_id() != std::this_thread::get_id()) {
            t.join();
        } else {
            t.detach();
        }
    }
    if (!finished) {
        core::log_warn("[session " + std::to_string(id_) + "] threads still busy after " +
                       std::to_string(config_.watchdog.count()) + " ms; detached");
    }
    core::log_info("[session " + std::to_string(id_) + "] stopped (" + std::to_string(discarded) +
                   " queued chunk(s) and " + std::to_string(pending_results) + " pending result(s) discarded)");
}

void Session::thread_exit() {
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        --live_threads_;
    }
    threads_cv_.notify_all();
}

//==============================================================================
// Reconfiguration
//==============================================================================

void Session::set_chunk_seconds(double chunk_seconds) {
    audio::Chunker::samples_for(chunk_seconds, config_.sample_rate);   // validates
    chunk_seconds_.store(chunk_seconds);
    chunk_change_pending_.store(true);
    core::log_info("[session " + std::to_string(id_) + "] chunk length -> " + std::to_string(chunk_seconds) +
                   " s from the next chunk boundary");
}

void Session::switch_source(std::unique_ptr<audio::IAudioSource> source, const std::string& device_id) {
    std::unique_ptr<audio::IAudioSource> replaced;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (cancel_.load()) {
            replaced = std::move(source);
        } else {
            replaced = std::move(pending_source_);
            pending_source_ = std::move(source);
            pending_device_id_ = device_id;
            // Wakes a read blocked on the old device; the capture thread then swaps
            if (source_) source_->close();
        }
    }
    if (replaced) {
        replaced->close();
    }
    if (cancel_.load()) {
        throw core::Error(core::ErrorCode::InvalidState, "session is stopping");
    }
}

audio::IAudioSource* Session::swap_in_pending_source() {
    std::unique_ptr<audio::IAudioSource> old;
    audio::IAudioSource* current = nullptr;
    std::string device;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (pending_source_) {
            old = std::move(source_);
            source_ = std::move(pending_source_);
            device_id_ = pending_device_id_;
            device = device_id_;
        }
        current = source_.get();
    }
    if (old) {
        old->close();
        core::log_info("[session " + std::to_string(id_) + "] capture switched to '" + device + "'");
    }
    return current;
}

void Session::set_worker_limit(int limit) {
    worker_limit_.store(clamp_limit(limit, config_.max_workers));
    { std::lock_guard<std::mutex> lock(slot_mutex_); }
    slot_cv_.notify_all();
}

//==============================================================================
// Capture thread
//==============================================================================

void Session::capture_loop() {
    try {
        while (!cancel_.load()) {
            audio::IAudioSource* source = swap_in_pending_source();
            if (!source) break;

            std::vector<int16_t> frame;
            read_since_ms_.store(now_ms());
            try {
                frame = source->read_frame();
            } catch (const core::Error& e) {
                read_since_ms_.store(0);
                bool replacement_waiting = false;
                {
                    std::lock_guard<std::mutex> lock(source_mutex_);
                    replacement_waiting = pending_source_ != nullptr;
                }
                if (e.code() == core::ErrorCode::SourceClosed && replacement_waiting && !cancel_.load()) {
                    continue;
                }
                throw;
            }
            read_since_ms_.store(0);
            if (cancel_.load()) break;

            if (chunk_change_pending_.exchange(false)) {
                chunker_.set_chunk_seconds(chunk_seconds_.load());
            }
            auto chunk = chunker_.feed(frame);
            while (chunk) {
                enqueue(std::move(*chunk));
                chunk = chunker_.take_ready();
            }
        }
    } catch (const core::Error& e) {
        if (!cancel_.load()) {
            fail(e.code(), e.what());
        }
    } catch (const std::exception& e) {
        if (!cancel_.load()) {
            fail(core::ErrorCode::DeviceUnavailable, e.what());
        }
    }
    read_since_ms_.store(0);
    core::log_debug("[session " + std::to_string(id_) + "] capture thread exit");
}

void Session::enqueue(audio::AudioChunk&& chunk) {
    ++chunks_captured_;
    auto evicted = queue_.push(std::move(chunk));
    if (!evicted || cancel_.load()) {
        return;   // a stopped queue hands the chunk back; nothing to report
    }
    ++chunks_dropped_;
    skip(evicted->sequence, SessionEvent::Kind::Overrun, core::ErrorCode::Overrun,
         "inference fell behind, chunk " + std::to_string(evicted->sequence) + " dropped");
}

//==============================================================================
// Inference pool
//==============================================================================

void Session::worker_loop(size_t index) {
    WorkerSlot& slot = *slots_[index];
    auto release = [this] {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            --in_flight_;
        }
        slot_cv_.notify_all();
    };

    while (true) {
        {
            std::unique_lock<std::mutex> lock(slot_mutex_);
            slot_cv_.wait(lock, [this] { return cancel_.load() || in_flight_ < worker_limit_.load(); });
            if (cancel_.load()) break;
            ++in_flight_;
        }

        audio::AudioChunk chunk;
        if (!queue_.pop(chunk) || cancel_.load()) {
            release();
            break;
        }

        // New claims always use the newest handle; a reload never disturbs this one
        auto handle = engine_->current();
        slot.busy_since_ms.store(now_ms());
        try {
            if (!handle) {
                throw core::Error(core::ErrorCode::ModelLoadError, "no model loaded");
            }
            asr::TranscriptionResult result = engine_->transcribe(*handle, chunk);
            slot.busy_since_ms.store(0);
            deliver(std::move(result));
        } catch (const std::exception& e) {
            slot.busy_since_ms.store(0);
            ++inference_failures_;
            skip(chunk.sequence, SessionEvent::Kind::ChunkFailed, core::ErrorCode::InferenceFailed,
                 "chunk " + std::to_string(chunk.sequence) + ": " + e.what());
        }
        release();
    }
    core::log_debug("[session " + std::to_string(id_) + "] worker " + std::to_string(index) + " exit");
}

void Session::deliver(asr::TranscriptionResult&& result) {
    std::lock_guard<std::mutex> lock(reorder_mutex_);
    if (cancel_.load()) return;
    const uint64_t sequence = result.sequence;
    for (auto& ready : reorder_.insert(sequence, std::move(result))) {
        bus_->publish(ready);
        ++results_delivered_;
    }
}

void Session::skip(uint64_t sequence, SessionEvent::Kind kind, core::ErrorCode code, const std::string& message) {
    core::log_warn("[session " + std::to_string(id_) + "] " + message);

    SessionEvent event;
    event.kind = kind;
    event.state = SessionState::Running;
    event.code = code;
    event.session_id = id_;
    event.sequence = sequence;
    event.message = message;

    std::lock_guard<std::mutex> lock(reorder_mutex_);
    if (cancel_.load()) return;
    bus_->publish(event);
    for (auto& ready : reorder_.skip(sequence)) {
        bus_->publish(ready);
        ++results_delivered_;
    }
}

//==============================================================================
// Watchdog
//==============================================================================

void Session::watchdog_loop() {
    const int64_t bound = config_.watchdog.count();
    const auto period = std::chrono::milliseconds(std::clamp<int64_t>(bound / 4, 5, 200));

    std::unique_lock<std::mutex> lock(threads_mutex_);
    while (!cancel_.load()) {
        watchdog_cv_.wait_for(lock, period, [this] { return cancel_.load(); });
        if (cancel_.load()) break;

        const int64_t now = now_ms();
        std::string stall;
        const int64_t read_since = read_since_ms_.load();
        if (read_since != 0 && now - read_since > bound) {
            stall = "no audio frame from '" + device_id() + "' for " + std::to_string(now - read_since) + " ms";
        }
        for (const auto& slot : slots_) {
            const int64_t busy_since = slot->busy_since_ms.load();
            if (stall.empty() && busy_since != 0 && now - busy_since > bound) {
                stall = "inference running for " + std::to_string(now - busy_since) + " ms";
            }
        }
        if (!stall.empty()) {
            lock.unlock();
            fail(core::ErrorCode::StallTimeout, stall);
            return;
        }
    }
}

//==============================================================================
// Failure / status
//==============================================================================

void Session::fail(core::ErrorCode code, const std::string& message) {
    if (cancel_.load() || failed_.exchange(true)) {
        return;
    }
    core::log_error("[session " + std::to_string(id_) + "] " + core::to_string(code) + ": " + message);
    if (!on_failure_) {
        return;
    }
    try {
        on_failure_(shared_from_this(), code, message);
    } catch (const std::exception& e) {
        core::log_error("[session " + std::to_string(id_) + "] failure handler threw: " + e.what());
    }
}

std::string Session::device_id() const {
    std::lock_guard<std::mutex> lock(source_mutex_);
    return device_id_;
}

SessionStats Session::stats() const {
    SessionStats s;
    s.chunks_captured = chunks_captured_.load();
    s.results_delivered = results_delivered_.load();
    s.chunks_dropped = chunks_dropped_.load();
    s.inference_failures = inference_failures_.load();
    s.chunks_queued = queue_.size();
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        s.inferences_in_flight = in_flight_;
    }
    s.worker_limit = worker_limit_.load();
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        s.device_id = device_id_;
        s.source_dropped_frames = source_ ? source_->dropped_frames() : 0;
    }
    s.chunk_seconds = chunk_seconds_.load();
    if (started_at_.time_since_epoch().count() != 0) {
        s.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_).count();
    }
    return s;
}

} // namespace app
