// Copyright (c) 2025 VAM Desktop Live Whisper

#include "app/result_bus.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace app {

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle:          return "Idle";
    case SessionState::Starting:      return "Starting";
    case SessionState::Running:       return "Running";
    case SessionState::Reconfiguring: return "Reconfiguring";
    case SessionState::Stopping:      return "Stopping";
    }
    return "Unknown";
}

//==============================================================================
// CallbackSink
//==============================================================================

CallbackSink::CallbackSink(ResultCallback on_result, EventCallback on_event)
    : on_result_(std::move(on_result)), on_event_(std::move(on_event)) {}

void CallbackSink::on_result(const asr::TranscriptionResult& result) {
    if (on_result_) on_result_(result);
}

void CallbackSink::on_event(const SessionEvent& event) {
    if (on_event_) on_event_(event);
}

//==============================================================================
// ResultBus
//==============================================================================

ResultBus::ResultBus(FailureHandler on_failure) : on_failure_(std::move(on_failure)) {}

ResultBus::~ResultBus() {
    clear();
}

void ResultBus::clear() {
    std::vector<std::shared_ptr<Dispatcher>> all;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        all.swap(dispatchers_);
    }
    for (auto& d : all) {
        stop_dispatcher(d);
    }
}

ResultBus::SinkId ResultBus::add_sink(std::shared_ptr<ResultSink> sink, const std::string& name) {
    auto d = std::make_shared<Dispatcher>();
    d->name = name;
    d->sink = std::move(sink);

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    d->id = next_id_++;
    d->thread = std::thread([this, d] { run(*d); });
    {
        std::lock_guard<std::mutex> dlock(d->mutex);
        d->thread_id = d->thread.get_id();
    }
    dispatchers_.push_back(d);
    core::log_debug("[bus] sink " + std::to_string(d->id) + " '" + name + "' registered");
    return d->id;
}

bool ResultBus::remove_sink(SinkId id) {
    std::shared_ptr<Dispatcher> d;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        auto it = std::find_if(dispatchers_.begin(), dispatchers_.end(),
                               [id](const std::shared_ptr<Dispatcher>& x) { return x->id == id; });
        if (it == dispatchers_.end()) return false;
        d = *it;
        dispatchers_.erase(it);
    }
    stop_dispatcher(d);
    return true;
}

void ResultBus::stop_dispatcher(const std::shared_ptr<Dispatcher>& d) {
    bool self = false;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->stopping = true;
        d->queue.clear();
        self = d->thread_id == std::this_thread::get_id();
    }
    d->cv.notify_all();
    if (!d->thread.joinable()) return;
    if (self) {
        // A sink removing itself from inside its own callback
        d->thread.detach();
    } else {
        d->thread.join();
    }
}

void ResultBus::publish(const asr::TranscriptionResult& result) {
    enqueue(Item(result));
}

void ResultBus::publish(const SessionEvent& event) {
    enqueue(Item(event));
}

void ResultBus::enqueue(const Item& item) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& d : dispatchers_) {
        {
            std::lock_guard<std::mutex> dl(d->mutex);
            if (d->stopping) continue;
            d->queue.push_back(item);
        }
        d->cv.notify_all();
    }
}

void ResultBus::run(Dispatcher& d) {
    for (;;) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(d.mutex);
            d.cv.wait(lock, [&d] { return d.stopping || !d.queue.empty(); });
            if (d.stopping) break;
            item = std::move(d.queue.front());
            d.queue.pop_front();
            d.busy = true;
        }

        std::string failure;
        try {
            if (const auto* r = std::get_if<asr::TranscriptionResult>(&item)) {
                d.sink->on_result(*r);
            } else {
                d.sink->on_event(std::get<SessionEvent>(item));
            }
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "non-standard exception";
        }

        if (!failure.empty()) {
            {
                std::lock_guard<std::mutex> lock(d.mutex);
                ++d.failures;
            }
            core::log_error("[bus] sink '" + d.name + "' failed: " + failure);
            if (on_failure_) {
                on_failure_(d.id, d.name, failure);
            }
        }

        {
            std::lock_guard<std::mutex> lock(d.mutex);
            d.busy = false;
        }
        d.cv.notify_all();
    }
}

std::shared_ptr<ResultBus::Dispatcher> ResultBus::find(SinkId id) const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& d : dispatchers_) {
        if (d->id == id) return d;
    }
    return nullptr;
}

bool ResultBus::flush(SinkId id, std::chrono::milliseconds timeout) {
    auto d = find(id);
    if (!d) return false;
    std::unique_lock<std::mutex> lock(d->mutex);
    if (d->thread_id == std::this_thread::get_id()) {
        return d->queue.empty();   // flushing from inside the sink itself
    }
    return d->cv.wait_for(lock, timeout, [&d] { return d->stopping || (d->queue.empty() && !d->busy); });
}

bool ResultBus::flush_all(std::chrono::milliseconds timeout) {
    std::vector<SinkId> ids;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (const auto& d : dispatchers_) ids.push_back(d->id);
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool ok = true;
    for (SinkId id : ids) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        ok = flush(id, std::max(left, std::chrono::milliseconds(0))) && ok;
    }
    return ok;
}

size_t ResultBus::sink_count() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return dispatchers_.size();
}

size_t ResultBus::failure_count(SinkId id) const {
    auto d = find(id);
    if (!d) return 0;
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->failures;
}

} // namespace app
