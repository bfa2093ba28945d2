#include "app/transcript_sink.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace app {

namespace fs = std::filesystem;

void write_text_atomically(const std::string& path, const std::string& content) {
    static std::atomic<unsigned> counter{0};
    if (path.empty()) {
        throw core::Error(core::ErrorCode::IOError, "empty output path");
    }
    const fs::path target(path);
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tmp = target;
    tmp += ".tmp-" + std::to_string(stamp) + "-" + std::to_string(counter++);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw core::Error(core::ErrorCode::IOError, "cannot create " + tmp.string());
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw core::Error(core::ErrorCode::IOError, "write failed for " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw core::Error(core::ErrorCode::IOError, "cannot replace " + path + ": " + ec.message());
    }
}

TranscriptSink::TranscriptSink(std::string autosave_path)
    : autosave_path_(std::move(autosave_path)) {}

void TranscriptSink::on_result(const asr::TranscriptionResult& result) {
    if (result.text.empty()) return;
    std::string snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(result.text);
        if (autosave_path_.empty()) return;
        snapshot = render_locked();
    }
    // Throws IOError on failure; the bus reports it as a SinkFailure
    write_text_atomically(autosave_path_, snapshot);
}

std::vector<std::string> TranscriptSink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::string TranscriptSink::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& l : lines_) {
        if (!out.empty()) out.push_back(' ');
        out += l;
    }
    return out;
}

std::string TranscriptSink::render_locked() const {
    std::string out;
    for (const auto& l : lines_) {
        out += l;
        out.push_back('\n');
    }
    return out;
}

void TranscriptSink::export_to(const std::string& path) const {
    std::string snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = render_locked();
    }
    write_text_atomically(path, snapshot);
    core::log_info("[transcript] saved " + std::to_string(size()) + " line(s) to " + path);
}

void TranscriptSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

size_t TranscriptSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

} // namespace app
