#pragma once

#include "app/result_bus.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace app {

/// Writes content to path via a temp file in the same directory and a rename,
/// so readers never observe a partial file. Throws core::Error(IOError).
void write_text_atomically(const std::string& path, const std::string& content);

/**
 * @brief Append-only transcript built from the ordered result stream
 *
 * Empty results (silence) are not stored. With an autosave path the whole
 * transcript is rewritten atomically after every new line.
 */
class TranscriptSink : public ResultSink {
public:
    explicit TranscriptSink(std::string autosave_path = "");

    void on_result(const asr::TranscriptionResult& result) override;

    /// One line per non-empty result, in delivery order
    std::vector<std::string> lines() const;

    /// Lines joined with single spaces (display form)
    std::string text() const;

    /// Throws core::Error(IOError); the transcript itself is unchanged either way.
    void export_to(const std::string& path) const;

    void clear();
    size_t size() const;

private:
    std::string render_locked() const;

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::string autosave_path_;
};

} // namespace app
