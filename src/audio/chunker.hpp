#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace audio {

/// Fixed-length segment of captured audio. Immutable once emitted.
struct AudioChunk {
    uint64_t sequence = 0;                                  ///< 0, 1, 2, ... gapless within a session
    int64_t timestamp_ms = 0;                               ///< Capture time of the first sample, ms from session start
    int sample_rate = 0;
    std::shared_ptr<const std::vector<int16_t>> samples;    ///< Exactly the chunk's sample count

    size_t size() const { return samples ? samples->size() : 0; }
    const int16_t* data() const { return samples ? samples->data() : nullptr; }
};

/**
 * @brief Accumulates frames into chunks of chunk_seconds * sample_rate samples
 *
 * Chunk boundaries are hard cuts (no overlap). Samples past a boundary start the
 * next chunk. A new chunk length only applies from the next chunk boundary, so
 * the chunk being filled is never truncated. Not thread-safe.
 */
class Chunker {
public:
    Chunker(int sample_rate, double chunk_seconds);

    /// Append a frame; returns a chunk if this frame completed one.
    std::optional<AudioChunk> feed(const int16_t* samples, size_t count);
    std::optional<AudioChunk> feed(const std::vector<int16_t>& frame) {
        return feed(frame.data(), frame.size());
    }

    /// Further complete chunks, when one frame spanned several chunk boundaries.
    std::optional<AudioChunk> take_ready();

    /// Request a new chunk length; applied when the current chunk is emitted.
    void set_chunk_seconds(double chunk_seconds);

    size_t chunk_samples() const { return chunk_samples_; }
    /// Samples received but not yet emitted, including those held for later chunks
    size_t pending_samples() const { return buffer_.size() + overflow_.size(); }
    uint64_t next_sequence() const { return next_sequence_; }
    int sample_rate() const { return sample_rate_; }

    static size_t samples_for(double chunk_seconds, int sample_rate);

private:
    std::optional<AudioChunk> emit_if_full();

    const int sample_rate_;
    size_t chunk_samples_;
    size_t requested_samples_;
    std::vector<int16_t> buffer_;      // current chunk being filled
    std::deque<int16_t> overflow_;     // samples beyond the current chunk boundary
    uint64_t next_sequence_ = 0;
    uint64_t samples_emitted_ = 0;     // drives timestamps
};

} // namespace audio
