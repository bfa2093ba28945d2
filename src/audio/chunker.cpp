#include "audio/chunker.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

size_t Chunker::samples_for(double chunk_seconds, int sample_rate) {
    if (!(chunk_seconds > 0.0) || sample_rate <= 0) {
        throw core::Error(core::ErrorCode::InvalidConfig, "chunk length and sample rate must be positive");
    }
    const long long n = std::llround(chunk_seconds * static_cast<double>(sample_rate));
    return static_cast<size_t>(std::max(1LL, n));
}

Chunker::Chunker(int sample_rate, double chunk_seconds)
    : sample_rate_(sample_rate)
    , chunk_samples_(samples_for(chunk_seconds, sample_rate))
    , requested_samples_(chunk_samples_) {
    buffer_.reserve(chunk_samples_);
}

void Chunker::set_chunk_seconds(double chunk_seconds) {
    requested_samples_ = samples_for(chunk_seconds, sample_rate_);
}

std::optional<AudioChunk> Chunker::feed(const int16_t* samples, size_t count) {
    if (!overflow_.empty()) {
        // Earlier chunks are still waiting in take_ready(); keep arrival order
        overflow_.insert(overflow_.end(), samples, samples + count);
        return take_ready();
    }
    const size_t room = chunk_samples_ - buffer_.size();
    const size_t n = std::min(room, count);
    buffer_.insert(buffer_.end(), samples, samples + n);
    if (count > n) {
        overflow_.insert(overflow_.end(), samples + n, samples + count);
    }
    return emit_if_full();
}

std::optional<AudioChunk> Chunker::take_ready() {
    // Move overflow into the (new) current chunk
    const size_t room = chunk_samples_ - buffer_.size();
    const size_t n = std::min(room, overflow_.size());
    buffer_.insert(buffer_.end(), overflow_.begin(), overflow_.begin() + n);
    overflow_.erase(overflow_.begin(), overflow_.begin() + n);
    return emit_if_full();
}

std::optional<AudioChunk> Chunker::emit_if_full() {
    if (buffer_.size() < chunk_samples_) {
        return std::nullopt;
    }
    AudioChunk chunk;
    chunk.sequence = next_sequence_++;
    chunk.timestamp_ms = static_cast<int64_t>(samples_emitted_ * 1000 / static_cast<uint64_t>(sample_rate_));
    chunk.sample_rate = sample_rate_;
    samples_emitted_ += buffer_.size();
    chunk.samples = std::make_shared<const std::vector<int16_t>>(std::move(buffer_));

    // Chunk boundary: a pending length change takes effect here
    chunk_samples_ = requested_samples_;
    buffer_ = std::vector<int16_t>();
    buffer_.reserve(chunk_samples_);
    return chunk;
}

} // namespace audio
