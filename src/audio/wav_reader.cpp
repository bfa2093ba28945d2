#include "audio/wav_reader.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct RiffHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
};

struct FmtChunk {
    uint16_t audioFormat; // 1=PCM
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
} // namespace

bool WavReader::load(const std::string& path) {
    source_path_.clear();
    samples_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    RiffHeader riff{};
    if (!f.read(reinterpret_cast<char*>(&riff), sizeof(riff))) return false;
    if (std::strncmp(riff.riff, "RIFF", 4) != 0 || std::strncmp(riff.wave, "WAVE", 4) != 0) return false;

    // Walk chunks: "fmt " must precede "data"; anything else (LIST, fact) is skipped
    FmtChunk fmt{};
    bool have_fmt = false;
    char chunkId[4];
    uint32_t chunkSize = 0;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) return false;
        if (std::strncmp(chunkId, "fmt ", 4) == 0) {
            if (chunkSize < sizeof(FmtChunk)) return false;
            if (!f.read(reinterpret_cast<char*>(&fmt), sizeof(fmt))) return false;
            f.seekg(chunkSize - sizeof(FmtChunk) + (chunkSize & 1), std::ios::cur);
            have_fmt = true;
            continue;
        }
        if (std::strncmp(chunkId, "data", 4) == 0) {
            if (!have_fmt) return false;
            if (fmt.audioFormat != 1 || fmt.bitsPerSample != 16 || fmt.numChannels == 0) {
                return false; // unsupported encoding
            }
            samples_.resize(chunkSize / sizeof(int16_t));
            if (!f.read(reinterpret_cast<char*>(samples_.data()), samples_.size() * sizeof(int16_t))) {
                // Truncated files are common (recorders killed mid-write); keep what was read
                samples_.resize(static_cast<size_t>(f.gcount()) / sizeof(int16_t));
            }
            sample_rate_ = static_cast<int>(fmt.sampleRate);
            channels_ = fmt.numChannels;
            bits_per_sample_ = fmt.bitsPerSample;
            const size_t frames = samples_.size() / channels_;
            duration_seconds_ = static_cast<double>(frames) / std::max<uint32_t>(1, fmt.sampleRate);
            source_path_ = path;
            return true;
        }
        f.seekg(chunkSize + (chunkSize & 1), std::ios::cur);
    }
    return false;
}

std::vector<int16_t> WavReader::read(size_t n) {
    std::vector<int16_t> out;
    if (cursor_ >= samples_.size()) return out;
    const size_t count = std::min(n, samples_.size() - cursor_);
    out.assign(samples_.begin() + cursor_, samples_.begin() + cursor_ + count);
    cursor_ += count;
    return out;
}

} // namespace audio
