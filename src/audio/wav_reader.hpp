#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// Minimal RIFF/WAVE reader for PCM16 files. Samples are kept as stored (no
// downmix, no resampling); callers check channels() and sample_rate().
class WavReader {
public:
    bool load(const std::string& path);

    // Copies up to n interleaved samples starting at the cursor; empty at end of data.
    std::vector<int16_t> read(size_t n);
    void rewind() { cursor_ = 0; }
    bool at_end() const { return cursor_ >= samples_.size(); }

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    const std::string& source_path() const { return source_path_; }

private:
    std::string source_path_;
    std::vector<int16_t> samples_;
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
