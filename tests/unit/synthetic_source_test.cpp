#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include "audio/synthetic_source.hpp"
#include "core/errors.hpp"

using namespace std::chrono_literals;
namespace fs = std::filesystem;

static void write_wav(const fs::path& p, int rate, int channels, const std::vector<int16_t>& samples) {
    std::ofstream out(p, std::ios::binary);
    auto u32 = [&](uint32_t v) { out.write(reinterpret_cast<const char*>(&v), 4); };
    auto u16 = [&](uint16_t v) { out.write(reinterpret_cast<const char*>(&v), 2); };
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * 2);
    out.write("RIFF", 4); u32(36 + data_bytes); out.write("WAVE", 4);
    out.write("fmt ", 4); u32(16); u16(1); u16(static_cast<uint16_t>(channels)); u32(static_cast<uint32_t>(rate));
    u32(static_cast<uint32_t>(rate * channels * 2)); u16(static_cast<uint16_t>(channels * 2)); u16(16);
    out.write("data", 4); u32(data_bytes);
    out.write(reinterpret_cast<const char*>(samples.data()), data_bytes);
}

static core::ErrorCode open_error(audio::SyntheticSource& s, const std::string& id, int rate) {
    try {
        s.open(id, rate, 160);
    } catch (const core::Error& e) {
        return e.code();
    }
    return core::ErrorCode::InvalidState;
}

int main() {
    // Silence and tone, not paced
    audio::SyntheticSource silence(false);
    silence.open("synthetic:silence", 16000, 160);
    auto f = silence.read_frame();
    assert(f.size() == 160);
    for (auto s : f) assert(s == 0);
    silence.close();
    silence.close();   // idempotent
    bool closed = false;
    try {
        silence.read_frame();
    } catch (const core::Error& e) {
        closed = e.code() == core::ErrorCode::SourceClosed;
    }
    assert(closed);

    audio::SyntheticSource tone(false);
    tone.open("synthetic:tone", 16000, 160);
    auto t = tone.read_frame();
    bool nonzero = false;
    for (auto s : t) nonzero = nonzero || s != 0;
    assert(nonzero);

    // close() wakes a paced read_frame() blocked on another thread
    audio::SyntheticSource paced(true);
    paced.open("synthetic:silence", 100, 1000);   // 10 s per frame
    paced.read_frame();
    bool woke = false;
    std::thread reader([&] {
        try {
            paced.read_frame();
        } catch (const core::Error& e) {
            woke = e.code() == core::ErrorCode::SourceClosed;
        }
    });
    std::this_thread::sleep_for(30ms);
    const auto t0 = std::chrono::steady_clock::now();
    paced.close();
    reader.join();
    assert(woke);
    assert(std::chrono::steady_clock::now() - t0 < 2s);

    // WAV device: exact rate required, end of file reported as SourceClosed
    const fs::path dir = fs::temp_directory_path() / "lwt_synthetic_test";
    fs::create_directories(dir);
    const fs::path wav = dir / "speech.wav";
    std::vector<int16_t> samples(400);
    for (size_t i = 0; i < samples.size(); ++i) samples[i] = static_cast<int16_t>(i);
    write_wav(wav, 16000, 1, samples);

    audio::SyntheticSource file(false);
    assert(open_error(file, "synthetic:" + wav.string(), 44100) == core::ErrorCode::UnsupportedFormat);
    assert(open_error(file, "synthetic:" + (dir / "nope.wav").string(), 16000) == core::ErrorCode::DeviceUnavailable);
    file.open("synthetic:" + wav.string(), 16000, 160);
    auto a = file.read_frame();
    auto b = file.read_frame();
    assert(a.size() == 160 && b.size() == 160);
    assert(a[0] == 0 && b[0] == 160);
    bool eof = false;
    try {
        file.read_frame();   // only 80 samples left
    } catch (const core::Error& e) {
        eof = e.code() == core::ErrorCode::SourceClosed;
    }
    assert(eof);

    audio::SyntheticSource looping(false, true);
    looping.open("synthetic:" + wav.string(), 16000, 200);
    looping.read_frame();
    looping.read_frame();
    auto again = looping.read_frame();
    assert(again[0] == 0);

    assert(open_error(tone, "default", 16000) == core::ErrorCode::DeviceUnavailable);
    assert(audio::SyntheticSource::enumerate().size() == 2);
    fs::remove_all(dir);
    return 0;
}
