#include <cassert>
#include <memory>
#include <thread>
#include <vector>
#include "asr/model_preset.hpp"
#include "asr/transcription_engine.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static audio::AudioChunk chunk_of(uint64_t seq, int16_t value, size_t n = 160) {
    audio::AudioChunk c;
    c.sequence = seq;
    c.timestamp_ms = static_cast<int64_t>(seq) * 10;
    c.sample_rate = 16000;
    c.samples = std::make_shared<const std::vector<int16_t>>(n, value);
    return c;
}

static void test_presets() {
    assert(asr::parse_preset("base") == asr::ModelPreset::Base);
    assert(asr::parse_preset("LARGE") == asr::ModelPreset::Large);
    assert(!asr::parse_preset("huge"));
    assert(asr::all_presets().size() == 5);
    assert(asr::recommended_workers(asr::ModelPreset::Tiny, 4) == 2);
    assert(asr::recommended_workers(asr::ModelPreset::Large, 4) == 1);
    assert(asr::recommended_workers(asr::ModelPreset::Small, 1) == 1);
}

static void test_load_and_transcribe() {
    auto backend = std::make_shared<test::FakeBackend>();
    asr::TranscriptionEngine engine(backend);
    assert(!engine.current());

    auto h1 = engine.load_preset(asr::ModelPreset::Tiny);
    assert(h1 && h1->preset == asr::ModelPreset::Tiny);
    assert(engine.current() == h1);

    // Same preset again: no reload
    assert(engine.load_preset(asr::ModelPreset::Tiny) == h1);
    assert(backend->loads == 1);

    auto silent = engine.transcribe(*h1, chunk_of(0, 0));
    assert(silent.sequence == 0 && silent.text.empty() && silent.is_final);
    auto spoken = engine.transcribe(*h1, chunk_of(7, 5));
    assert(spoken.text == "tiny:5");
    assert(spoken.timestamp_ms == 70);
}

static void test_reload_keeps_old_handle_alive() {
    auto backend = std::make_shared<test::FakeBackend>();
    asr::TranscriptionEngine engine(backend);
    auto old_handle = engine.load_preset(asr::ModelPreset::Base);
    backend->script->set_delay(9, 100ms);

    // An inference in flight on the old handle while the preset changes
    std::string text;
    std::thread worker([&] { text = engine.transcribe(*old_handle, chunk_of(1, 9)).text; });
    std::this_thread::sleep_for(10ms);
    auto new_handle = engine.load_preset(asr::ModelPreset::Small);
    worker.join();

    assert(text == "base:9");
    assert(new_handle->generation > old_handle->generation);
    assert(engine.current() == new_handle);
    assert(engine.transcribe(*engine.current(), chunk_of(2, 9)).text == "small:9");
}

static void test_loads_are_serialized_and_errors_reported() {
    auto backend = std::make_shared<test::FakeBackend>();
    backend->load_delay = 30ms;
    backend->missing.insert(asr::ModelPreset::Large);
    asr::TranscriptionEngine engine(backend);

    std::thread a([&] { engine.load_preset(asr::ModelPreset::Tiny); });
    std::thread b([&] { engine.load_preset(asr::ModelPreset::Medium); });
    a.join();
    b.join();
    assert(backend->max_concurrent_loads == 1);
    auto before = engine.current();

    bool threw = false;
    try {
        engine.load_preset(asr::ModelPreset::Large);
    } catch (const core::Error& e) {
        threw = e.code() == core::ErrorCode::ModelLoadError;
    }
    assert(threw);
    assert(engine.current() == before);   // failed load leaves the current handle in place
    assert(!engine.is_loading());
}

int main() {
    test_presets();
    test_load_and_transcribe();
    test_reload_keeps_old_handle_alive();
    test_loads_are_serialized_and_errors_reported();
    return 0;
}
