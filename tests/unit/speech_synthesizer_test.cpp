#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "test_support.hpp"
#include "tts/speech_synthesizer.hpp"

using namespace std::chrono_literals;

struct Rig {
    test::FakeSpeechEngine* engine = nullptr;
    std::shared_ptr<test::FakeOutputState> output = std::make_shared<test::FakeOutputState>();
    std::unique_ptr<tts::SpeechSynthesizer> speech;

    explicit Rig(tts::SpeechOptions options = {}) {
        auto e = std::make_unique<test::FakeSpeechEngine>();
        engine = e.get();
        speech = std::make_unique<tts::SpeechSynthesizer>(std::move(e), std::make_unique<test::FakeOutput>(output),
                                                          options);
    }
};

static void test_pcm_conversion() {
    const float in[] = {0.0f, 0.5f, 1.0f, -1.0f, 2.0f, -3.0f};
    auto pcm = tts::SpeechSynthesizer::to_pcm16(in, 6, 1.0f);
    assert(pcm[0] == 0);
    assert(pcm[1] == 16384 || pcm[1] == 16383);
    assert(pcm[2] == 32767);
    assert(pcm[3] == -32767);
    assert(pcm[4] == 32767);    // clamped
    assert(pcm[5] == -32767);
    auto quiet = tts::SpeechSynthesizer::to_pcm16(in, 3, 0.5f);
    assert(quiet[2] == 16384 || quiet[2] == 16383);
}

static void test_blocking_speak_plays_everything() {
    tts::SpeechOptions options;
    options.length_scale = 1.3f;
    options.volume = 1.0f;
    Rig rig(options);
    assert(rig.speech->speak("hello world"));
    assert(rig.engine->requests == 1);
    assert(rig.engine->last_length_scale == 1.3f);
    assert(rig.output->played.size() == 3 * rig.engine->samples_per_piece);
    assert(rig.output->stops == 1);
    assert(rig.output->aborts == 0);
    assert(!rig.speech->is_speaking());
}

static void test_cancel_from_another_thread() {
    Rig rig;
    rig.engine->pieces = 200;
    rig.engine->piece_delay = 5ms;

    bool finished = true;
    std::thread speaker([&] { finished = rig.speech->speak("a long story"); });
    assert(test::wait_until([&] { return rig.speech->is_speaking(); }));
    std::this_thread::sleep_for(30ms);
    rig.speech->cancel();
    speaker.join();

    assert(!finished);
    assert(rig.engine->pieces_accepted < 200);
    assert(rig.output->aborts >= 1);
    assert(!rig.speech->is_speaking());

    // The synthesizer stays usable
    rig.engine->pieces = 2;
    assert(rig.speech->speak("again"));
}

static void test_cancel_while_draining_last_buffer() {
    Rig rig;
    rig.output->drain_delay = 3000ms;

    std::thread speaker([&] { rig.speech->speak("short"); });
    assert(test::wait_until([&] { return rig.output->draining.load(); }));
    const auto cancelled_at = std::chrono::steady_clock::now();
    rig.speech->cancel();
    speaker.join();

    // The tail is cut off instead of played out
    assert(std::chrono::steady_clock::now() - cancelled_at < 1000ms);
    assert(rig.output->aborts >= 1);
    assert(!rig.speech->is_speaking());
}

static void test_async_replaces_current_request() {
    Rig rig;
    rig.engine->pieces = 100;
    rig.speech->speak_async("first");
    assert(test::wait_until([&] { return rig.engine->requests >= 1; }));
    rig.speech->speak_async("second");
    assert(test::wait_until([&] { return rig.engine->requests >= 2; }));
    rig.speech->cancel();
    assert(test::wait_until([&] { return !rig.speech->is_speaking(); }));
    assert(rig.engine->pieces_accepted < 200);
}

static void test_engine_failure_reported() {
    Rig rig;
    rig.engine->fail = true;
    bool threw = false;
    try {
        rig.speech->speak("boom");
    } catch (const core::Error& e) {
        threw = e.code() == core::ErrorCode::SynthesisFailed;
    }
    assert(threw);
    assert(!rig.speech->is_speaking());

    std::atomic<int> errors{0};
    rig.speech->set_error_handler([&](const std::string&) { ++errors; });
    rig.speech->speak_async("boom");
    assert(test::wait_until([&] { return errors.load() == 1; }));
}

int main() {
    test_pcm_conversion();
    test_blocking_speak_plays_everything();
    test_cancel_from_another_thread();
    test_cancel_while_draining_last_buffer();
    test_async_replaces_current_request();
    test_engine_failure_reported();
    return 0;
}
