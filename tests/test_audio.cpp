#include "core/audio/pcm.h"
#include "core/audio/utterance_detector.h"
#include "core/codec/base64.h"
#include <cmath>
#include <iostream>
#include <string>
#include <cassert>

using namespace voxpipe;

static std::vector<int16_t> silence(int ms) {
    return std::vector<int16_t>(ms_to_samples(ms, 16000), 0);
}

static std::vector<int16_t> tone(int ms) {
    return sine_tone(300.0, 16000, 0, ms_to_samples(ms, 16000), 0.5);
}

static void test_base64() {
    const std::string text = "voxpipe!";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    assert(base64_encode(bytes) == "dm94cGlwZSE=");
    assert(base64_encode(std::vector<uint8_t>{}) == "");
    assert(base64_encode(std::vector<uint8_t>{0xff}) == "/w==");

    std::vector<uint8_t> out;
    assert(base64_decode("dm94cGlw\nZSE=", out));
    assert(std::string(out.begin(), out.end()) == text);
    assert(!base64_decode("dm9$", out));
    assert(!base64_decode("dm9=x", out));
    assert(!base64_decode("A", out));
    std::cout << "base64 ok\n";
}

static void test_pcm() {
    std::vector<int16_t> s{0, 1, -1, 32767, -32768};
    std::vector<uint8_t> b = pcm16_to_bytes(s);
    assert(b.size() == 10);
    assert(b[2] == 0x01 && b[3] == 0x00);
    assert(b[4] == 0xff && b[5] == 0xff);
    assert(pcm16_from_bytes(b) == s);

    std::vector<int16_t> t = sine_tone(440.0, 16000, 0, 16000, 0.5);
    double rms = pcm16_rms(t.data(), t.size());
    assert(std::fabs(rms - 0.5 * 32767.0 / std::sqrt(2.0)) < 50.0);
    assert(pcm16_rms(nullptr, 0) == 0.0);

    // chunked generation continues the phase
    std::vector<int16_t> a = sine_tone(440.0, 16000, 0, 100, 0.5);
    std::vector<int16_t> c = sine_tone(440.0, 16000, 100, 100, 0.5);
    a.insert(a.end(), c.begin(), c.end());
    assert(a == sine_tone(440.0, 16000, 0, 200, 0.5));
    assert(samples_to_ms(8000, 16000) == 500 && ms_to_samples(20, 8000) == 160);
    std::cout << "pcm ok\n";
}

static void test_utterance_detector() {
    UtteranceDetector det;

    // quiet input never triggers and stays bounded
    for (int i = 0; i < 50; ++i) assert(!det.push(silence(100)));
    assert(!det.speech_seen());
    assert(det.buffered_ms() <= 700);

    assert(!det.push(tone(600)));
    assert(det.speech_ms() == 600);
    assert(!det.push(silence(400)));
    assert(det.push(silence(400)));
    std::vector<int16_t> utt = det.take();
    // pre-roll + speech + gap, never the whole 5s of silence
    assert(samples_to_ms(utt.size(), 16000) <= 700 + 600 + 800);
    assert(det.buffered_ms() == 0 && !det.speech_seen());

    // a click shorter than min_speech is dropped at the gap
    assert(!det.push(tone(60)));
    assert(!det.push(silence(800)));
    assert(!det.speech_seen());
    assert(det.buffered_ms() <= 800);

    // explicit end of turn
    det.reset();
    assert(!det.force_boundary());
    det.push(tone(100));
    assert(det.force_boundary());

    // max utterance length closes a turn with no pause
    UtteranceConfig cfg;
    cfg.max_utterance_ms = 1000;
    cfg.gap_ms = 300;
    det.reconfigure(cfg);
    bool hit = false;
    for (int i = 0; i < 12 && !hit; ++i) hit = det.push(tone(100));
    assert(hit);
    assert(det.buffered_ms() >= 1000);
    std::cout << "utterance detector ok\n";
}

int main() {
    test_base64();
    test_pcm();
    test_utterance_detector();
    std::cout << "Audio test PASSED\n";
    return 0;
}
