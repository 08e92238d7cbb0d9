#include "stream_protocol.hpp"
#include "worker_protocol.hpp"
#include "core/codec/base64.h"
#include <iostream>
#include <cassert>

using namespace voxpipe;

int main() {
    ClientFrame f;
    std::string err;

    assert(decode_client_frame(std::string("{\"type\":\"init\",\"config\":{\"mode\":\"text\",\"language\":\"de\","
                               "\"sample_rate\":8000,\"context_id\":\"u1\"}}"), f, err));
    assert(f.type == ClientFrameType::Init);
    assert(f.config.mode == "text" && !f.config.tts_enabled);
    assert(f.config.language == "de" && f.config.sample_rate == 8000 && f.config.context_id == "u1");

    ClientFrame d;
    assert(decode_client_frame(std::string("{\"type\":\"init\"}"), d, err));
    assert(d.config.mode == "voice" && d.config.tts_enabled && d.config.sample_rate == 16000);

    assert(!decode_client_frame(std::string("{\"type\":\"init\",\"config\":{\"mode\":\"video\"}}"), f, err));
    assert(!decode_client_frame(std::string("{\"type\":\"init\",\"config\":{\"sample_rate\":4000}}"), f, err));

    std::vector<uint8_t> pcm{1, 0, 2, 0, 3, 0};
    std::string line = "{\"type\":\"audio_chunk\",\"session_id\":\"s1\",\"seq\":7,\"end_of_turn\":true,\"audio\":\"" +
                       base64_encode(pcm) + "\"}";
    assert(decode_client_frame(line, f, err));
    assert(f.type == ClientFrameType::AudioChunk && f.session_id == "s1");
    assert(f.audio == pcm && f.seq == 7 && f.end_of_turn);

    // odd byte count is not PCM16
    std::vector<uint8_t> odd{1, 2, 3};
    assert(!decode_client_frame("{\"type\":\"audio_chunk\",\"audio\":\"" + base64_encode(odd) + "\"}", f, err));
    assert(!decode_client_frame(std::string("{\"type\":\"audio_chunk\",\"audio\":\"***\"}"), f, err));
    assert(!decode_client_frame(std::string("{\"type\":\"audio_chunk\",\"audio\":\"AAAAAA==\",\"seq\":\"x\"}"), f, err));

    assert(decode_client_frame(std::string("{\"type\":\"text_input\",\"text\":\"hi\"}"), f, err));
    assert(f.type == ClientFrameType::TextInput && f.text == "hi");
    assert(!decode_client_frame(std::string("{\"type\":\"text_input\"}"), f, err));

    assert(decode_client_frame(std::string("{\"type\":\"quality_feedback\",\"score\":4.5,\"category\":\"voice\","
                               "\"comment\":\"nice\"}"), f, err));
    assert(f.score == 4.5 && f.category == "voice" && f.text == "nice");

    const char* bare[] = {"pause", "resume", "interrupt", "end"};
    for (const char* t : bare) {
        assert(decode_client_frame(std::string("{\"type\":\"") + t + "\"}", f, err));
        assert(std::string(to_string(f.type)) == t);
    }

    assert(!decode_client_frame(std::string("{\"type\":\"teleport\"}"), f, err));
    assert(err.find("teleport") != std::string::npos);
    assert(!decode_client_frame(std::string("{\"kind\":\"pause\"}"), f, err));
    assert(!decode_client_frame(std::string("pause"), f, err));

    Json::Value sf = make_server_frame("stt_final", "s1", 3);
    assert(sf["type"].asString() == "stt_final" && sf["session_id"].asString() == "s1");
    assert(sf["turn"].asInt() == 3 && sf["ts"].asInt64() > 0);
    assert(!make_server_frame("ready", "s1").isMember("turn"));

    Json::Value ef = make_error_frame("s1", ErrorKind::QueueTimeout, "slow", "tts", 2);
    assert(ef["type"].asString() == "error" && ef["kind"].asString() == "QueueTimeout");
    assert(ef["stage"].asString() == "tts" && ef["message"].asString() == "slow");
    std::string wire = encode_frame(ef);
    assert(wire.find('\n') == std::string::npos);
    Json::Value back;
    assert(parse_json_line(wire, back, err));
    assert(back == ef);

    std::cout << "Stream protocol test PASSED\n";
    return 0;
}
