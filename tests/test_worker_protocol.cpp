#include "worker_protocol.hpp"
#include "worker_runtime.hpp"
#include "core/backends/reference_backends.h"
#include <iostream>
#include <sstream>
#include <vector>
#include <cassert>

using namespace voxpipe;

static std::vector<WorkerMessage> decode_all(const std::string& out) {
    std::vector<WorkerMessage> msgs;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        WorkerMessage m;
        std::string err;
        bool ok = decode_message(line, m, err);
        assert(ok);
        msgs.push_back(m);
    }
    return msgs;
}

static void test_codec() {
    Task t;
    t.id = "transcribe-1-7";
    t.type = TaskType::Transcribe;
    t.payload["text"] = "hello there";
    std::string line = encode_message(make_task_message(t));
    assert(line.find('\n') == std::string::npos);

    WorkerMessage m;
    std::string err;
    assert(decode_message(line, m, err));
    assert(m.kind == MessageKind::Task);
    assert(m.id == "transcribe-1-7");
    assert(m.type == TaskType::Transcribe);
    assert(m.payload["text"].asString() == "hello there");

    // error kind survives the wire; unknown kinds degrade to TaskFailed
    assert(decode_message(encode_message(make_error_message("x-1", ErrorKind::InvalidPayload, "bad")), m, err));
    assert(m.kind == MessageKind::Error && m.error.kind == ErrorKind::InvalidPayload && m.error.message == "bad");
    assert(decode_message("{\"kind\":\"error\",\"id\":\"x-2\",\"error\":{\"kind\":\"Bogus\",\"message\":\"m\"}}", m, err));
    assert(m.error.kind == ErrorKind::TaskFailed);

    // rejects
    assert(!decode_message("not json", m, err));
    assert(!decode_message("[1,2]", m, err));
    assert(!decode_message("{\"kind\":\"bogus\"}", m, err));
    assert(!decode_message("{\"kind\":\"result\",\"payload\":{}}", m, err));
    assert(!decode_message("{\"kind\":\"task\",\"id\":\"a\",\"type\":\"fly\"}", m, err));
    assert(!err.empty());

    WorkerMessage ping;
    ping.kind = MessageKind::Ping;
    ping.nonce = 42;
    assert(decode_message(encode_message(ping), m, err));
    assert(m.kind == MessageKind::Ping && m.nonce == 42);
    std::cout << "codec ok\n";
}

static void test_runtime_generate() {
    WorkerOptions opts;
    opts.type = TaskType::GenerateReply;
    WorkerRuntime rt(opts, std::unique_ptr<TaskBackend>(new GenerateReplyBackend()));

    Task t;
    t.id = "gen-1";
    t.type = TaskType::GenerateReply;
    Json::Value turn;
    turn["role"] = "user";
    turn["text"] = "what time is it";
    t.payload["context"].append(turn);

    WorkerMessage ping;
    ping.kind = MessageKind::Ping;
    ping.nonce = 9;
    WorkerMessage shutdown;
    shutdown.kind = MessageKind::Shutdown;

    std::istringstream in(encode_message(ping) + "\n" + encode_message(make_task_message(t)) + "\n" +
                          encode_message(shutdown) + "\n");
    std::ostringstream out;
    assert(rt.run(in, out) == 0);

    auto msgs = decode_all(out.str());
    assert(msgs.size() == 3);
    assert(msgs[0].kind == MessageKind::Ready && msgs[0].type == TaskType::GenerateReply);
    assert(msgs[1].kind == MessageKind::Pong && msgs[1].nonce == 9);
    assert(msgs[2].kind == MessageKind::Result && msgs[2].id == "gen-1");
    assert(msgs[2].payload["text"].asString() == "I received: \"what time is it\"");
    std::cout << "runtime generate ok\n";
}

static void test_runtime_errors() {
    WorkerOptions opts;
    opts.type = TaskType::Synthesize;
    WorkerRuntime rt(opts, std::unique_ptr<TaskBackend>(new SynthesizeBackend()));

    Task wrong;
    wrong.id = "t-1";
    wrong.type = TaskType::Transcribe;
    wrong.payload["text"] = "hi";

    std::istringstream in(encode_message(make_task_message(wrong)) + "\n");
    std::ostringstream out;
    assert(rt.run(in, out) == 0);
    auto msgs = decode_all(out.str());
    assert(msgs.size() == 2);
    assert(msgs[1].kind == MessageKind::Error && msgs[1].id == "t-1");
    assert(msgs[1].error.kind == ErrorKind::UnknownTaskType);

    WorkerRuntime rt2(opts, std::unique_ptr<TaskBackend>(new SynthesizeBackend()));
    Task empty;
    empty.id = "s-1";
    empty.type = TaskType::Synthesize;
    empty.payload["text"] = "";
    std::istringstream in2(encode_message(make_task_message(empty)) + "\n");
    std::ostringstream out2;
    assert(rt2.run(in2, out2) == 0);
    msgs = decode_all(out2.str());
    assert(msgs.back().kind == MessageKind::Error);
    assert(msgs.back().error.kind == ErrorKind::InvalidPayload);

    // "throw" is ignored unless fault injection is allowed
    WorkerOptions faulty = opts;
    faulty.allow_fault_injection = true;
    WorkerRuntime rt3(faulty, std::unique_ptr<TaskBackend>(new SynthesizeBackend()));
    Task boom;
    boom.id = "s-2";
    boom.type = TaskType::Synthesize;
    boom.payload["text"] = "x";
    boom.payload["fault"] = "throw";
    std::istringstream in3(encode_message(make_task_message(boom)) + "\n");
    std::ostringstream out3;
    assert(rt3.run(in3, out3) == 0);
    msgs = decode_all(out3.str());
    assert(msgs.back().kind == MessageKind::Error && msgs.back().error.kind == ErrorKind::TaskFailed);
    std::cout << "runtime errors ok\n";
}

static void test_runtime_chunks() {
    WorkerOptions opts;
    opts.type = TaskType::Synthesize;
    WorkerRuntime rt(opts, std::unique_ptr<TaskBackend>(new SynthesizeBackend()));
    Task t;
    t.id = "s-9";
    t.type = TaskType::Synthesize;
    t.payload["text"] = "twenty characters!!!";   // 20 * 50ms = 1000ms
    t.payload["chunk_ms"] = 250;
    std::istringstream in(encode_message(make_task_message(t)) + "\n");
    std::ostringstream out;
    assert(rt.run(in, out) == 0);
    auto msgs = decode_all(out.str());
    // ready + 4 chunks + result
    assert(msgs.size() == 6);
    for (int i = 0; i < 4; ++i) {
        assert(msgs[1 + i].kind == MessageKind::Chunk);
        assert(msgs[1 + i].id == "s-9");
        assert(msgs[1 + i].seq == i);
    }
    assert(msgs[5].kind == MessageKind::Result);
    assert(msgs[5].payload["chunks"].asInt() == 4);
    assert(msgs[5].payload["duration_ms"].asInt() == 1000);
    std::cout << "runtime chunks ok\n";
}

int main() {
    test_codec();
    test_runtime_generate();
    test_runtime_errors();
    test_runtime_chunks();
    std::cout << "Worker protocol test PASSED\n";
    return 0;
}
