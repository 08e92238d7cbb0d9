#include "worker_protocol.hpp"
#include <memory>

namespace voxpipe {

namespace {

const char* kKindNames[] = {"ready", "task", "chunk", "result", "error", "ping", "pong", "shutdown"};

bool parse_kind(const std::string& s, MessageKind& out) {
    for (int i = 0; i < 8; ++i) {
        if (s == kKindNames[i]) { out = static_cast<MessageKind>(i); return true; }
    }
    return false;
}

bool require_id(const Json::Value& v, WorkerMessage& out, std::string& err) {
    if (!v.isMember("id") || !v["id"].isString() || v["id"].asString().empty()) {
        err = std::string("missing id in ") + to_string(out.kind) + " message";
        return false;
    }
    out.id = v["id"].asString();
    return true;
}

bool require_type(const Json::Value& v, WorkerMessage& out, std::string& err) {
    if (!v["type"].isString() || !parse_task_type(v["type"].asString(), out.type)) {
        err = "unknown task type '" + v["type"].asString() + "'";
        return false;
    }
    return true;
}

} // namespace

const char* to_string(MessageKind k) {
    return kKindNames[static_cast<int>(k)];
}

std::string to_json_line(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

bool parse_json_line(const std::string& line, Json::Value& out, std::string& err) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &out, &errs)) {
        err = "malformed json: " + errs;
        return false;
    }
    if (!out.isObject()) {
        err = "expected a json object";
        return false;
    }
    return true;
}

std::string encode_message(const WorkerMessage& msg) {
    Json::Value v(Json::objectValue);
    v["kind"] = to_string(msg.kind);
    switch (msg.kind) {
    case MessageKind::Ready:
        v["type"] = to_string(msg.type);
        v["pid"] = static_cast<Json::Int64>(msg.pid);
        break;
    case MessageKind::Task:
        v["id"] = msg.id;
        v["type"] = to_string(msg.type);
        v["payload"] = msg.payload;
        break;
    case MessageKind::Chunk:
        v["id"] = msg.id;
        v["seq"] = msg.seq;
        v["payload"] = msg.payload;
        break;
    case MessageKind::Result:
        v["id"] = msg.id;
        v["payload"] = msg.payload;
        break;
    case MessageKind::Error:
        v["id"] = msg.id;
        v["error"]["kind"] = to_string(msg.error.kind);
        v["error"]["message"] = msg.error.message;
        break;
    case MessageKind::Ping:
    case MessageKind::Pong:
        v["nonce"] = static_cast<Json::Int64>(msg.nonce);
        break;
    case MessageKind::Shutdown:
        break;
    }
    return to_json_line(v);
}

bool decode_message(const std::string& line, WorkerMessage& out, std::string& err) {
    Json::Value v;
    if (!parse_json_line(line, v, err)) return false;
    if (!v["kind"].isString() || !parse_kind(v["kind"].asString(), out.kind)) {
        err = "unknown message kind";
        return false;
    }

    switch (out.kind) {
    case MessageKind::Ready:
        if (v.isMember("type") && !require_type(v, out, err)) return false;
        out.pid = v.get("pid", 0).asInt64();
        return true;
    case MessageKind::Task:
        if (!require_id(v, out, err) || !require_type(v, out, err)) return false;
        out.payload = v["payload"];
        return true;
    case MessageKind::Chunk:
        if (!require_id(v, out, err)) return false;
        out.seq = v.get("seq", 0).asInt();
        out.payload = v["payload"];
        return true;
    case MessageKind::Result:
        if (!require_id(v, out, err)) return false;
        out.payload = v["payload"];
        return true;
    case MessageKind::Error: {
        if (!require_id(v, out, err)) return false;
        const Json::Value& e = v["error"];
        out.error.kind = ErrorKind::TaskFailed;
        if (e.isObject()) {
            ErrorKind k;
            if (e["kind"].isString() && parse_error_kind(e["kind"].asString(), k)) out.error.kind = k;
            out.error.message = e.get("message", "").asString();
        } else if (e.isString()) {
            out.error.message = e.asString();
        }
        return true;
    }
    case MessageKind::Ping:
    case MessageKind::Pong:
        out.nonce = v.get("nonce", 0).asInt64();
        return true;
    case MessageKind::Shutdown:
        return true;
    }
    return true;
}

WorkerMessage make_task_message(const Task& task) {
    WorkerMessage m;
    m.kind = MessageKind::Task;
    m.id = task.id;
    m.type = task.type;
    m.payload = task.payload;
    return m;
}

WorkerMessage make_result_message(const std::string& id, Json::Value payload) {
    WorkerMessage m;
    m.kind = MessageKind::Result;
    m.id = id;
    m.payload = std::move(payload);
    return m;
}

WorkerMessage make_error_message(const std::string& id, ErrorKind kind, const std::string& message) {
    WorkerMessage m;
    m.kind = MessageKind::Error;
    m.id = id;
    m.error.kind = kind;
    m.error.message = message;
    return m;
}

WorkerMessage make_chunk_message(const std::string& id, int seq, Json::Value payload) {
    WorkerMessage m;
    m.kind = MessageKind::Chunk;
    m.id = id;
    m.seq = seq;
    m.payload = std::move(payload);
    return m;
}

} // namespace voxpipe
