#pragma once
#include "include/voxpipe.hpp"
#include <json/json.h>
#include <string>

namespace voxpipe {

// Newline-delimited JSON spoken between a pool and its worker processes.
enum class MessageKind : uint8_t {
    Ready = 0,
    Task,
    Chunk,
    Result,
    Error,
    Ping,
    Pong,
    Shutdown,
};

struct WorkerMessage {
    MessageKind kind = MessageKind::Ping;
    std::string id;           // correlation id (task/chunk/result/error)
    TaskType type = TaskType::Transcribe; // ready/task
    Json::Value payload;      // task/chunk/result
    TaskError error;          // error
    int seq = 0;              // chunk
    int64_t nonce = 0;        // ping/pong
    int64_t pid = 0;          // ready
};

const char* to_string(MessageKind k);

// Compact single-line rendering, no trailing newline.
std::string to_json_line(const Json::Value& v);
bool parse_json_line(const std::string& line, Json::Value& out, std::string& err);

std::string encode_message(const WorkerMessage& msg);
bool decode_message(const std::string& line, WorkerMessage& out, std::string& err);

WorkerMessage make_task_message(const Task& task);
WorkerMessage make_result_message(const std::string& id, Json::Value payload);
WorkerMessage make_error_message(const std::string& id, ErrorKind kind, const std::string& message);
WorkerMessage make_chunk_message(const std::string& id, int seq, Json::Value payload);

} // namespace voxpipe
