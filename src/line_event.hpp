#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace tailf {

inline double now_seconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

// Serializes payloads that may carry bytes from arbitrary log files
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

struct LineEvent {
    std::string source_id;
    std::uint64_t seq = 0;            // monotonic per source; markers reuse the last seq
    double timestamp = 0.0;           // when the engine observed the line
    std::string content;
    bool truncated = false;           // line exceeded the max length and was cut
    bool rotated = false;             // rotation/truncation marker
    std::uint64_t gap = 0;            // subscriber-local: lines dropped at this point

    bool is_marker() const { return rotated || gap > 0; }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["sourceId"] = source_id;
        j["seq"] = seq;
        j["timestamp"] = timestamp;
        j["content"] = content;
        if (truncated) j["truncated"] = true;
        if (rotated) j["rotated"] = true;
        if (gap > 0) j["gap"] = gap;
        return j;
    }
};

enum class ErrorKind {
    SourceUnavailable,
    SecurityViolation,
    PoolExhausted,
    SourceNotFound,
    ViewerLimit
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::SecurityViolation: return "SecurityViolation";
        case ErrorKind::PoolExhausted: return "PoolExhausted";
        case ErrorKind::SourceNotFound: return "SourceNotFound";
        case ErrorKind::ViewerLimit: return "ViewerLimit";
        default: return "Unknown";
    }
}

struct ErrorEvent {
    std::string source_id;
    ErrorKind kind = ErrorKind::SourceUnavailable;
    std::string message;

    nlohmann::json to_json() const {
        return {
            {"sourceId", source_id},
            {"errorKind", error_kind_to_string(kind)},
            {"message", message}
        };
    }
};

// One entry of a subscriber's outbound queue
struct StreamEvent {
    enum class Type { Line, Error };

    Type type = Type::Line;
    LineEvent line;
    ErrorEvent error;

    static StreamEvent of(LineEvent line) {
        StreamEvent e;
        e.type = Type::Line;
        e.line = std::move(line);
        return e;
    }

    static StreamEvent of(ErrorEvent error) {
        StreamEvent e;
        e.type = Type::Error;
        e.error = std::move(error);
        return e;
    }

    bool is_line() const { return type == Type::Line; }
    bool is_gap() const { return type == Type::Line && line.gap > 0; }

    // SSE event name
    const char* event_name() const { return type == Type::Line ? "line" : "error"; }

    nlohmann::json to_json() const {
        return type == Type::Line ? line.to_json() : error.to_json();
    }
};

} // namespace tailf
