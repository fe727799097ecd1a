#pragma once

#include "config.hpp"
#include "line_event.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace tailf {

class SourceRegistry;
class StreamHub;
class SessionPool;
struct SourceInfo;

// HTTP front end: one SSE stream per subscriber plus a few JSON routes.
// Each SSE connection drains its own subscriber queue on the httplib
// connection thread, so at most max_viewers streams are served at once and
// the worker pool keeps a few threads beyond that for the JSON routes.
class HttpServer {
public:
    HttpServer(SourceRegistry& registry, StreamHub& hub, SessionPool& pool,
               ServerSettings settings = {});
    ~HttpServer();

    void start();
    void stop();
    bool is_running() const { return running_; }
    std::uint16_t port() const { return settings_.port; }
    std::size_t viewers() const { return viewers_; }

    // One SSE frame: "event: <name>\ndata: <json>\n\n"
    static std::string format_event(const StreamEvent& event);

    // Sources as a tree for file pickers: plain local files at the top,
    // then one directory node per scanned directory and per remote server.
    static nlohmann::json file_tree(const std::vector<SourceInfo>& sources);

private:
    void setup_routes();
    void handle_stream(const httplib::Request& req, httplib::Response& res);
    void handle_clear(const httplib::Request& req, httplib::Response& res);
    nlohmann::json health() const;

    SourceRegistry& registry_;
    StreamHub& hub_;
    SessionPool& pool_;
    ServerSettings settings_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> viewers_{0};
};

} // namespace tailf
