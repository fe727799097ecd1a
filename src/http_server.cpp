#include "http_server.hpp"
#include "server_log.hpp"
#include "session_pool.hpp"
#include "source_registry.hpp"
#include "stream_hub.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>

namespace tailf {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kKeepAliveInterval = std::chrono::seconds(15);

// Workers beyond max_viewers, for the JSON routes and refusals
constexpr std::size_t kControlThreads = 4;

void allow_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(dump_json(body), "application/json");
}

struct TreeNode {
    nlohmann::json leaf;    // null for directories
    std::map<std::string, TreeNode> children;
};

std::vector<std::string> split_relative(const std::string& relative) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(relative);
    while (std::getline(in, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

void insert_leaf(TreeNode& root, const std::string& relative, nlohmann::json leaf) {
    auto parts = split_relative(relative);
    if (parts.empty()) return;

    TreeNode* node = &root;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        node = &node->children[parts[i]];
    }
    node->children[parts.back()].leaf = std::move(leaf);
}

nlohmann::json tree_children(const TreeNode& node) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [label, child] : node.children) {
        if (!child.leaf.is_null()) {
            out.push_back(child.leaf);
            continue;
        }
        out.push_back({
            {"name", label},
            {"label", label},
            {"type", "directory"},
            {"children", tree_children(child)}
        });
    }
    return out;
}

// Local files are stat'ed here; remote ones are not queried, so their size is
// what has been read so far and existence is only known once data arrived.
nlohmann::json file_leaf(const SourceInfo& info, const std::string& label) {
    nlohmann::json leaf = {
        {"name", info.id},
        {"label", label},
        {"path", info.path},
        {"type", "file"},
        {"source", info.host.empty() ? "local" : "remote"}
    };

    if (info.host.empty()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(info.path, ec);
        leaf["exists"] = !ec;
        leaf["size"] = ec ? 0 : size;
    } else {
        leaf["exists"] = info.offset > 0 ? nlohmann::json(true) : nlohmann::json(nullptr);
        leaf["size"] = info.offset;
    }
    return leaf;
}

// Part of id below prefix + "/", or the whole id
std::string below(const std::string& id, const std::string& prefix) {
    if (!prefix.empty() && id.size() > prefix.size() + 1 &&
        id.compare(0, prefix.size(), prefix) == 0 && id[prefix.size()] == '/') {
        return id.substr(prefix.size() + 1);
    }
    return id;
}

} // namespace

HttpServer::HttpServer(SourceRegistry& registry, StreamHub& hub, SessionPool& pool,
                       ServerSettings settings)
    : registry_(registry)
    , hub_(hub)
    , pool_(pool)
    , settings_(std::move(settings))
    , server_(std::make_unique<httplib::Server>())
{
    const std::size_t workers = settings_.max_viewers + kControlThreads;
    server_->new_task_queue = [workers]() { return new httplib::ThreadPool(workers); };
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::format_event(const StreamEvent& event) {
    std::string frame = "event: ";
    frame += event.event_name();
    frame += "\ndata: ";
    frame += dump_json(event.to_json());
    frame += "\n\n";
    return frame;
}

nlohmann::json HttpServer::file_tree(const std::vector<SourceInfo>& sources) {
    nlohmann::json top = nlohmann::json::array();
    std::map<std::string, TreeNode> local_groups;
    std::map<std::string, TreeNode> remote_groups;

    for (const auto& info : sources) {
        if (!info.host.empty()) {
            // Remote files sit under their server; scanned ones one level further
            // down, under the directory's own name
            std::string relative = info.origin.empty()
                ? info.name
                : below(info.origin, info.host) + "/" + below(info.id, info.origin);
            insert_leaf(remote_groups[info.host], relative,
                        file_leaf(info, split_relative(relative).back()));
        } else if (!info.origin.empty()) {
            std::string relative = below(info.id, info.origin);
            insert_leaf(local_groups[info.origin], relative,
                        file_leaf(info, split_relative(relative).back()));
        } else {
            top.push_back(file_leaf(info, info.name));
        }
    }

    for (const auto& [name, group] : local_groups) {
        top.push_back({
            {"name", name},
            {"label", name},
            {"type", "directory"},
            {"source", "local"},
            {"children", tree_children(group)}
        });
    }
    for (const auto& [name, group] : remote_groups) {
        top.push_back({
            {"name", name},
            {"label", name},
            {"type", "directory"},
            {"source", "remote"},
            {"children", tree_children(group)}
        });
    }
    return top;
}

nlohmann::json HttpServer::health() const {
    auto stats = hub_.stats();

    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& host : pool_.stats()) {
        sessions.push_back({
            {"host", host.key},
            {"idle", host.idle},
            {"leased", host.leased},
            {"opened", host.opened},
            {"retired", host.retired}
        });
    }

    return {
        {"status", "ok"},
        {"sources", stats.sources},
        {"subscribers", stats.subscribers},
        {"viewers", viewers_.load()},
        {"maxViewers", settings_.max_viewers},
        {"published", stats.published},
        {"dropped", stats.dropped},
        {"sessions", sessions}
    };
}

void HttpServer::setup_routes() {
    // Log 404s and other errors
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::stringstream msg;
        msg << res.status << " " << req.method << " " << req.path << " from " << req.remote_addr;
        ServerLog::log("HTTP", msg.str());
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        allow_cors(res);
        send_json(res, 200, health());
    });

    server_->Get("/api/sources", [this](const httplib::Request&, httplib::Response& res) {
        allow_cors(res);

        nlohmann::json sources = nlohmann::json::array();
        for (const auto& info : registry_.list_sources()) {
            sources.push_back(info.to_json());
        }
        nlohmann::json rejected = nlohmann::json::array();
        for (const auto& entry : registry_.rejected()) {
            rejected.push_back(entry.to_json());
        }
        send_json(res, 200, {{"sources", sources}, {"rejected", rejected}});
    });

    server_->Get("/api/files", [this](const httplib::Request&, httplib::Response& res) {
        allow_cors(res);
        send_json(res, 200, file_tree(registry_.list_sources()));
    });

    server_->Get("/api/logs/stream", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stream(req, res);
    });

    server_->Post("/api/logs/clear", [this](const httplib::Request& req, httplib::Response& res) {
        handle_clear(req, res);
    });

    server_->Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
        allow_cors(res);
        res.status = 204;
    });
}

void HttpServer::handle_stream(const httplib::Request& req, httplib::Response& res) {
    std::string source_id = req.has_param("source")
        ? req.get_param_value("source")
        : req.get_param_value("file");

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    allow_cors(res);

    std::shared_ptr<Subscriber> subscriber;
    ErrorEvent failure;
    failure.source_id = source_id;

    // A viewer holds its worker thread until it disconnects
    if (viewers_.fetch_add(1) >= settings_.max_viewers) {
        --viewers_;
        failure.kind = ErrorKind::ViewerLimit;
        failure.message = "all " + std::to_string(settings_.max_viewers) + " viewer slots in use";
    } else {
        try {
            subscriber = registry_.subscribe(source_id);
        } catch (const SourceNotFound& e) {
            failure.kind = ErrorKind::SourceNotFound;
            failure.message = e.what();
        } catch (const GuardError& e) {
            failure.kind = ErrorKind::SecurityViolation;
            failure.message = e.what();
        }
        if (!subscriber) {
            --viewers_;
        }
    }

    if (!subscriber) {
        ServerLog::warn("HTTP", "Stream refused for '" + source_id + "' from " + req.remote_addr +
                        ": " + failure.message);
        res.set_content(format_event(StreamEvent::of(failure)), "text/event-stream");
        return;
    }

    ServerLog::log("HTTP", "SSE client " + std::to_string(subscriber->id()) + " subscribed to " +
                   source_id + " from " + req.remote_addr);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscriber](size_t, httplib::DataSink& sink) -> bool {
            auto last_write = std::chrono::steady_clock::now();

            while (running_ && sink.is_writable()) {
                auto event = subscriber->next(kPollInterval);
                auto now = std::chrono::steady_clock::now();

                if (!event) {
                    if (subscriber->closed()) break;
                    if (now - last_write >= kKeepAliveInterval) {
                        static const std::string ping = ": ping\n\n";
                        if (!sink.write(ping.data(), ping.size())) break;
                        last_write = now;
                    }
                    continue;
                }

                std::string frame = format_event(*event);
                if (!sink.write(frame.data(), frame.size())) break;
                last_write = now;
            }

            sink.done();
            return true;
        },
        [this, subscriber](bool) {
            registry_.unsubscribe(subscriber);
            --viewers_;
            ServerLog::log("HTTP", "SSE client " + std::to_string(subscriber->id()) + " left " +
                           subscriber->source_id() + " (" +
                           std::to_string(subscriber->dropped_count()) + " dropped)");
        });
}

void HttpServer::handle_clear(const httplib::Request& req, httplib::Response& res) {
    allow_cors(res);

    std::string source_id;
    try {
        auto body = nlohmann::json::parse(req.body);
        if (body.contains("source")) {
            source_id = body.at("source").get<std::string>();
        } else if (body.contains("file")) {
            source_id = body.at("file").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        send_json(res, 400, {{"success", false}, {"error", e.what()}});
        return;
    }

    if (source_id.empty()) {
        send_json(res, 400, {{"success", false}, {"error", "missing source"}});
        return;
    }

    try {
        registry_.clear_source(source_id);
        send_json(res, 200, {{"success", true}, {"source", source_id}});
    } catch (const SourceNotFound& e) {
        send_json(res, 404, {{"success", false}, {"errorKind", "SourceNotFound"}, {"error", e.what()}});
    } catch (const GuardError& e) {
        send_json(res, 403, {{"success", false}, {"errorKind", "SecurityViolation"}, {"error", e.what()}});
    } catch (const std::filesystem::filesystem_error& e) {
        ServerLog::error("HTTP", "Clear failed for " + source_id + ": " + e.what());
        send_json(res, 500, {{"success", false}, {"error", e.what()}});
    }
}

void HttpServer::start() {
    if (running_) return;
    running_ = true;

    thread_ = std::thread([this]() {
        ServerLog::log("HTTP", "Server starting on " + settings_.host + ":" +
                       std::to_string(settings_.port));
        if (!server_->listen(settings_.host, settings_.port)) {
            ServerLog::error("HTTP", "Cannot listen on " + settings_.host + ":" +
                             std::to_string(settings_.port));
        }
    });

    // Give server time to start
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace tailf
