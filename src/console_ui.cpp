#include "console_ui.hpp"
#include "directory_scanner.hpp"
#include "maintenance_loop.hpp"
#include "session_pool.hpp"
#include "source_registry.hpp"
#include "stream_hub.hpp"
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <algorithm>
#include <sstream>

namespace tailf {

template<typename T>
LogBuffer<T>::LogBuffer(size_t max_lines) : max_lines_(max_lines) {}

template<typename T>
void LogBuffer<T>::push(T line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

template<typename T>
std::vector<T> LogBuffer<T>::get_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<T>(lines_.begin(), lines_.end());
}

template<typename T>
size_t LogBuffer<T>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

template<typename T>
void LogBuffer<T>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

template class LogBuffer<WatchLine>;
template class LogBuffer<ServerLogLine>;

ConsoleUI::ConsoleUI(SourceRegistry& registry, StreamHub& hub, SessionPool& pool,
                     DirectoryScanner& scanner, MaintenanceLoop& maintenance, uint16_t http_port)
    : registry_(registry)
    , hub_(hub)
    , pool_(pool)
    , scanner_(scanner)
    , maintenance_(maintenance)
    , http_port_(http_port)
    , watch_lines_(2000)
    , server_logs_(500)
    , rate_window_start_(std::chrono::steady_clock::now())
{
}

ConsoleUI::~ConsoleUI() {
    unwatch();
}

void ConsoleUI::refresh() {
    if (auto* screen = screen_.load()) {
        screen->Post(ftxui::Event::Custom);
    }
}

void ConsoleUI::log_server(LogLevel level, const std::string& component,
                           const std::string& message) {
    ServerLogLine line;
    line.level = level;
    line.component = component;
    line.message = message;
    server_logs_.push(std::move(line));
    refresh();
}

ServerLog::Sink ConsoleUI::get_log_sink() {
    return [this](LogLevel level, const std::string& component, const std::string& message) {
        log_server(level, component, message);
    };
}

void ConsoleUI::update_stats() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - rate_window_start_).count();
    if (elapsed < 1.0) return;

    auto hub_stats = hub_.stats();
    std::size_t sessions = 0;
    for (const auto& host : pool_.stats()) {
        sessions += host.idle + host.leased;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.lines_per_second = (hub_stats.published - last_published_) / elapsed;
    stats_.sources = registry_.list_sources().size();
    stats_.subscribers = hub_stats.subscribers;
    stats_.published = hub_stats.published;
    stats_.dropped = hub_stats.dropped;
    stats_.sessions = sessions;
    last_published_ = hub_stats.published;
    rate_window_start_ = now;
}

void ConsoleUI::watch(const std::string& source_id) {
    unwatch();

    std::shared_ptr<Subscriber> subscriber;
    try {
        subscriber = registry_.subscribe(source_id);
    } catch (const SourceNotFound& e) {
        log_server(LogLevel::Error, "Watch", e.what());
        return;
    } catch (const GuardError& e) {
        log_server(LogLevel::Error, "Watch", std::string("Refused: ") + e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(watch_mutex_);
    watch_lines_.clear();
    watched_ = subscriber;
    watching_ = true;
    watch_thread_ = std::thread([this, subscriber]() {
        watch_loop(subscriber);
    });
    log_server(LogLevel::Info, "Watch", "Watching " + source_id);
}

void ConsoleUI::unwatch() {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (!watched_) return;

    watching_ = false;
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }
    registry_.unsubscribe(watched_);
    watched_.reset();
}

void ConsoleUI::watch_loop(std::shared_ptr<Subscriber> subscriber) {
    while (watching_) {
        auto event = subscriber->next(std::chrono::milliseconds(200));
        if (!event) {
            if (subscriber->closed()) break;
            continue;
        }
        if (paused_) continue;

        WatchLine line;
        if (event->is_line()) {
            const auto& l = event->line;
            line.seq = l.seq;
            line.content = l.content;
            if (l.gap > 0) {
                line.kind = WatchLine::Kind::Gap;
                line.content = "... " + std::to_string(l.gap) + " line(s) dropped ...";
            } else if (l.rotated) {
                line.kind = WatchLine::Kind::Marker;
                line.content = "--- " + l.content + " ---";
            } else if (l.truncated) {
                line.kind = WatchLine::Kind::Truncated;
            }
        } else {
            line.kind = WatchLine::Kind::Error;
            line.content = error_kind_to_string(event->error.kind) + ": " + event->error.message;
        }
        watch_lines_.push(std::move(line));
        refresh();
    }
}

void ConsoleUI::show_help() {
    log_server(LogLevel::Info, "Help", "Available commands:");
    for (const auto& command : commands_) {
        log_server(LogLevel::Info, "Help", "  /" + command.name + " - " + command.description);
    }
}

void ConsoleUI::init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen) {
    auto quit = [&running, &screen](ConsoleUI&, const std::vector<std::string>&) {
        running = false;
        screen.Exit();
    };

    commands_ = {
        {"quit", "Exit the application", quit, false},
        {"q", "Exit (alias for quit)", quit, false},
        {"pause", "Toggle display pause", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.paused_ = !ui.paused_;
        }, false},
        {"clear", "Clear the watch pane", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.watch_lines_.clear();
        }, false},
        {"watch", "Follow a source: /watch <id>", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            if (args.empty()) {
                ui.log_server(LogLevel::Warn, "Watch", "Usage: /watch <id>");
                return;
            }
            ui.watch(args[0]);
        }, true},
        {"unwatch", "Stop following the current source", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.unwatch();
        }, false},
        {"sources", "List sources", [](ConsoleUI& ui, const std::vector<std::string>&) {
            auto sources = ui.registry_.list_sources();
            if (sources.empty()) {
                ui.log_server(LogLevel::Info, "Sources", "No sources");
            }
            for (const auto& src : sources) {
                ui.log_server(LogLevel::Info, "Sources", "  " + src.id + " [" + src.state + "] " +
                              src.path + " seq=" + std::to_string(src.seq) +
                              " subs=" + std::to_string(src.subscribers));
            }
            for (const auto& rejected : ui.registry_.rejected()) {
                ui.log_server(LogLevel::Warn, "Sources", "  " + rejected.id + " rejected: " +
                              reject_reason_name(rejected.reason));
            }
        }, false},
        {"pool", "Show SSH session pool", [](ConsoleUI& ui, const std::vector<std::string>&) {
            auto hosts = ui.pool_.stats();
            if (hosts.empty()) {
                ui.log_server(LogLevel::Info, "Pool", "No remote sessions");
            }
            for (const auto& host : hosts) {
                ui.log_server(LogLevel::Info, "Pool", "  " + host.key + " idle=" +
                              std::to_string(host.idle) + " leased=" + std::to_string(host.leased) +
                              " opened=" + std::to_string(host.opened) +
                              " retired=" + std::to_string(host.retired));
            }
        }, false},
        {"rescan", "Rescan directory sources", [](ConsoleUI& ui, const std::vector<std::string>&) {
            // Remote listings can block; keep them off the UI thread
            DirectoryScanner& scanner = ui.scanner_;
            ui.maintenance_.post("rescan", [&scanner]() {
                std::size_t changes = scanner.scan_all();
                ServerLog::log("Scanner", "Rescan done, " + std::to_string(changes) + " change(s)");
            });
        }, false},
        {"help", "Show available commands", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.show_help();
        }, false},
    };
}

void ConsoleUI::execute_command() {
    if (command_input_.empty()) return;

    std::string input = command_input_;
    command_input_.clear();
    completion_hint_.clear();

    if (input[0] == '/') {
        input = input.substr(1);
    }
    if (input.empty()) return;

    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }

    for (const auto& command : commands_) {
        if (command.name == cmd) {
            command.handler(*this, args);
            return;
        }
    }

    log_server(LogLevel::Warn, "Command", "Unknown command: /" + cmd + " (type /help for available commands)");
}

std::string ConsoleUI::complete_command(const std::string& partial) {
    if (partial.empty() || partial[0] != '/') return partial;

    std::string prefix = partial.substr(1);
    std::vector<std::string> matches;
    for (const auto& cmd : commands_) {
        if (cmd.name.find(prefix) == 0) {
            matches.push_back(cmd.name);
        }
    }

    if (matches.size() == 1) {
        return "/" + matches[0] + (prefix == matches[0] ? "" : " ");
    }
    if (matches.size() > 1 && !prefix.empty()) {
        std::string common = matches[0];
        for (size_t i = 1; i < matches.size(); ++i) {
            size_t j = 0;
            while (j < common.size() && j < matches[i].size() && common[j] == matches[i][j]) {
                ++j;
            }
            common = common.substr(0, j);
        }
        if (common.size() > prefix.size()) {
            return "/" + common;
        }
    }
    return partial;
}

void ConsoleUI::update_completion_hint() {
    if (command_input_.empty()) {
        completion_hint_ = "Type /help for commands";
        return;
    }
    if (command_input_[0] != '/') {
        completion_hint_ = "Commands start with /";
        return;
    }

    std::string prefix = command_input_.substr(1);
    auto space = prefix.find(' ');
    if (space != std::string::npos) {
        // Arguments being typed: offer source ids for /watch
        if (prefix.substr(0, space) == "watch") {
            std::string partial = prefix.substr(space + 1);
            std::string hint;
            for (const auto& src : registry_.list_sources()) {
                if (src.id.find(partial) == 0) {
                    if (!hint.empty()) hint += ", ";
                    hint += src.id;
                }
            }
            completion_hint_ = hint;
        } else {
            completion_hint_.clear();
        }
        return;
    }

    std::string hint;
    for (const auto& cmd : commands_) {
        if (cmd.name.find(prefix) == 0) {
            if (!hint.empty()) hint += ", ";
            hint += cmd.name;
        }
    }
    completion_hint_ = hint.empty() ? "(no match)" : "Tab: " + hint;
}

void ConsoleUI::handle_tab_completion() {
    if (command_input_.empty()) {
        command_input_ = "/";
    } else {
        command_input_ = complete_command(command_input_);
    }
    update_completion_hint();
}

void ConsoleUI::run(std::atomic<bool>& running) {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;

    init_commands(running, screen);
    update_completion_hint();

    std::atomic<bool> stats_running{true};
    std::thread stats_thread([this, &stats_running]() {
        while (stats_running) {
            update_stats();
            std::this_thread::sleep_for(std::chrono::seconds(1));
            refresh();
        }
    });

    auto input_option = InputOption::Default();
    input_option.transform = [](InputState state) {
        state.element |= color(Color::White);
        return state.element;
    };
    auto input_component = Input(&command_input_, "", input_option);

    auto command_input_handler = CatchEvent(input_component, [this](Event event) {
        if (event == Event::Tab) {
            handle_tab_completion();
            return true;
        }
        if (event == Event::Escape) {
            command_input_.clear();
            update_completion_hint();
            return true;
        }
        if (event == Event::Return) {
            execute_command();
            update_completion_hint();
            return true;
        }
        return false;
    });

    auto command_with_hints = CatchEvent(command_input_handler, [this](Event event) {
        if (event.is_character() || event == Event::Backspace || event == Event::Delete) {
            update_completion_hint();
        }
        return false;
    });

    auto main_content = Renderer([this]() {
        DisplayStats current;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            current = stats_;
        }

        std::string watched_id;
        {
            std::lock_guard<std::mutex> lock(watch_mutex_);
            watched_id = watched_ ? watched_->source_id() : "";
        }

        auto top_bar = hbox({
            text(" tailf-hub") | bold | color(Color::Cyan),
            text("  HTTP:" + std::to_string(http_port_)) | dim,
            filler(),
            text("sources " + std::to_string(current.sources)),
            text("  subscribers " + std::to_string(current.subscribers)),
            text("  ssh " + std::to_string(current.sessions)),
            text("  " + std::to_string(static_cast<int>(current.lines_per_second)) + " lines/s"),
            text("  dropped ") | dim,
            text(std::to_string(current.dropped)) | color(current.dropped > 0 ? Color::Yellow : Color::White),
            text(" "),
        });

        Elements watch_elements;
        auto lines = watch_lines_.get_lines();
        size_t start = lines.size() > 200 ? lines.size() - 200 : 0;
        for (size_t i = start; i < lines.size(); ++i) {
            const auto& line = lines[i];
            Element body = text(line.content);
            switch (line.kind) {
                case WatchLine::Kind::Error: body = body | color(Color::Red); break;
                case WatchLine::Kind::Marker: body = body | color(Color::Cyan); break;
                case WatchLine::Kind::Gap: body = body | color(Color::Yellow); break;
                case WatchLine::Kind::Truncated: body = hbox({body, text(" [cut]") | dim}); break;
                default: break;
            }
            watch_elements.push_back(hbox({
                text(std::to_string(line.seq) + " ") | dim,
                body,
            }));
        }

        auto watch_pane = vbox({
            hbox({
                text(watched_id.empty() ? " No source watched " : " " + watched_id + " ") | bold,
                filler(),
                text("(" + std::to_string(watch_lines_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(watch_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        Elements server_elements;
        auto server_lines = server_logs_.get_lines();
        size_t srv_start = server_lines.size() > 100 ? server_lines.size() - 100 : 0;
        for (size_t i = srv_start; i < server_lines.size(); ++i) {
            const auto& line = server_lines[i];
            auto elem = paragraph("[" + line.component + "] " + line.message);
            if (line.level == LogLevel::Error) {
                elem = elem | color(Color::Red);
            } else if (line.level == LogLevel::Warn) {
                elem = elem | color(Color::Yellow);
            } else if (line.level == LogLevel::Debug) {
                elem = elem | dim;
            }
            server_elements.push_back(elem);
        }

        auto server_pane = vbox({
            hbox({
                text(" Server Log ") | bold,
                filler(),
                text("(" + std::to_string(server_logs_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(server_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        return vbox({
            top_bar,
            hbox({
                watch_pane | flex,
                server_pane | size(WIDTH, EQUAL, 48),
            }) | flex,
        });
    });

    auto cmd_bar = Renderer(command_with_hints, [this, &input_component]() {
        return hbox({
            text(" > ") | bold | color(Color::GrayLight),
            input_component->Render() | size(WIDTH, GREATER_THAN, 20),
            filler(),
            paused_ ? (text(" PAUSED ") | bgcolor(Color::Yellow) | color(Color::Black)) : text(""),
            text(completion_hint_) | dim | color(Color::GrayDark),
            text(" "),
        });
    });

    auto main_layout = Renderer(command_with_hints, [&main_content, &cmd_bar]() {
        return vbox({
            main_content->Render() | flex,
            separator() | color(Color::GrayDark),
            cmd_bar->Render() | size(HEIGHT, EQUAL, 1),
        });
    });

    screen.Loop(main_layout);

    stats_running = false;
    stats_thread.join();
    screen_ = nullptr;
    unwatch();
}

} // namespace tailf
