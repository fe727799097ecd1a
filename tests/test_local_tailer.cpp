#include <catch2/catch_test_macros.hpp>
#include "local_tailer.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace tailf;
using tailf::testing::TempDir;
using tailf::testing::wait_until;

namespace {

TailerSettings fast_settings() {
    TailerSettings settings;
    settings.poll_interval = std::chrono::milliseconds(20);
    return settings;
}

std::shared_ptr<Source> local_source(const std::string& path) {
    auto source = std::make_shared<Source>();
    source->id = "app";
    source->name = "app";
    source->kind = SourceKind::LocalFile;
    source->path = path;
    return source;
}

void append(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::app | std::ios::binary);
    out << text;
}

// Accumulates everything a subscriber receives
struct Collector {
    std::shared_ptr<Subscriber> subscriber;
    std::vector<LineEvent> lines;

    void poll() {
        for (auto& event : subscriber->drain()) {
            if (event.is_line()) lines.push_back(event.line);
        }
    }

    bool wait_for_lines(std::size_t count) {
        return wait_until([this, count]() {
            poll();
            return lines.size() >= count;
        });
    }

    std::vector<std::string> contents() const {
        std::vector<std::string> out;
        for (const auto& line : lines) out.push_back(line.content);
        return out;
    }
};

} // namespace

TEST_CASE("LocalFileTailer follows appends", "[tailer][local]") {
    TempDir dir("local_append");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    auto source = local_source(path);
    LocalFileTailer tailer(source, hub, fast_settings());
    tailer.start();

    append(path, "first\nsec");
    REQUIRE(seen.wait_for_lines(1));
    append(path, "ond\n\x1b[32mthird\x1b[0m\n");
    REQUIRE(seen.wait_for_lines(3));

    REQUIRE(seen.contents() == std::vector<std::string>{"first", "second", "third"});
    REQUIRE(seen.lines[0].seq == 1);
    REQUIRE(seen.lines[2].seq == 3);
    REQUIRE(tailer.state() == TailerState::Streaming);

    tailer.stop();
    REQUIRE_FALSE(tailer.is_running());
    REQUIRE(tailer.state() == TailerState::Stopped);
    REQUIRE(source->cursor.seq == 3);
}

TEST_CASE("LocalFileTailer replays only the recent tail", "[tailer][local]") {
    TempDir dir("local_backlog");
    std::string path = dir.file("app.log");
    append(path, "aaaaaaaaaa\nbbbb\ncccc\n");

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    TailerSettings settings = fast_settings();

    SECTION("Start falls on a line boundary") {
        settings.backlog_bytes = 10;
        LocalFileTailer tailer(local_source(path), hub, settings);
        tailer.start();
        REQUIRE(seen.wait_for_lines(2));
        tailer.stop();
        REQUIRE(seen.contents() == std::vector<std::string>{"bbbb", "cccc"});
    }

    SECTION("Partial first line is skipped") {
        settings.backlog_bytes = 8;
        LocalFileTailer tailer(local_source(path), hub, settings);
        tailer.start();
        REQUIRE(seen.wait_for_lines(1));
        append(path, "dddd\n");
        REQUIRE(seen.wait_for_lines(2));
        tailer.stop();
        REQUIRE(seen.contents() == std::vector<std::string>{"cccc", "dddd"});
    }
}

TEST_CASE("LocalFileTailer handles rotation by rename", "[tailer][local]") {
    TempDir dir("local_rotate");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    LocalFileTailer tailer(local_source(path), hub, fast_settings());
    tailer.start();

    append(path, "old 1\nold 2\n");
    REQUIRE(seen.wait_for_lines(2));

    std::filesystem::rename(path, path + ".1");
    append(path + ".1", "late\n");
    append(path, "new 1\n");

    REQUIRE(seen.wait_for_lines(5));
    tailer.stop();

    std::vector<std::string> content = seen.contents();
    REQUIRE(content[0] == "old 1");
    REQUIRE(content[1] == "old 2");

    // Lines written to the renamed file before the switch are not lost
    auto marker = std::find_if(seen.lines.begin(), seen.lines.end(),
                               [](const LineEvent& e) { return e.rotated; });
    REQUIRE(marker != seen.lines.end());
    REQUIRE(marker->content == "file rotated");
    REQUIRE(std::find(content.begin(), content.end(), "late") != content.end());
    REQUIRE(seen.lines.back().content == "new 1");
    REQUIRE_FALSE(seen.lines.back().rotated);

    // Markers carry the current seq without consuming one
    std::uint64_t last_seq = 0;
    for (const auto& line : seen.lines) {
        if (line.rotated) {
            REQUIRE(line.seq == last_seq);
        } else {
            REQUIRE(line.seq == last_seq + 1);
            last_seq = line.seq;
        }
    }
}

TEST_CASE("LocalFileTailer handles truncation", "[tailer][local]") {
    TempDir dir("local_truncate");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    LocalFileTailer tailer(local_source(path), hub, fast_settings());
    tailer.start();

    append(path, "long line one\nlong line two\n");
    REQUIRE(seen.wait_for_lines(2));

    std::ofstream(path, std::ios::trunc | std::ios::binary) << "x\n";
    REQUIRE(seen.wait_for_lines(4));
    tailer.stop();

    REQUIRE(seen.lines[2].rotated);
    REQUIRE(seen.lines[2].content == "file truncated");
    REQUIRE(seen.lines[2].seq == 2);
    REQUIRE(seen.lines[3].content == "x");
    REQUIRE(seen.lines[3].seq == 3);
}

TEST_CASE("LocalFileTailer notices a file rewritten past the old offset", "[tailer][local]") {
    TempDir dir("local_rewrite");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    auto source = local_source(path);
    LocalFileTailer tailer(source, hub, fast_settings());

    SECTION("While running") {
        tailer.start();
        append(path, "short\n");
        REQUIRE(seen.wait_for_lines(1));

        // Replaced in one write; the tailer may never see the file empty
        std::string next = dir.file("next.tmp");
        std::ofstream(next, std::ios::binary) << "rewritten and much longer than before\n";
        std::ifstream in(next, std::ios::binary);
        std::ofstream(path, std::ios::in | std::ios::out | std::ios::binary) << in.rdbuf();

        REQUIRE(seen.wait_for_lines(3));
        tailer.stop();

        REQUIRE(seen.lines[1].rotated);
        REQUIRE(seen.lines[1].content == "file truncated");
        REQUIRE(seen.lines[2].content == "rewritten and much longer than before");
    }

    SECTION("While stopped") {
        tailer.start();
        append(path, "short\n");
        REQUIRE(seen.wait_for_lines(1));
        tailer.stop();

        std::ofstream(path, std::ios::trunc | std::ios::binary)
            << "rewritten and much longer than before\n";
        tailer.start();
        REQUIRE(seen.wait_for_lines(2));
        tailer.stop();

        REQUIRE(seen.lines[1].content == "rewritten and much longer than before");
        REQUIRE(seen.lines[1].seq == 2);
    }
}

TEST_CASE("LocalFileTailer waits for a missing file", "[tailer][local]") {
    TempDir dir("local_missing");
    std::string path = dir.file("later.log");

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    LocalFileTailer tailer(local_source(path), hub, fast_settings());
    tailer.start();

    REQUIRE(wait_until([&tailer]() { return tailer.state() == TailerState::Rotated; }));

    append(path, "hello\n");
    REQUIRE(seen.wait_for_lines(1));
    REQUIRE(seen.lines[0].content == "hello");
    tailer.stop();
}

TEST_CASE("LocalFileTailer restarts where it stopped", "[tailer][local]") {
    TempDir dir("local_restart");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    StreamHub hub;
    Collector seen{hub.subscribe("app")};
    auto source = local_source(path);
    LocalFileTailer tailer(source, hub, fast_settings());

    tailer.start();
    append(path, "a\nb\n");
    REQUIRE(seen.wait_for_lines(2));
    tailer.stop();

    append(path, "c\n");
    tailer.start();
    REQUIRE(seen.wait_for_lines(3));
    tailer.stop();

    REQUIRE(seen.contents() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(seen.lines[2].seq == 3);
}
