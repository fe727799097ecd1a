#include <catch2/catch_test_macros.hpp>
#include "source_registry.hpp"
#include "fakes.hpp"
#include <fstream>
#include <thread>

using namespace tailf;
using tailf::testing::FakeConnector;
using tailf::testing::FakeRemote;
using tailf::testing::TempDir;
using tailf::testing::wait_until;

namespace {

TailerSettings test_settings() {
    TailerSettings settings;
    settings.poll_interval = std::chrono::milliseconds(20);
    settings.reconnect_base = std::chrono::milliseconds(5);
    settings.reconnect_jitter = 0.0;
    return settings;
}

LocalFileConfig local_file(const std::string& path, const std::string& name = "") {
    LocalFileConfig config;
    config.path = path;
    config.name = name;
    return config;
}

SourceInfo info_of(const SourceRegistry& registry, const std::string& id) {
    for (const auto& info : registry.list_sources()) {
        if (info.id == id) return info;
    }
    FAIL("no source " << id);
    return {};
}

} // namespace

TEST_CASE("SourceRegistry registration", "[registry]") {
    TempDir dir("registry_add");
    std::string path = dir.file("app.log");
    std::ofstream(path) << "hello\n";

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    const std::vector<std::string> allowed = {dir.path().string()};

    SECTION("Local file id defaults to the file name") {
        auto source = registry.add_local_file(local_file(path), allowed);
        REQUIRE(source->id == "app.log");
        REQUIRE(source->path == path);
        REQUIRE_FALSE(source->is_remote());
        REQUIRE(registry.find("app.log") == source);
    }

    SECTION("Duplicate ids are refused") {
        registry.add_local_file(local_file(path, "app"), allowed);
        REQUIRE_THROWS_AS(registry.add_local_file(local_file(path, "app"), allowed), ConfigError);
    }

    SECTION("Remote file id is prefixed with the server name") {
        RemoteLogConfig log;
        log.name = "nginx";
        log.path = "/var/log/nginx/access.log";
        auto source = registry.add_remote_file("web1", log, tailf::testing::make_host());
        REQUIRE(source->id == "web1/nginx");
        REQUIRE(source->is_remote());
    }

    SECTION("Rejected paths are recorded and refuse subscription") {
        REQUIRE_THROWS_AS(registry.add_local_file(local_file("/etc/shadow", "shadow"), {"/etc"}),
                          GuardError);

        RemoteLogConfig log;
        log.name = "outside";
        log.path = "/home/deploy/app.log";
        REQUIRE_THROWS_AS(registry.add_remote_file("web1", log, tailf::testing::make_host()),
                          GuardError);

        auto rejected = registry.rejected();
        REQUIRE(rejected.size() == 2);
        REQUIRE(rejected[0].to_json()["reason"] == "path-denylisted");
        REQUIRE(rejected[1].to_json()["reason"] == "path-outside-whitelist");

        try {
            registry.subscribe("shadow");
            FAIL("subscribe should have been refused");
        } catch (const GuardError& e) {
            REQUIRE(e.reason() == RejectReason::PathDenylisted);
        }
        REQUIRE(registry.list_sources().empty());
    }

    SECTION("Unknown ids") {
        REQUIRE_THROWS_AS(registry.subscribe("missing"), SourceNotFound);
        REQUIRE_THROWS_AS(registry.clear_source("missing"), SourceNotFound);
    }
}

TEST_CASE("SourceRegistry loads a configuration", "[registry]") {
    TempDir dir("registry_load");
    std::string path = dir.file("app.log");
    std::ofstream(path) << "hello\n";

    AppConfig config;
    config.log_files.push_back(local_file(path));
    config.log_files.push_back(local_file("/etc/shadow"));

    RemoteServerConfig server;
    server.host = tailf::testing::make_host();
    RemoteLogConfig file;
    file.name = "syslog";
    file.path = "/var/log/syslog";
    RemoteLogConfig apps;
    apps.name = "apps";
    apps.path = "/var/log/apps";
    apps.type = EntryType::Directory;
    server.logs = {file, apps};
    config.remote_servers.push_back(server);

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    registry.load(config);

    auto sources = registry.list_sources();
    REQUIRE(sources.size() == 2);
    REQUIRE(registry.find("app.log"));
    REQUIRE(registry.find("web1/syslog"));
    REQUIRE(registry.rejected().size() == 1);

    auto dirs = registry.directories();
    REQUIRE(dirs.size() == 1);
    REQUIRE(dirs[0].id == "web1/apps");
    REQUIRE(dirs[0].is_remote());
    REQUIRE(dirs[0].allowed_paths == std::vector<std::string>{"/var/log"});
}

TEST_CASE("SourceRegistry starts tailers on demand", "[registry]") {
    TempDir dir("registry_lazy");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    registry.add_local_file(local_file(path), {dir.path().string()});

    REQUIRE_FALSE(info_of(registry, "app.log").running);
    REQUIRE(info_of(registry, "app.log").state == "idle");

    auto first = registry.subscribe("app.log");
    auto second = registry.subscribe("app.log");
    REQUIRE(info_of(registry, "app.log").running);
    REQUIRE(info_of(registry, "app.log").subscribers == 2);
    REQUIRE(info_of(registry, "app.log").starts == 1);

    std::ofstream(path, std::ios::app) << "one\n";
    REQUIRE(wait_until([&first]() { return first->queued() == 1; }));
    REQUIRE(wait_until([&second]() { return second->queued() == 1; }));

    registry.unsubscribe(first);
    REQUIRE(info_of(registry, "app.log").running);

    registry.unsubscribe(second);
    REQUIRE_FALSE(info_of(registry, "app.log").running);
    REQUIRE(info_of(registry, "app.log").state == "stopped");

    // A later subscriber restarts the tailer; sequence numbers carry on
    std::ofstream(path, std::ios::app) << "two\n";
    auto third = registry.subscribe("app.log");
    REQUIRE(info_of(registry, "app.log").starts == 2);

    bool saw_two = false;
    REQUIRE(wait_until([&]() {
        for (auto& event : third->drain()) {
            if (event.is_line() && event.line.content == "two") {
                REQUIRE(event.line.seq == 2);
                saw_two = true;
            }
        }
        return saw_two;
    }));
    registry.unsubscribe(third);
}

TEST_CASE("SourceRegistry does not wait for a tailer that is still stopping", "[registry]") {
    TempDir dir("registry_slow_stop");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    FakeRemote remote;
    remote.connect_delay_ms = 1500;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    registry.add_local_file(local_file(path), {dir.path().string()});

    RemoteLogConfig log;
    log.name = "syslog";
    log.path = "/var/log/syslog";
    registry.add_remote_file("web1", log, tailf::testing::make_host());

    // The tailer is now stuck in a slow handshake
    auto first = registry.subscribe("web1/syslog");

    std::thread leaving([&registry, first]() { registry.unsubscribe(first); });
    REQUIRE(wait_until([&registry]() {
        return !info_of(registry, "web1/syslog").running;
    }));

    auto began = std::chrono::steady_clock::now();
    auto again = registry.subscribe("web1/syslog");
    auto local = registry.subscribe("app.log");
    auto infos = registry.list_sources();
    auto elapsed = std::chrono::steady_clock::now() - began;

    REQUIRE(elapsed < std::chrono::milliseconds(500));
    REQUIRE(infos.size() == 2);
    REQUIRE(info_of(registry, "web1/syslog").running);
    REQUIRE(info_of(registry, "web1/syslog").starts == 2);

    leaving.join();
    registry.unsubscribe(local);
    registry.unsubscribe(again);
}

TEST_CASE("SourceRegistry always-on sources", "[registry]") {
    TempDir dir("registry_always");
    std::string path = dir.file("app.log");
    std::ofstream(path).close();

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());

    LocalFileConfig config = local_file(path);
    config.always_on = true;
    registry.add_local_file(config, {dir.path().string()});

    REQUIRE_FALSE(info_of(registry, "app.log").running);
    registry.start();
    REQUIRE(info_of(registry, "app.log").running);

    auto viewer = registry.subscribe("app.log");
    registry.unsubscribe(viewer);
    REQUIRE(info_of(registry, "app.log").running);
    REQUIRE(info_of(registry, "app.log").starts == 1);

    registry.stop();
    REQUIRE_FALSE(info_of(registry, "app.log").running);
}

TEST_CASE("SourceRegistry clear_source", "[registry]") {
    TempDir dir("registry_clear");
    std::string path = dir.file("app.log");
    std::ofstream(path) << "old content\n";

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    registry.add_local_file(local_file(path), {dir.path().string()});

    SECTION("Local file is truncated and its backlog dropped") {
        LineEvent event;
        event.source_id = "app.log";
        event.seq = 1;
        event.content = "old content";
        hub.publish(event);
        REQUIRE(hub.backlog("app.log").size() == 1);

        registry.clear_source("app.log");
        REQUIRE(std::filesystem::file_size(path) == 0);
        REQUIRE(hub.backlog("app.log").empty());
    }

    SECTION("Remote files are never modified") {
        RemoteLogConfig log;
        log.name = "syslog";
        log.path = "/var/log/syslog";
        registry.add_remote_file("web1", log, tailf::testing::make_host());

        try {
            registry.clear_source("web1/syslog");
            FAIL("remote clear should be refused");
        } catch (const GuardError& e) {
            REQUIRE(e.reason() == RejectReason::CommandVerbNotAllowed);
        }
        REQUIRE(remote.connects.load() == 0);
        REQUIRE(remote.recorded_commands().empty());
    }
}
