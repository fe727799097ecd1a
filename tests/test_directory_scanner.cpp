#include <catch2/catch_test_macros.hpp>
#include "directory_scanner.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <fstream>

using namespace tailf;
using tailf::testing::FakeConnector;
using tailf::testing::FakeRemote;
using tailf::testing::TempDir;
using tailf::testing::wait_until;

namespace {

TailerSettings test_settings() {
    TailerSettings settings;
    settings.poll_interval = std::chrono::milliseconds(20);
    return settings;
}

const SourceInfo* find_info(const std::vector<SourceInfo>& infos, const std::string& id) {
    auto it = std::find_if(infos.begin(), infos.end(),
                           [&id](const SourceInfo& info) { return info.id == id; });
    return it == infos.end() ? nullptr : &*it;
}

void touch(const std::string& path, const std::string& text = "") {
    std::ofstream(path, std::ios::app) << text;
}

} // namespace

TEST_CASE("DirectoryScanner lists local files", "[scanner]") {
    TempDir dir("scan_list");
    std::filesystem::create_directories(dir.path() / "nested");
    touch(dir.file("a.log"));
    touch(dir.file("b.txt"));
    touch(dir.file("nested/c.log"));

    DirectorySource source;
    source.id = "scanned";
    source.root = dir.path().string();
    source.pattern = "*.log";

    SECTION("Top level only") {
        auto files = DirectoryScanner::list_local(source);
        REQUIRE(files == std::vector<std::string>{dir.file("a.log")});
    }

    SECTION("Recursive") {
        source.recursive = true;
        auto files = DirectoryScanner::list_local(source);
        REQUIRE(files == std::vector<std::string>{dir.file("a.log"), dir.file("nested/c.log")});
    }

    SECTION("Remote listing command") {
        source.root = "/var/log/apps";
        REQUIRE(DirectoryScanner::remote_find_command(source) ==
                "find '/var/log/apps' -maxdepth 1 -type f -name '*.log'");
        source.recursive = true;
        REQUIRE(DirectoryScanner::remote_find_command(source) ==
                "find '/var/log/apps' -type f -name '*.log'");
    }
}

TEST_CASE("DirectoryScanner reconciles local directories", "[scanner]") {
    TempDir dir("scan_local");
    touch(dir.file("a.log"), "first\n");

    FakeRemote remote;
    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    DirectoryScanner scanner(registry, pool);

    DirectorySource directory;
    directory.id = "scanned";
    directory.root = dir.path().string();
    directory.allowed_paths = {dir.path().string()};
    registry.add_directory(directory);

    REQUIRE(scanner.scan_all() == 1);
    REQUIRE(registry.find("scanned/a.log"));
    REQUIRE(registry.find("scanned/a.log")->origin == "scanned");

    auto subscriber = registry.subscribe("scanned/a.log");

    SECTION("New file appears without disturbing the existing tailer") {
        touch(dir.file("b.log"));
        auto result = scanner.rescan_now("scanned");
        REQUIRE(result.added == std::vector<std::string>{"scanned/b.log"});
        REQUIRE(result.removed.empty());

        auto infos = registry.list_sources();
        REQUIRE(find_info(infos, "scanned/a.log")->starts == 1);
        REQUIRE(find_info(infos, "scanned/a.log")->running);
        REQUIRE_FALSE(find_info(infos, "scanned/b.log")->running);

        // Rescanning an unchanged directory changes nothing
        REQUIRE(scanner.scan_all() == 0);
        infos = registry.list_sources();
        REQUIRE(find_info(infos, "scanned/a.log")->starts == 1);

        registry.unsubscribe(subscriber);
    }

    SECTION("Vanished file retires its source and tells its subscribers") {
        std::filesystem::remove(dir.file("a.log"));
        auto result = scanner.rescan_now("scanned");
        REQUIRE(result.removed == std::vector<std::string>{"scanned/a.log"});
        REQUIRE_FALSE(registry.find("scanned/a.log"));

        bool got_error = false;
        REQUIRE(wait_until([&]() {
            for (auto& event : subscriber->drain()) {
                if (event.type == StreamEvent::Type::Error) {
                    REQUIRE(event.error.kind == ErrorKind::SourceUnavailable);
                    got_error = true;
                }
            }
            return got_error;
        }));
        REQUIRE(subscriber->closed());
        REQUIRE_THROWS_AS(registry.subscribe("scanned/a.log"), SourceNotFound);
    }

    SECTION("Unknown directory id") {
        REQUIRE_THROWS_AS(scanner.rescan_now("nope"), SourceNotFound);
        registry.unsubscribe(subscriber);
    }
}

TEST_CASE("DirectoryScanner reconciles remote directories", "[scanner]") {
    FakeRemote remote;
    remote.run_output =
        "/var/log/apps/api.log\n"
        "find: '/var/log/apps/private': Permission denied\n"
        "/var/log/apps/worker.log\n"
        "/etc/passwd\n";

    FakeConnector connector(remote);
    SessionPool pool(connector);
    StreamHub hub;
    SourceRegistry registry(hub, pool, test_settings());
    DirectoryScanner scanner(registry, pool);

    DirectorySource directory;
    directory.id = "web1/apps";
    directory.root = "/var/log/apps";
    directory.host = tailf::testing::make_host();
    registry.add_directory(directory);

    auto result = scanner.rescan_now("web1/apps");
    REQUIRE(result.added == std::vector<std::string>{"web1/apps/api.log", "web1/apps/worker.log"});
    REQUIRE(remote.recorded_commands().back() ==
            "find '/var/log/apps' -maxdepth 1 -type f -name '*.log'");

    auto source = registry.find("web1/apps/api.log");
    REQUIRE(source);
    REQUIRE(source->is_remote());
    REQUIRE(source->host->name == "web1");

    // Out-of-whitelist entries are recorded, not registered
    auto rejected = registry.rejected();
    REQUIRE(rejected.size() == 1);
    REQUIRE(rejected[0].path == "/etc/passwd");
    REQUIRE_THROWS_AS(registry.subscribe(rejected[0].id), GuardError);

    SECTION("Failed listing keeps the current sources") {
        remote.alive = false;
        remote.refuse = true;
        REQUIRE(scanner.scan_all() == 0);
        REQUIRE(registry.find("web1/apps/api.log"));
        REQUIRE(registry.find("web1/apps/worker.log"));
    }

    SECTION("Listing session is returned to the pool") {
        REQUIRE(pool.session_count(*directory.host) == 1);
        REQUIRE(pool.stats()[0].leased == 0);
    }
}
