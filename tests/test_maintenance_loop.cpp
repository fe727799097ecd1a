#include <catch2/catch_test_macros.hpp>
#include "maintenance_loop.hpp"
#include "fakes.hpp"
#include <stdexcept>

using namespace tailf;
using tailf::testing::wait_until;

TEST_CASE("MaintenanceLoop runs periodic jobs", "[maintenance]") {
    MaintenanceLoop loop;
    std::atomic<int> sweeps{0};
    std::atomic<int> failures{0};

    loop.schedule_every("sweep", std::chrono::milliseconds(10), [&sweeps]() { ++sweeps; });
    loop.schedule_every("flaky", std::chrono::milliseconds(10), [&failures]() {
        ++failures;
        throw std::runtime_error("listing failed");
    });
    loop.start();

    // A throwing job is logged and rearmed, and does not stop the others
    REQUIRE(wait_until([&]() { return sweeps.load() >= 3 && failures.load() >= 3; }));

    loop.stop();
    REQUIRE_FALSE(loop.is_running());
    int after_stop = sweeps.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(sweeps.load() == after_stop);
}

TEST_CASE("MaintenanceLoop post runs once", "[maintenance]") {
    MaintenanceLoop loop(1);
    loop.start();

    std::atomic<int> runs{0};
    loop.post("rescan", [&runs]() { ++runs; });
    REQUIRE(wait_until([&runs]() { return runs.load() == 1; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    REQUIRE(runs.load() == 1);
    loop.stop();
}
