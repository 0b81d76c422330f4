#include <catch2/catch_test_macros.hpp>
#include "cipherlink/call/voice_activity_monitor.hpp"
#include "helpers/manual_scheduler.hpp"

using namespace cipherlink;
using namespace cipherlink::call;
using cipherlink::test_helpers::ManualScheduler;
using namespace std::chrono_literals;

TEST_CASE("VoiceActivityMonitor - Energy threshold", "[vad][call]") {
    SECTION("Mean of the bins") {
        const std::vector<uint8_t> bins = {0, 10, 20, 30};
        REQUIRE(VoiceActivityMonitor::MeanEnergy(bins) == 15.0);
        REQUIRE(VoiceActivityMonitor::MeanEnergy(std::vector<uint8_t>{}) == 0.0);
    }
    SECTION("Speaking means strictly above the threshold") {
        REQUIRE_FALSE(VoiceActivityMonitor::IsSpeaking(std::vector<uint8_t>(128, 15), 15));
        REQUIRE(VoiceActivityMonitor::IsSpeaking(std::vector<uint8_t>(128, 16), 15));
        REQUIRE_FALSE(VoiceActivityMonitor::IsSpeaking(std::vector<uint8_t>(128, 0), 15));
    }
}

TEST_CASE("VoiceActivityMonitor - Polling", "[vad][call]") {
    ManualScheduler scheduler;
    VoiceActivityMonitor monitor(scheduler, configuration::CallConfig::Default());
    int samples = 0;

    monitor.Start([&] { ++samples; });
    REQUIRE(monitor.IsRunning());

    SECTION("Samples every 100 ms") {
        scheduler.AdvanceBy(99ms);
        REQUIRE(samples == 0);
        scheduler.AdvanceBy(1ms);
        REQUIRE(samples == 1);
        scheduler.AdvanceBy(500ms);
        REQUIRE(samples == 6);
    }
    SECTION("Stop ends sampling") {
        scheduler.AdvanceBy(250ms);
        monitor.Stop();
        REQUIRE_FALSE(monitor.IsRunning());
        scheduler.AdvanceBy(1000ms);
        REQUIRE(samples == 2);
        REQUIRE(scheduler.PendingCount() == 0);
    }
    SECTION("Sampler may stop the monitor") {
        monitor.Start([&] {
            ++samples;
            monitor.Stop();
        });
        scheduler.AdvanceBy(1000ms);
        REQUIRE(samples == 1);
        REQUIRE_FALSE(monitor.IsRunning());
    }
    SECTION("Restart replaces the sampler") {
        int other = 0;
        monitor.Start([&] { ++other; });
        scheduler.AdvanceBy(300ms);
        REQUIRE(samples == 0);
        REQUIRE(other == 3);
    }
}
