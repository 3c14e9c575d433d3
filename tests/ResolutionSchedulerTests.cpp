#include <gtest/gtest.h>
#include "Fakes.hpp"
#include "../discovery/ResolutionScheduler.hpp"

using namespace lanwatch::discovery;
using lanwatch::testing::FakeResolver;
using lanwatch::testing::ScopedTempDir;
using namespace std::chrono_literals;

namespace {

class ResolutionSchedulerTests : public ::testing::Test {
protected:
    ResolutionSchedulerTests()
        : vendors(VendorDirectory::Empty()),
          names((dir.Path() / "device_names.json").string()),
          registry(vendors, names),
          resolver(std::make_shared<FakeResolver>(std::map<std::string, std::string>{
              {"192.168.1.1", "router.lan"}, {"192.168.1.2", "laptop.lan"}})) {
        settings.resolution_pacing = 0ms;
        settings.resolution_poll_interval = 20ms;
        settings.hostname_timeout = 100ms;

        PartialObservation a;
        a.mac = "AA:BB:CC:00:00:01";
        a.ip = "192.168.1.1";
        registry.Observe(a);

        PartialObservation b;
        b.mac = "AA:BB:CC:00:00:02";
        b.ip = "192.168.1.2";
        b.hostname = "known-already";
        registry.Observe(b);
    }

    ScopedTempDir dir;
    VendorDirectory vendors;
    DeviceNameStore names;
    DeviceRegistry registry;
    std::shared_ptr<FakeResolver> resolver;
    lanwatch::config::ScanSettings settings;
};

}

TEST_F(ResolutionSchedulerTests, NothingVisibleMeansNoLookups) {
    LazyResolutionScheduler scheduler(registry, resolver, settings);
    scheduler.RequestResolutionForVisible({});

    EXPECT_EQ(scheduler.DrainOnce(), 0u);
    EXPECT_TRUE(resolver->Asked().empty());
}

TEST_F(ResolutionSchedulerTests, KnownHostnamesAreNotResolvedAgain) {
    LazyResolutionScheduler scheduler(registry, resolver, settings);
    scheduler.RequestResolutionForVisible({"aa:bb:cc:00:00:01", "AA:BB:CC:00:00:02", "AA:BB:CC:00:00:99"});

    EXPECT_EQ(scheduler.DrainOnce(), 1u);
    EXPECT_EQ(resolver->Asked(), (std::vector<std::string>{"192.168.1.1"}));
    EXPECT_EQ(registry.Find("AA:BB:CC:00:00:01")->hostname, std::optional<std::string>("router.lan"));
    EXPECT_EQ(scheduler.PendingCount(), 0u);

    // Resolved once, never again
    scheduler.RequestResolutionForVisible({"AA:BB:CC:00:00:01"});
    EXPECT_EQ(scheduler.DrainOnce(), 0u);
}

TEST_F(ResolutionSchedulerTests, NewRequestReplacesWantedSet) {
    LazyResolutionScheduler scheduler(registry, resolver, settings);

    scheduler.RequestResolutionForVisible({"AA:BB:CC:00:00:01", "AA:BB:CC:00:00:02"});
    EXPECT_EQ(scheduler.PendingCount(), 2u);

    scheduler.RequestResolutionForVisible({"AA:BB:CC:00:00:02", "not-a-mac"});
    EXPECT_EQ(scheduler.PendingCount(), 1u);

    EXPECT_EQ(scheduler.DrainOnce(), 0u);
    EXPECT_FALSE(registry.Find("AA:BB:CC:00:00:01")->hostname.has_value());
}

TEST_F(ResolutionSchedulerTests, WorkerDrainsInBackground) {
    LazyResolutionScheduler scheduler(registry, resolver, settings);
    scheduler.Start();
    EXPECT_TRUE(scheduler.IsRunning());

    scheduler.RequestResolutionForVisible({"AA:BB:CC:00:00:01"});

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline &&
           !registry.Find("AA:BB:CC:00:00:01")->hostname.has_value())
        std::this_thread::sleep_for(10ms);

    scheduler.Stop();
    EXPECT_FALSE(scheduler.IsRunning());
    EXPECT_EQ(registry.Find("AA:BB:CC:00:00:01")->hostname, std::optional<std::string>("router.lan"));
}
