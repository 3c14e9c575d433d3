#include <gtest/gtest.h>
#include "Fakes.hpp"

#include <algorithm>
#include "../discovery/ArpSweepSource.hpp"
#include "../discovery/HostnameResolver.hpp"
#include "../discovery/MdnsSource.hpp"
#include "../discovery/NeighborTableSource.hpp"

using namespace lanwatch::discovery;
using lanwatch::common::SourceUnavailable;
using lanwatch::testing::FakeCommandExecutor;
using namespace std::chrono_literals;

namespace {

const char *kIpNeigh =
    "192.168.1.1 dev eth0 lladdr 00:0c:29:aa:bb:cc REACHABLE\n"
    "192.168.1.20 dev eth0 lladdr b8:27:eb:1:2:3 STALE\n"
    "192.168.1.30 dev eth0  FAILED\n"
    "192.168.1.31 dev eth0 INCOMPLETE\n"
    "192.168.1.40 dev wlan0 lladdr 00:0c:29:aa:bb:cc DELAY\n";

const char *kArp =
    "? (192.168.1.1) at 0:c:29:aa:bb:cc [ether] on en0\n"
    "? (192.168.1.7) at (incomplete) on en0\n"
    "router.lan (192.168.1.254) at 00:11:22:33:44:55 [ether] on en0\n";

const char *kAvahi =
    "+;eth0;IPv4;Living\\032Room;_airplay._tcp;local\n"
    "=;eth0;IPv4;Living\\032Room;_airplay._tcp;local;Living-Room.local;192.168.1.50;7000;\"model=AppleTV6,2\"\n"
    "=;eth0;IPv4;Living\\032Room;_raop._tcp;local;Living-Room.local;192.168.1.50;7000;\n"
    "=;eth0;IPv6;Living\\032Room;_airplay._tcp;local;Living-Room.local;fe80::1;7000;\n"
    "=;eth0;IPv4;Office\\032Printer\\046\\032Scanner;_ipp._tcp;local;printer.local;192.168.1.60;631;\n"
    "=;eth0;IPv4;Broken;_http._tcp;local;broken.local;not-an-ip;80;\n";

}

TEST(SourceParsingTests, ParsesIpNeighSkippingUnresolved) {
    auto entries = ParseIpNeighOutput(kIpNeigh);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].ip, "192.168.1.1");
    EXPECT_EQ(entries[0].mac, "00:0C:29:AA:BB:CC");
    EXPECT_EQ(entries[1].mac, "B8:27:EB:01:02:03");
}

TEST(SourceParsingTests, ParsesArpOutput) {
    auto entries = ParseArpOutput(kArp);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].ip, "192.168.1.1");
    EXPECT_EQ(entries[0].mac, "00:0C:29:AA:BB:CC");
    EXPECT_EQ(entries[1].ip, "192.168.1.254");
}

TEST(SourceParsingTests, IgnoresMulticastAndBroadcastAddresses) {
    EXPECT_TRUE(IsIgnoredNeighborIp("224.0.0.251"));
    EXPECT_TRUE(IsIgnoredNeighborIp("239.255.255.250"));
    EXPECT_TRUE(IsIgnoredNeighborIp("192.168.1.255"));
    EXPECT_TRUE(IsIgnoredNeighborIp("fe80::1"));
    EXPECT_FALSE(IsIgnoredNeighborIp("192.168.1.20"));
}

TEST(SourceParsingTests, ParsesResolvedAvahiRecords) {
    auto records = ParseAvahiBrowseOutput(kAvahi);
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].ip, "192.168.1.50");
    EXPECT_EQ(records[0].instance_name, "Living Room");
    EXPECT_EQ(records[0].host_name, std::optional<std::string>("Living-Room"));
    EXPECT_EQ(records[0].services, (std::vector<std::string>{"_airplay._tcp", "_raop._tcp"}));

    EXPECT_EQ(records[1].instance_name, "Office Printer. Scanner");
}

TEST(SourceParsingTests, KeepsServiceTypeColumnVerbatim) {
    auto records = ParseAvahiBrowseOutput(
        "=;eth0;IPv4;HP\\032LaserJet;_ipp._tcp;local;hp.local;10.0.0.9;631;\n"
        "=;eth0;IPv4;HP\\032LaserJet;_pdl-datastream._tcp;local;hp.local;10.0.0.9;9100;\n"
        "=;eth0;IPv4;Speaker;_googlecast._tcp;local;speaker.local;10.0.0.12;8009;\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].instance_name, "HP LaserJet");
    EXPECT_EQ(records[0].services, (std::vector<std::string>{"_ipp._tcp", "_pdl-datastream._tcp"}));
    EXPECT_EQ(records[1].services, (std::vector<std::string>{"_googlecast._tcp"}));
}

TEST(SourceParsingTests, DecodesAvahiEscapes) {
    EXPECT_EQ(DecodeAvahiEscapes("A\\032B"), "A B");
    EXPECT_EQ(DecodeAvahiEscapes("dot\\.name"), "dot.name");
    EXPECT_EQ(DecodeAvahiEscapes("plain"), "plain");
    EXPECT_EQ(DecodeAvahiEscapes("trailing\\"), "trailing\\");
}

TEST(SourceParsingTests, ParsesGetentOutput) {
    EXPECT_EQ(ParseGetentHostsOutput("192.168.1.5     nas.lan nas\n", "192.168.1.5"),
              std::optional<std::string>("nas.lan"));
    EXPECT_EQ(ParseGetentHostsOutput("192.168.1.5 nas.lan.\n", "192.168.1.5"),
              std::optional<std::string>("nas.lan"));
    EXPECT_FALSE(ParseGetentHostsOutput("192.168.1.5 192.168.1.5\n", "192.168.1.5").has_value());
    EXPECT_FALSE(ParseGetentHostsOutput("", "192.168.1.5").has_value());
}

TEST(SourceParsingTests, SweepTargetsCoverSubnetExceptSelf) {
    const uint32_t ip = 0xC0A80114;      // 192.168.1.20
    const uint32_t mask24 = 0xFFFFFF00;
    auto targets = SweepTargets(ip, mask24, 512);

    EXPECT_EQ(targets.size(), 253u);
    EXPECT_EQ(targets.front(), 0xC0A80101u);
    EXPECT_EQ(targets.back(), 0xC0A801FEu);
    EXPECT_EQ(std::count(targets.begin(), targets.end(), ip), 0);
}

TEST(SourceParsingTests, LargeSubnetFallsBackToSlash24) {
    const uint32_t ip = 0x0A000105;      // 10.0.1.5
    auto targets = SweepTargets(ip, 0xFF000000, 512);

    EXPECT_EQ(targets.size(), 253u);
    EXPECT_EQ(targets.front(), 0x0A000101u);
}

TEST(SourceParsingTests, NeighborSourceFiltersAndAttachesVendor) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    executor->Respond("ip -4 neigh show", 0,
                      "192.168.1.1 dev eth0 lladdr 00:0c:29:aa:bb:cc REACHABLE\n"
                      "192.168.1.2 dev eth0 lladdr 02:42:ac:11:00:02 REACHABLE\n"
                      "192.168.1.3 dev eth0 lladdr 01:00:5e:00:00:fb REACHABLE\n"
                      "192.168.1.255 dev eth0 lladdr ff:ff:ff:ff:ff:ff REACHABLE\n"
                      "224.0.0.251 dev eth0 lladdr 00:11:22:33:44:55 REACHABLE\n");
    auto vendors = VendorDirectory::FromText("000C29\tVMware, Inc.\n");

    NeighborTableSource source(executor, vendors, {"02:42:AC:11:00:02"});
    auto sightings = source.Discover();

    ASSERT_EQ(sightings.size(), 1u);
    const auto &neighbor = std::get<NeighborSighting>(sightings[0]);
    EXPECT_EQ(neighbor.ip, "192.168.1.1");
    EXPECT_EQ(neighbor.vendor, std::optional<std::string>("VMware, Inc."));
}

TEST(SourceParsingTests, NeighborSourceFallsBackToArp) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    executor->Respond("arp -an", 0, kArp);
    auto vendors = VendorDirectory::Empty();

    NeighborTableSource source(executor, vendors);
    auto sightings = source.Discover();

    EXPECT_EQ(sightings.size(), 2u);
    EXPECT_EQ(executor->Calls(), (std::vector<std::string>{"ip -4 neigh show", "arp -an"}));
}

TEST(SourceParsingTests, NeighborSourceWithoutToolsIsUnavailable) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    auto vendors = VendorDirectory::Empty();

    NeighborTableSource source(executor, vendors);
    EXPECT_THROW(source.Discover(), SourceUnavailable);
}

TEST(SourceParsingTests, MdnsSourceReportsMissingDaemon) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    executor->Respond("avahi-browse -a -k -p -r -t", 1, "", "Failed to create client object: Daemon not running\n");

    MdnsSource source(executor);
    EXPECT_THROW(source.Discover(), SourceUnavailable);
}

TEST(SourceParsingTests, MdnsSourceYieldsServiceSightings) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    executor->Respond("avahi-browse -a -k -p -r -t", 0, kAvahi);

    MdnsSource source(executor);
    auto sightings = source.Discover();
    ASSERT_EQ(sightings.size(), 2u);
    ASSERT_TRUE(std::holds_alternative<ServiceSighting>(sightings[1]));
    EXPECT_EQ(std::get<ServiceSighting>(sightings[1]).services, (std::vector<std::string>{"_ipp._tcp"}));

    // Raw type tags are requested from avahi rather than its display names
    EXPECT_EQ(executor->Calls(), (std::vector<std::string>{"avahi-browse -a -k -p -r -t"}));
}

TEST(SourceParsingTests, ResolverTreatsFailuresAsNoName) {
    auto executor = std::make_shared<FakeCommandExecutor>();
    executor->Respond("getent hosts 192.168.1.5", 0, "192.168.1.5 nas.lan\n");
    executor->Respond("getent hosts 192.168.1.6", 2, "");
    executor->TimeOut("getent hosts 192.168.1.7");

    GetentHostnameResolver resolver(executor);
    EXPECT_EQ(resolver.Resolve("192.168.1.5", 100ms), std::optional<std::string>("nas.lan"));
    EXPECT_FALSE(resolver.Resolve("192.168.1.6", 100ms).has_value());
    EXPECT_FALSE(resolver.Resolve("192.168.1.7", 100ms).has_value());
    EXPECT_FALSE(resolver.Resolve("192.168.1.8", 100ms).has_value());
}
