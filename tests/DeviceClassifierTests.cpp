#include <gtest/gtest.h>
#include "../discovery/DeviceClassifier.hpp"

using namespace lanwatch::discovery;

TEST(DeviceClassifierTests, HostnameKeywordsGiveTypeAndHints) {
    auto c = Infer(std::nullopt, std::string("Johns-iPhone"));
    EXPECT_EQ(c.type, DeviceType::Phone);
    EXPECT_EQ(c.os_hint, std::optional<std::string>("iOS"));
    EXPECT_EQ(c.model_hint, std::optional<std::string>("iPhone"));

    EXPECT_EQ(Infer(std::nullopt, std::string("office-laserjet")).type, DeviceType::Printer);
    EXPECT_EQ(Infer(std::nullopt, std::string("raspberrypi")).type, DeviceType::IoT);
    EXPECT_EQ(Infer(std::nullopt, std::string("Living-Room-Roku")).type, DeviceType::TV);
}

TEST(DeviceClassifierTests, MdnsNameIsConsultedWhenHostnameSaysNothing) {
    auto c = Infer(std::nullopt, std::string("host-17"), {}, std::string("Kitchen HomePod"));
    EXPECT_EQ(c.type, DeviceType::Speaker);
    EXPECT_EQ(c.model_hint, std::optional<std::string>("HomePod"));
}

TEST(DeviceClassifierTests, ServicesUsedWithoutNameMatch) {
    EXPECT_EQ(Infer(std::nullopt, std::nullopt, {"_ipp._tcp"}).type, DeviceType::Printer);
    EXPECT_EQ(Infer(std::nullopt, std::nullopt, {"_googlecast._tcp"}).type, DeviceType::TV);
    // First listed service decides
    EXPECT_EQ(Infer(std::nullopt, std::nullopt, {"_raop._tcp", "_airplay._tcp"}).type, DeviceType::Speaker);
}

TEST(DeviceClassifierTests, VendorIsTheLastResort) {
    EXPECT_EQ(Infer(std::string("Espressif Inc."), std::nullopt).type, DeviceType::IoT);
    EXPECT_EQ(Infer(std::string("Sonos, Inc."), std::nullopt).type, DeviceType::Speaker);
    EXPECT_EQ(Infer(std::string("Apple, Inc."), std::nullopt).type, DeviceType::Laptop);
    EXPECT_EQ(Infer(std::string("NETGEAR"), std::nullopt).type, DeviceType::Router);
}

TEST(DeviceClassifierTests, PriorityIsNameThenServicesThenVendor) {
    // Apple vendor alone says laptop; the hostname wins
    EXPECT_EQ(Infer(std::string("Apple, Inc."), std::string("Annas-iPad")).type, DeviceType::Tablet);
    // Services beat vendor
    EXPECT_EQ(Infer(std::string("Apple, Inc."), std::nullopt, {"_companion-link._tcp"}).type, DeviceType::Phone);
    // Name beats services
    EXPECT_EQ(Infer(std::nullopt, std::string("den-xbox"), {"_ipp._tcp"}).type, DeviceType::Gaming);
}

TEST(DeviceClassifierTests, NothingKnownIsUnknown) {
    auto c = Infer(std::nullopt, std::nullopt);
    EXPECT_EQ(c.type, DeviceType::Unknown);
    EXPECT_FALSE(c.os_hint.has_value());
    EXPECT_FALSE(c.model_hint.has_value());

    EXPECT_EQ(Infer(std::string("Acme Widgets"), std::string("host-17"), {"_http._tcp"}).type, DeviceType::Unknown);
}

TEST(DeviceClassifierTests, IsDeterministic) {
    auto a = Infer(std::string("Samsung Electronics"), std::string("galaxy-s21"), {"_spotify-connect._tcp"});
    auto b = Infer(std::string("Samsung Electronics"), std::string("galaxy-s21"), {"_spotify-connect._tcp"});
    EXPECT_EQ(a.type, b.type);
    EXPECT_EQ(a.os_hint, b.os_hint);
    EXPECT_EQ(a.model_hint, b.model_hint);
}
