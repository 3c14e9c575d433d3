#include <gtest/gtest.h>
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

using namespace lanwatch::common;

TEST(MacAddressTests, NormalizesCaseAndSeparators) {
    EXPECT_EQ(mac::Normalize("aa:bb:cc:dd:ee:ff"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(mac::Normalize("aa-bb-cc-dd-ee-ff"), "AA:BB:CC:DD:EE:FF");
}

// macOS arp prints octets without leading zeros
TEST(MacAddressTests, PadsSingleDigitGroups) {
    EXPECT_EQ(mac::Normalize("a:b:c:d:e:f"), "0A:0B:0C:0D:0E:0F");
    EXPECT_EQ(mac::Normalize("0:1c:42:0:0:9"), "00:1C:42:00:00:09");
}

TEST(MacAddressTests, NormalizeIsIdempotent) {
    const std::string once = mac::Normalize("0:1c:42:ab:cd:e");
    EXPECT_EQ(mac::Normalize(once), once);
    EXPECT_EQ(once.size(), mac::CANONICAL_LENGTH);
}

TEST(MacAddressTests, RejectsMalformedInput) {
    EXPECT_THROW(mac::Normalize(""), FormatError);
    EXPECT_THROW(mac::Normalize("00:11:22:33:44"), FormatError);
    EXPECT_THROW(mac::Normalize("00:11:22:33:44:55:66"), FormatError);
    EXPECT_THROW(mac::Normalize("00:11:22:33:44:GG"), FormatError);
    EXPECT_THROW(mac::Normalize("001:11:22:33:44:55"), FormatError);
    EXPECT_THROW(mac::Normalize("00::22:33:44:55"), FormatError);

    EXPECT_FALSE(mac::IsValid("not a mac"));
    EXPECT_TRUE(mac::IsValid("00-11-22-33-44-55"));
}

TEST(MacAddressTests, ExtractsPrefixAndHexDigits) {
    EXPECT_EQ(mac::OuiPrefix("AA:BB:CC:DD:EE:FF"), "AABBCC");
    EXPECT_EQ(mac::StripSeparators("AA:BB:CC:DD:EE:FF"), "AABBCCDDEEFF");
}

TEST(MacAddressTests, ClassifiesSpecialAddresses) {
    EXPECT_TRUE(mac::IsZero("00:00:00:00:00:00"));
    EXPECT_TRUE(mac::IsBroadcast("FF:FF:FF:FF:FF:FF"));
    EXPECT_TRUE(mac::IsMulticast("01:00:5E:00:00:FB"));
    EXPECT_TRUE(mac::IsMulticast("33:33:00:00:00:01"));

    EXPECT_FALSE(mac::IsZero("00:11:22:33:44:55"));
    EXPECT_FALSE(mac::IsMulticast("00:11:22:33:44:55"));
    EXPECT_FALSE(mac::IsMulticast("B8:27:EB:12:34:56"));
}
