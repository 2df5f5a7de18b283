#include <gtest/gtest.h>

#include "beacon_types.h"

namespace zonewatch {
namespace {

TEST(BeaconUuid, ParsesCanonicalText) {
  BeaconUuid u;
  ASSERT_TRUE(parseUuid("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", &u));
  EXPECT_EQ(0xE2, u.bytes[0]);
  EXPECT_EQ(0xC5, u.bytes[1]);
  EXPECT_EQ(0xDF, u.bytes[4]);
  EXPECT_EQ(0x48, u.bytes[6]);
  EXPECT_EQ(0xB0, u.bytes[8]);
  EXPECT_EQ(0xE0, u.bytes[15]);
}

TEST(BeaconUuid, LowerCaseParsesToSameValue) {
  BeaconUuid upper;
  BeaconUuid lower;
  ASSERT_TRUE(parseUuid("FDA50693-A4E2-4FB1-AFCF-C6EB07647825", &upper));
  ASSERT_TRUE(parseUuid("fda50693-a4e2-4fb1-afcf-c6eb07647825", &lower));
  EXPECT_EQ(upper, lower);
}

TEST(BeaconUuid, FormatsUpperCase) {
  BeaconUuid u;
  ASSERT_TRUE(parseUuid("fda50693-a4e2-4fb1-afcf-c6eb07647825", &u));
  char text[kUuidTextLen];
  formatUuid(u, text, sizeof(text));
  EXPECT_STREQ("FDA50693-A4E2-4FB1-AFCF-C6EB07647825", text);
}

TEST(BeaconUuid, RejectsMalformedText) {
  BeaconUuid u;
  u.bytes[0] = 0x42;
  EXPECT_FALSE(parseUuid(nullptr, &u));
  EXPECT_FALSE(parseUuid("", &u));
  EXPECT_FALSE(parseUuid("E2C56DB5DFFB48D2B060D0F5A71096E0", &u));
  EXPECT_FALSE(parseUuid("E2C56DB5-DFFB-48D2-B060-D0F5A71096E", &u));
  EXPECT_FALSE(parseUuid("E2C56DB5-DFFB-48D2-B060-D0F5A71096E00", &u));
  EXPECT_FALSE(parseUuid("E2C56DB5-DFFB-48D2-B060+D0F5A71096E0", &u));
  EXPECT_FALSE(parseUuid("G2C56DB5-DFFB-48D2-B060-D0F5A71096E0", &u));
  // Untouched on failure.
  EXPECT_EQ(0x42, u.bytes[0]);
}

TEST(BeaconIdentity, ComparesAllThreeFields) {
  BeaconIdentity a;
  ASSERT_TRUE(parseUuid("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", &a.uuid));
  a.major = 1;
  a.minor = 2;

  BeaconIdentity b = a;
  EXPECT_EQ(a, b);

  b.minor = 3;
  EXPECT_NE(a, b);

  b = a;
  b.major = 7;
  EXPECT_NE(a, b);

  b = a;
  b.uuid.bytes[15] ^= 0x01;
  EXPECT_NE(a, b);
}

}  // namespace
}  // namespace zonewatch
