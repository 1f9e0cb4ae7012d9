#include <gtest/gtest.h>

#include <string>

#include "TrackNames.h"

TEST(TrackNames, ClassificationLabels) {
  EXPECT_STREQ(ClassificationName(Classification::NotATracker), "Not a Tracker");
  EXPECT_STREQ(ClassificationName(Classification::UnregisteredAirTag), "Unregistered AirTag");
  EXPECT_STREQ(ClassificationName(Classification::LikelyFindMy), "Likely Find-My Accessory");
  EXPECT_STREQ(ClassificationName(Classification::ConfirmedAirTag), "Confirmed AirTag");
}

TEST(TrackNames, ShortNamesFitRow) {
  for (Classification c : {Classification::NotATracker, Classification::UnregisteredAirTag,
                           Classification::LikelyFindMy, Classification::ConfirmedAirTag}) {
    EXPECT_LE(std::string(ClassificationShortName(c)).size(), 6u);
  }
}

TEST(TrackNames, OtherLabels) {
  EXPECT_STREQ(BatteryTierName(BatteryTier::VeryLow), "Very Low");
  EXPECT_STREQ(MovementTrendName(MovementTrend::Approaching), "Approaching");
  EXPECT_STREQ(PayloadKindName(PayloadKind::AirTagRegistered), "AirTag");
}

TEST(TrackNames, ScanModeRoundTrip) {
  for (ScanMode m : {ScanMode::Normal, ScanMode::FindMyOnly, ScanMode::Adaptive,
                     ScanMode::Calibration, ScanMode::RangeTest}) {
    ScanMode parsed = ScanMode::Normal;
    ASSERT_TRUE(ParseScanMode(ScanModeName(m), parsed)) << ScanModeName(m);
    EXPECT_EQ(parsed, m);
  }
}

TEST(TrackNames, ParseScanModeAliases) {
  ScanMode m = ScanMode::Normal;
  EXPECT_TRUE(ParseScanMode("findmyonly", m));
  EXPECT_EQ(m, ScanMode::FindMyOnly);
  EXPECT_TRUE(ParseScanMode("RANGETEST", m));
  EXPECT_EQ(m, ScanMode::RangeTest);

  EXPECT_FALSE(ParseScanMode("turbo", m));
  EXPECT_EQ(m, ScanMode::Normal);
  EXPECT_FALSE(ParseScanMode(nullptr, m));
  EXPECT_FALSE(ParseScanMode("", m));
}

TEST(TrackNames, ClassificationRoundTrip) {
  for (Classification c : {Classification::NotATracker, Classification::UnregisteredAirTag,
                           Classification::LikelyFindMy, Classification::ConfirmedAirTag}) {
    Classification parsed = Classification::NotATracker;
    ASSERT_TRUE(ParseClassification(ClassificationName(c), parsed));
    EXPECT_EQ(parsed, c);
  }

  Classification c = Classification::ConfirmedAirTag;
  EXPECT_FALSE(ParseClassification("airtag", c));
  EXPECT_EQ(c, Classification::NotATracker);
}
