#include <gtest/gtest.h>

#include "AdvertisementDecoder.h"
#include "ConfidenceScorer.h"
#include "TestAdvertisements.h"

static DecodedPayload Registered(uint8_t status) {
  DecodedPayload p{};
  p.kind = PayloadKind::AirTagRegistered;
  p.status = status;
  return p;
}

static DecodedPayload OfKind(PayloadKind kind) {
  DecodedPayload p{};
  p.kind = kind;
  return p;
}

static CadenceStats Cadence(bool matches, bool rotated = false) {
  CadenceStats c{};
  c.matches_airtag_cadence = matches;
  c.rotation_observed = rotated;
  return c;
}

TEST(ConfidenceScorer, RegisteredTable) {
  ConfidenceScorer sc;

  TrackerScore s = sc.Score(Registered(0x00), Cadence(false));
  EXPECT_EQ(s.score, 70);
  EXPECT_EQ(s.classification, Classification::LikelyFindMy);

  s = sc.Score(Registered(0x00), Cadence(true));
  EXPECT_EQ(s.score, 85);
  EXPECT_EQ(s.classification, Classification::ConfirmedAirTag);

  s = sc.Score(Registered(0x00), Cadence(true, true));
  EXPECT_EQ(s.score, 90);
  EXPECT_EQ(s.classification, Classification::ConfirmedAirTag);

  // reserved bit set: no status bonus
  s = sc.Score(Registered(0x20), Cadence(true));
  EXPECT_EQ(s.score, 75);
  EXPECT_EQ(s.classification, Classification::LikelyFindMy);

  s = sc.Score(OfKind(PayloadKind::AirTagRegistered), Cadence(false));
  EXPECT_EQ(s.score, 60);
  EXPECT_EQ(s.classification, Classification::LikelyFindMy);
}

TEST(ConfidenceScorer, UnregisteredTable) {
  ConfidenceScorer sc;

  TrackerScore s = sc.Score(OfKind(PayloadKind::AirTagUnregistered), Cadence(false));
  EXPECT_EQ(s.score, 45);
  EXPECT_EQ(s.classification, Classification::UnregisteredAirTag);

  s = sc.Score(OfKind(PayloadKind::AirTagUnregistered), Cadence(true));
  EXPECT_EQ(s.score, 60);
  EXPECT_EQ(s.classification, Classification::UnregisteredAirTag);
}

TEST(ConfidenceScorer, GenericTable) {
  ConfidenceScorer sc;

  TrackerScore s = sc.Score(OfKind(PayloadKind::FindMyGeneric), Cadence(false));
  EXPECT_EQ(s.score, 35);
  EXPECT_EQ(s.classification, Classification::NotATracker);

  s = sc.Score(OfKind(PayloadKind::FindMyGeneric), Cadence(true, true));
  EXPECT_EQ(s.score, 45);
  EXPECT_EQ(s.classification, Classification::NotATracker);
}

TEST(ConfidenceScorer, NonTrackersScoreZero) {
  ConfidenceScorer sc;
  for (PayloadKind k : {PayloadKind::Unknown, PayloadKind::OtherBLE}) {
    const TrackerScore s = sc.Score(OfKind(k), Cadence(true, true));
    EXPECT_EQ(s.score, 0);
    EXPECT_EQ(s.classification, Classification::NotATracker);
  }
}

TEST(ConfidenceScorer, CadenceNeverLowersScore) {
  ConfidenceScorer sc;
  for (PayloadKind k : {PayloadKind::Unknown, PayloadKind::AirTagRegistered, PayloadKind::AirTagUnregistered,
                        PayloadKind::FindMyGeneric, PayloadKind::OtherBLE}) {
    DecodedPayload p = OfKind(k);
    p.status = 0x00;
    EXPECT_GE(sc.Score(p, Cadence(true)).score, sc.Score(p, Cadence(false)).score);
  }
}

TEST(ConfidenceScorer, ScoreIsClamped) {
  ScoringPolicy high{};
  high.registered_base = 200;
  EXPECT_EQ(ConfidenceScorer(high).Score(Registered(0x00), Cadence(true)).score, 100);

  ScoringPolicy low{};
  low.generic_base = -40;
  EXPECT_EQ(ConfidenceScorer(low).Score(OfKind(PayloadKind::FindMyGeneric), Cadence(false)).score, 0);
}

TEST(ConfidenceScorer, ClassifyThresholds) {
  ConfidenceScorer sc;

  EXPECT_EQ(sc.Classify(PayloadKind::AirTagRegistered, 80), Classification::ConfirmedAirTag);
  EXPECT_EQ(sc.Classify(PayloadKind::AirTagRegistered, 79), Classification::LikelyFindMy);
  EXPECT_EQ(sc.Classify(PayloadKind::AirTagRegistered, 50), Classification::LikelyFindMy);
  EXPECT_EQ(sc.Classify(PayloadKind::AirTagRegistered, 49), Classification::NotATracker);

  EXPECT_EQ(sc.Classify(PayloadKind::AirTagUnregistered, 100), Classification::UnregisteredAirTag);
  EXPECT_EQ(sc.Classify(PayloadKind::AirTagUnregistered, 45), Classification::UnregisteredAirTag);
  EXPECT_EQ(sc.Classify(PayloadKind::AirTagUnregistered, 44), Classification::NotATracker);

  // only a registered AirTag can be Confirmed
  EXPECT_EQ(sc.Classify(PayloadKind::FindMyGeneric, 100), Classification::LikelyFindMy);
  EXPECT_EQ(sc.Classify(PayloadKind::FindMyGeneric, 49), Classification::NotATracker);
  EXPECT_EQ(sc.Classify(PayloadKind::OtherBLE, 0), Classification::NotATracker);
}

TEST(ConfidenceScorer, EndToEndFromDecodedStatus) {
  ConfidenceScorer sc;
  AdvertisementDecoder dec;
  const DecodedPayload p = dec.Decode(RegisteredPayload(0x00), TEST_APPLE_ID);
  EXPECT_EQ(sc.Score(p, Cadence(true)).score, 85);
}
