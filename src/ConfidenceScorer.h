#pragma once

#include "ScanConfig.h"     // ScoringPolicy
#include "Track.h"          // DecodedPayload, CadenceStats, Classification

struct TrackerScore {
  int            score = 0;   // 0..100
  Classification classification = Classification::NotATracker;
};

class ConfidenceScorer {
public:
  explicit ConfidenceScorer(const ScoringPolicy& policy = ScoringPolicy{});

  TrackerScore Score(const DecodedPayload& payload, const CadenceStats& cadence) const;

  // Threshold table on its own, so (kind, score) pairs can be checked directly.
  Classification Classify(PayloadKind kind, int score) const;

  const ScoringPolicy& policy() const { return _policy; }

private:
  ScoringPolicy _policy;
};
