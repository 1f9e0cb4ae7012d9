#include "ConfidenceScorer.h"

#include "AdvertisementDecoder.h"

ConfidenceScorer::ConfidenceScorer(const ScoringPolicy& policy)
  : _policy(policy) {}

Classification ConfidenceScorer::Classify(PayloadKind kind, int score) const {
  // Unregistered wins over the generic Likely bucket
  if (kind == PayloadKind::AirTagUnregistered && score >= _policy.unregistered_min)
    return Classification::UnregisteredAirTag;

  if (kind == PayloadKind::AirTagRegistered && score >= _policy.confirmed_min)
    return Classification::ConfirmedAirTag;

  if (score >= _policy.likely_min)
    return Classification::LikelyFindMy;

  return Classification::NotATracker;
}

TrackerScore ConfidenceScorer::Score(const DecodedPayload& payload, const CadenceStats& cadence) const {
  int s = 0;

  switch (payload.kind) {
    case PayloadKind::AirTagRegistered:
      s = _policy.registered_base;
      if (cadence.matches_airtag_cadence) s += _policy.registered_cadence;
      if (payload.status && AdvertisementDecoder::StatusIsClean(*payload.status)) s += _policy.registered_status;
      if (cadence.rotation_observed) s += _policy.registered_rotation;
      break;

    case PayloadKind::AirTagUnregistered:
      s = _policy.unregistered_base;
      if (cadence.matches_airtag_cadence) s += _policy.unregistered_cadence;
      break;

    case PayloadKind::FindMyGeneric:
      s = _policy.generic_base;
      if (cadence.matches_airtag_cadence) s += _policy.generic_cadence;
      break;

    case PayloadKind::OtherBLE:
    case PayloadKind::Unknown:
    default:
      s = 0;
      break;
  }

  if (s < 0) s = 0;
  if (s > 100) s = 100;

  TrackerScore out{};
  out.score = s;
  out.classification = Classify(payload.kind, s);
  return out;
}
