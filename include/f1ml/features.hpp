#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <f1ml/constants.hpp>
#include <f1ml/event.hpp>
#include <f1ml/feature_row.hpp>
#include <f1ml/transform.hpp>

namespace f1ml {

struct FeatureOptions {
  TransformOptions transform{};
  std::size_t encoding_modulus = kEncodingModulus;
};

// Replace malformed numeric attributes (non-finite, negative times, positions
// outside [1, 99], humidity outside [0, 100], negative rainfall) with missing.
// Returns one message per replaced field; empty when the attributes were clean.
std::vector<std::string> sanitize_attributes(PreRaceAttributes& a);

// Best qualifying lap: qualifying_best_time, else the fastest of Q1..Q3.
std::optional<double> best_qualifying_time(const PreRaceAttributes& a);

// Pole lap of the event (fastest best_qualifying_time over its drivers).
std::optional<double> pole_time_of(const std::vector<PreRaceAttributes>& drivers);

// Pre-race columns with defaults for anything missing:
// grid falls back to qualifying position then kNeutralPosition (and vice versa),
// lap times and weather to 0, the gap to pole to kUnknownQualifyingGap.
void add_pre_race_features(const PreRaceAttributes& a, SeasonRound target,
                           std::optional<double> pole_time, FeatureRow& row);

// Full pipeline for one driver: window -> stats -> transforms -> encoding.
// Only records strictly before `target` are read from `history`.
FeatureRow build_feature_row(const EventTable& history,
                             const PreRaceAttributes& driver,
                             SeasonRound target,
                             std::optional<double> pole_time,
                             const FeatureOptions& opt = {});

// Every name build_feature_row() emits, sorted.
const std::vector<std::string>& feature_catalog();

// Leakage check of the full catalog. Throws LeakageError.
void validate_feature_catalog(const std::set<std::string>& forbidden = forbidden_features_at_prediction());

} // namespace f1ml
