#pragma once
#include <set>
#include <string>
#include <vector>
#include <f1ml/constants.hpp>
#include <f1ml/event.hpp>
#include <f1ml/features.hpp>

namespace f1ml {

// Feature matrix and targets handed to an external trainer.
struct TrainingSet {
  std::vector<std::string> feature_names;   // column order of every row
  std::vector<std::vector<double>> rows;
  std::vector<SeasonRound> keys;            // per row
  std::vector<std::string> drivers;         // per row
  std::vector<double> y_winner;             // 1 or 0
  std::vector<double> y_position;           // NaN when not classified
  std::vector<double> y_points;

  std::size_t size() const { return rows.size(); }
};

// Featurize every record of `events` from its pre-race attributes and the
// history strictly before its own (season, round). Outcome fields only ever
// reach the y_* vectors. The feature names are checked against `forbidden`
// before anything is built; throws LeakageError on a hit. Inconsistent
// records and out-of-range feature rows throw DataQualityError.
TrainingSet build_training_set(const EventTable& events,
                               const FeatureOptions& opt = {},
                               const std::set<std::string>& forbidden = forbidden_features_at_prediction());

} // namespace f1ml
