#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <f1ml/bundle.hpp>
#include <f1ml/constants.hpp>
#include <f1ml/event.hpp>
#include <f1ml/features.hpp>

namespace f1ml {

struct PredictionResult {
  std::string driver_code;
  int driver_number = 0;
  std::string constructor;
  double win_probability = 0.0;    // [0, 1]
  bool predicted_winner = false;   // win_probability > 0.5
  double predicted_position = 0.0; // [1, field size]
  double predicted_points = 0.0;   // [0, kMaxEventPoints]
  bool defaulted = false;          // attributes were malformed or featurizing failed
  std::size_t zero_filled = 0;     // schema columns zero-filled, summed over the three models
};

// Clip raw outputs to their physical domain. Idempotent and monotonic.
// NaN maps to the least favourable value: 0 for probability and points,
// the last place (field size) for position.
double clip_probability(double p);
double clip_position(double position, std::size_t field_size);
double clip_points(double points);

struct EngineOptions {
  FeatureOptions features{};
  std::size_t threads = 1;   // drivers are independent; > 1 splits them across threads
};

// Builds one feature row per driver, aligns it to each model's schema, runs
// the three models and clips. Holds only immutable state; predict() is const
// and may be called concurrently.
class PredictionEngine {
public:
  // Rejects any catalog or bundle schema that names a forbidden feature
  // (throws LeakageError).
  PredictionEngine(BundleSet bundles,
                   std::shared_ptr<const EventTable> history,
                   EngineOptions opt = {},
                   const std::set<std::string>& forbidden = forbidden_features_at_prediction());

  // One result per driver, sorted by predicted position. A driver with bad
  // attributes gets a defaulted row; the rest of the field is unaffected.
  std::vector<PredictionResult> predict(const TargetEvent& event) const;

  const BundleSet& bundles() const { return bundles_; }
  const EventTable& history() const { return *history_; }

private:
  PredictionResult predict_driver_(const PreRaceAttributes& driver,
                                   SeasonRound target,
                                   std::optional<double> pole_time,
                                   std::size_t field_size) const;

  BundleSet bundles_;
  std::shared_ptr<const EventTable> history_;
  EngineOptions opt_;
};

// Load <models_root>/current (or `version`) and build an engine. Returns
// nullptr when any bundle fails to load, so the host can run without
// predictions. LeakageError is not swallowed.
std::unique_ptr<PredictionEngine> create_prediction_engine(
    const std::filesystem::path& models_root,
    std::shared_ptr<const EventTable> history,
    EngineOptions opt = {},
    std::optional<std::string> version = std::nullopt);

} // namespace f1ml
