#include <f1ml/transform.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <f1ml/constants.hpp>

namespace f1ml {

static bool has_all(const FeatureRow& row, std::initializer_list<const char*> names) {
  return std::all_of(names.begin(), names.end(),
                     [&](const char* n) { return row.count(n) > 0; });
}

// Worst grid slot + 1; turns positions into "higher is better".
static constexpr double kInvertBase = kGridMax + 1.0;

const std::vector<std::string>& log_transformed_features() {
  static const std::vector<std::string> names = {
    "wins_so_far",
    "win_rate",
    "points_so_far",
    "podiums_so_far",
    "points_per_race",
    "podium_rate",
    "constructor_wins_so_far",
    "constructor_points_so_far",
    "circuit_wins_history",
  };
  return names;
}

double normalize_grid_position(double grid) {
  const double t = (grid - kGridMin) / (kGridMax - kGridMin);
  return std::clamp(t, 0.0, 1.0);
}

double normalize_constructor_points(double points) {
  return std::max(0.0, points) / kConstructorPointsReference;
}

void apply_log_transforms(FeatureRow& row) {
  for (const auto& name : log_transformed_features()) {
    auto it = row.find(name);
    if (it == row.end()) continue;
    // Aggregates are non-negative; the clamp keeps log1p in its domain.
    row[name + "_log"] = std::log1p(std::max(0.0, it->second));
  }
}

void apply_normalization(FeatureRow& row) {
  if (has_all(row, {"grid_position"})) {
    row["grid_position_normalized"] = normalize_grid_position(row.at("grid_position"));
  }
  if (has_all(row, {"constructor_points_so_far"})) {
    row["constructor_points_normalized"] =
        normalize_constructor_points(row.at("constructor_points_so_far"));
  }
}

void apply_differences(FeatureRow& row) {
  if (has_all(row, {"grid_position", "qualifying_position"})) {
    row["grid_qualifying_diff"] = row.at("grid_position") - row.at("qualifying_position");
  }
  if (has_all(row, {"avg_track_temp", "avg_air_temp"})) {
    row["temp_track_air_diff"] = row.at("avg_track_temp") - row.at("avg_air_temp");
  }
  // Negative means improving (lower position is better).
  if (has_all(row, {"avg_position_last_5", "avg_position_so_far"})) {
    row["momentum_position"] = row.at("avg_position_last_5") - row.at("avg_position_so_far");
  }
}

void apply_interactions(FeatureRow& row) {
  if (has_all(row, {"grid_position", "qualifying_position"})) {
    row["grid_qualifying_interaction"] = row.at("grid_position") * row.at("qualifying_position");
  }
  if (has_all(row, {"grid_position", "avg_position_so_far"})) {
    row["historical_grid_interaction"] = row.at("grid_position") * row.at("avg_position_so_far");
  }
  if (has_all(row, {"win_rate", "constructor_wins_so_far"})) {
    row["win_rate_constructor_interaction"] =
        row.at("win_rate") * row.at("constructor_wins_so_far");
  }
  if (has_all(row, {"points_per_race", "avg_position_last_5"})) {
    row["points_recent_form_interaction"] =
        row.at("points_per_race") * (kInvertBase - row.at("avg_position_last_5"));
  }
  if (has_all(row, {"qualifying_time_from_pole", "grid_position"})) {
    row["qualifying_gap_grid_interaction"] =
        row.at("qualifying_time_from_pole") * row.at("grid_position");
  }
}

void apply_composites(FeatureRow& row, const TransformOptions& opt) {
  if (has_all(row, {"wins_so_far", "podiums_so_far"})) {
    row["win_podium_ratio"] = row.at("wins_so_far") / (std::max(0.0, row.at("podiums_so_far")) + 1.0);
  }
  if (has_all(row, {"avg_position_last_5", "points_per_race", "win_rate"})) {
    const auto& w = opt.momentum;
    row["momentum_score"] = w.form * (kInvertBase - row.at("avg_position_last_5"))
                          + w.points * row.at("points_per_race")
                          + w.wins * row.at("win_rate");
  }
  if (has_all(row, {"avg_position_so_far", "avg_position_last_5"})) {
    row["position_consistency"] =
        std::abs(row.at("avg_position_so_far") - row.at("avg_position_last_5"));
  }
  if (has_all(row, {"win_rate", "podium_rate", "points_per_race"})) {
    const auto& w = opt.performance;
    row["performance_index"] = w.win_rate * row.at("win_rate")
                             + w.podium_rate * row.at("podium_rate")
                             + w.points * (row.at("points_per_race") / 25.0);
  }
  if (has_all(row, {"grid_position"})) {
    row["grid_advantage"] = (kInvertBase - row.at("grid_position")) / kGridMax;
  }
  if (has_all(row, {"qualifying_position"})) {
    row["qualifying_advantage"] = (kInvertBase - row.at("qualifying_position")) / kGridMax;
  }
  if (has_all(row, {"races_so_far", "circuit_races_history"})) {
    row["estimated_experience"] = row.at("races_so_far") + 2.0 * row.at("circuit_races_history");
  }
}

void transform_row(FeatureRow& row, const TransformOptions& opt) {
  apply_log_transforms(row);
  apply_normalization(row);
  apply_differences(row);
  apply_interactions(row);
  apply_composites(row, opt);
}

} // namespace f1ml
