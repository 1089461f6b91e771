#pragma once
#include <string>
#include <vector>
#include <f1ml/feature_row.hpp>

namespace f1ml {

// momentum_score = form * (21 - avg_position_last_5) + points * points_per_race + wins * win_rate
struct MomentumWeights {
  double form = 1.0;
  double points = 1.0;
  double wins = 10.0;
};

// performance_index = win_rate * w + podium_rate * p + (points_per_race / 25) * q
struct PerformanceWeights {
  double win_rate = 0.4;
  double podium_rate = 0.3;
  double points = 0.3;
};

struct TransformOptions {
  MomentumWeights momentum{};
  PerformanceWeights performance{};
};

// Skewed count/rate features that get a "<name>_log" companion.
const std::vector<std::string>& log_transformed_features();

// Each stage only writes a derived feature when all of its inputs are in the row.
// Inputs are never removed.
void apply_log_transforms(FeatureRow& row);
void apply_normalization(FeatureRow& row);
void apply_differences(FeatureRow& row);
void apply_interactions(FeatureRow& row);
void apply_composites(FeatureRow& row, const TransformOptions& opt = {});

// All stages in order.
void transform_row(FeatureRow& row, const TransformOptions& opt = {});

// (grid - kGridMin) / (kGridMax - kGridMin), clamped to [0, 1].
double normalize_grid_position(double grid);

// constructor points / kConstructorPointsReference, floored at 0.
double normalize_constructor_points(double points);

} // namespace f1ml
