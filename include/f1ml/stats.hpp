#pragma once
#include <string>
#include <f1ml/event.hpp>
#include <f1ml/feature_row.hpp>
#include <f1ml/window.hpp>

namespace f1ml {

// Cumulative driver statistics before the target event.
// With no history: counts and rates are 0, position averages kNeutralPosition.
struct DriverStats {
  int wins_so_far = 0;
  double points_so_far = 0.0;
  int podiums_so_far = 0;
  int races_so_far = 0;
  double avg_position_so_far = 0.0;   // classified finishes only
  double avg_position_last_5 = 0.0;   // last kRecentFormWindow classified finishes
  double points_per_race = 0.0;
  double win_rate = 0.0;
  double podium_rate = 0.0;
};

struct ConstructorStats {
  double points_so_far = 0.0;
  int wins_so_far = 0;
  int podiums_so_far = 0;
  int races_so_far = 0;               // distinct prior events
};

// Driver history at one circuit.
struct CircuitStats {
  int wins = 0;
  int races = 0;
  int podiums = 0;
  double avg_position = 0.0;
};

struct HistoricalStats {
  DriverStats driver;
  ConstructorStats constructor;
  CircuitStats circuit;
};

DriverStats aggregate_driver_stats(const HistoricalWindow& w);
ConstructorStats aggregate_constructor_stats(const HistoricalWindow& w);
CircuitStats aggregate_circuit_stats(const HistoricalWindow& w);

// Windows for one driver at the target event, then aggregates.
HistoricalStats compute_historical_stats(const EventTable& events,
                                         const PreRaceAttributes& driver,
                                         SeasonRound target);

// Write the named statistics into a row (wins_so_far, ..., circuit_avg_position).
void add_stats_features(const HistoricalStats& s, FeatureRow& row);

} // namespace f1ml
