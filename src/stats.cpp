#include <f1ml/stats.hpp>
#include <algorithm>
#include <set>
#include <f1ml/constants.hpp>

namespace f1ml {

static bool is_classified(const EventRecord& e) {
  return !e.dnf && e.race_position.has_value();
}

static bool is_podium(const EventRecord& e) {
  return e.race_position.has_value() && *e.race_position <= 3.0;
}

static double mean_or(const std::vector<double>& v, double fallback) {
  if (v.empty()) return fallback;
  double sum = 0.0;
  for (double x : v) sum += x;
  return sum / static_cast<double>(v.size());
}

static double rate(double num, int den) {
  return den > 0 ? num / static_cast<double>(den) : 0.0;
}

DriverStats aggregate_driver_stats(const HistoricalWindow& w) {
  DriverStats s;
  std::vector<double> finishes;
  for (const auto& e : w) {
    ++s.races_so_far;
    s.points_so_far += std::max(0.0, e.points);
    if (e.winner) ++s.wins_so_far;
    if (is_podium(e)) ++s.podiums_so_far;
    if (is_classified(e)) finishes.push_back(*e.race_position);
  }
  s.avg_position_so_far = mean_or(finishes, kNeutralPosition);

  // Window is time-ordered, so the tail is the most recent form.
  const std::size_t n = std::min(finishes.size(), kRecentFormWindow);
  std::vector<double> recent(finishes.end() - static_cast<std::ptrdiff_t>(n), finishes.end());
  s.avg_position_last_5 = mean_or(recent, kNeutralPosition);

  s.points_per_race = rate(s.points_so_far, s.races_so_far);
  s.win_rate = rate(s.wins_so_far, s.races_so_far);
  s.podium_rate = rate(s.podiums_so_far, s.races_so_far);
  return s;
}

ConstructorStats aggregate_constructor_stats(const HistoricalWindow& w) {
  ConstructorStats s;
  std::set<std::pair<int, int>> events;
  for (const auto& e : w) {
    s.points_so_far += std::max(0.0, e.points);
    if (e.winner) ++s.wins_so_far;
    if (is_podium(e)) ++s.podiums_so_far;
    events.emplace(e.season, e.round);
  }
  s.races_so_far = static_cast<int>(events.size());
  return s;
}

CircuitStats aggregate_circuit_stats(const HistoricalWindow& w) {
  CircuitStats s;
  std::vector<double> finishes;
  for (const auto& e : w) {
    ++s.races;
    if (e.winner) ++s.wins;
    if (is_podium(e)) ++s.podiums;
    if (is_classified(e)) finishes.push_back(*e.race_position);
  }
  s.avg_position = mean_or(finishes, kNeutralPosition);
  return s;
}

HistoricalStats compute_historical_stats(const EventTable& events,
                                         const PreRaceAttributes& driver,
                                         SeasonRound target) {
  HistoricalStats out;
  const auto dw = historical_window(events, driver.driver_code, target.season, target.round);
  out.driver = aggregate_driver_stats(dw);
  out.circuit = aggregate_circuit_stats(circuit_window(dw, driver.circuit_name));
  if (!driver.constructor.empty()) {
    out.constructor = aggregate_constructor_stats(
        constructor_window(events, driver.constructor, target.season, target.round));
  }
  return out;
}

void add_stats_features(const HistoricalStats& s, FeatureRow& row) {
  row["wins_so_far"] = s.driver.wins_so_far;
  row["points_so_far"] = s.driver.points_so_far;
  row["podiums_so_far"] = s.driver.podiums_so_far;
  row["races_so_far"] = s.driver.races_so_far;
  row["avg_position_so_far"] = s.driver.avg_position_so_far;
  row["avg_position_last_5"] = s.driver.avg_position_last_5;
  row["points_per_race"] = s.driver.points_per_race;
  row["win_rate"] = s.driver.win_rate;
  row["podium_rate"] = s.driver.podium_rate;

  row["constructor_points_so_far"] = s.constructor.points_so_far;
  row["constructor_wins_so_far"] = s.constructor.wins_so_far;
  row["constructor_podiums_so_far"] = s.constructor.podiums_so_far;
  row["constructor_races_so_far"] = s.constructor.races_so_far;

  row["circuit_wins_history"] = s.circuit.wins;
  row["circuit_races_history"] = s.circuit.races;
  row["circuit_podiums_history"] = s.circuit.podiums;
  row["circuit_avg_position"] = s.circuit.avg_position;
}

} // namespace f1ml
