#pragma once
#include <optional>
#include <string>
#include <vector>

namespace f1ml {

// Ordered (season, round) key.
struct SeasonRound {
  int season = 0;
  int round = 0;
};

inline bool operator<(const SeasonRound& a, const SeasonRound& b) {
  return a.season < b.season || (a.season == b.season && a.round < b.round);
}
inline bool operator==(const SeasonRound& a, const SeasonRound& b) {
  return a.season == b.season && a.round == b.round;
}

// One driver's result/context for one (season, round). Read-only here.
struct EventRecord {
  int season = 0;
  int round = 0;
  std::string driver_code;     // e.g., "VER"
  int driver_number = 0;
  std::string constructor;
  std::string circuit_name;
  std::string country;
  std::string event_name;

  std::optional<double> grid_position;
  std::optional<double> qualifying_position;
  std::optional<double> q1_time;             // seconds
  std::optional<double> q2_time;
  std::optional<double> q3_time;
  std::optional<double> qualifying_best_time;

  std::optional<double> race_position;       // nullopt on DNF
  double points = 0.0;
  bool dnf = false;
  bool winner = false;

  std::optional<double> avg_air_temp;        // deg C
  std::optional<double> avg_track_temp;      // deg C
  std::optional<double> avg_humidity;        // %
  std::optional<double> avg_wind_speed;      // m/s
  std::optional<double> max_rainfall;        // mm
  bool had_rain = false;

  SeasonRound key() const { return SeasonRound{season, round}; }
};

using EventTable = std::vector<EventRecord>;

// Pre-race subset of an EventRecord for the event being predicted.
// Numeric fields are optional; missing values fall back to defaults.
struct PreRaceAttributes {
  std::string driver_code;
  int driver_number = 0;
  std::string constructor;
  std::string circuit_name;
  std::string country;
  std::string event_name;

  std::optional<double> grid_position;
  std::optional<double> qualifying_position;
  std::optional<double> q1_time;
  std::optional<double> q2_time;
  std::optional<double> q3_time;
  std::optional<double> qualifying_best_time;

  std::optional<double> avg_air_temp;
  std::optional<double> avg_track_temp;
  std::optional<double> avg_humidity;
  std::optional<double> avg_wind_speed;
  std::optional<double> max_rainfall;
  std::optional<bool> had_rain;
};

// The event being featurized: its key plus one attribute set per driver.
struct TargetEvent {
  SeasonRound key;
  std::vector<PreRaceAttributes> drivers;
};

// Strip outcome fields; used when featurizing historical rows for training.
PreRaceAttributes pre_race_attributes_of(const EventRecord& e);

// Group a table's rows into target events (ascending key, input order kept per event).
std::vector<TargetEvent> target_events_of(const EventTable& events);

} // namespace f1ml
