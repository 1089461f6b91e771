#include <f1ml/features.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>
#include <f1ml/encoder.hpp>
#include <f1ml/stats.hpp>
#include <f1ml/validation.hpp>

namespace f1ml {

namespace {

void drop_if(std::optional<double>& v, const char* name, bool bad,
             std::vector<std::string>& issues) {
  if (!v || !bad) return;
  std::ostringstream s;
  s << name << "=" << *v;
  issues.push_back(s.str());
  v.reset();
}

void check_position(std::optional<double>& v, const char* name, std::vector<std::string>& issues) {
  if (v) drop_if(v, name, !std::isfinite(*v) || *v < 1.0 || *v > 99.0, issues);
}

void check_non_negative(std::optional<double>& v, const char* name, std::vector<std::string>& issues) {
  if (v) drop_if(v, name, !std::isfinite(*v) || *v < 0.0, issues);
}

void check_finite(std::optional<double>& v, const char* name, std::vector<std::string>& issues) {
  if (v) drop_if(v, name, !std::isfinite(*v), issues);
}

} // namespace

std::vector<std::string> sanitize_attributes(PreRaceAttributes& a) {
  std::vector<std::string> issues;
  check_position(a.grid_position, "grid_position", issues);
  check_position(a.qualifying_position, "qualifying_position", issues);
  check_non_negative(a.q1_time, "q1_time", issues);
  check_non_negative(a.q2_time, "q2_time", issues);
  check_non_negative(a.q3_time, "q3_time", issues);
  check_non_negative(a.qualifying_best_time, "qualifying_best_time", issues);
  check_finite(a.avg_air_temp, "avg_air_temp", issues);
  check_finite(a.avg_track_temp, "avg_track_temp", issues);
  if (a.avg_humidity) {
    drop_if(a.avg_humidity, "avg_humidity",
            !std::isfinite(*a.avg_humidity) || *a.avg_humidity < 0.0 || *a.avg_humidity > 100.0,
            issues);
  }
  check_non_negative(a.avg_wind_speed, "avg_wind_speed", issues);
  check_non_negative(a.max_rainfall, "max_rainfall", issues);
  return issues;
}

std::optional<double> best_qualifying_time(const PreRaceAttributes& a) {
  if (a.qualifying_best_time && *a.qualifying_best_time > 0.0) return a.qualifying_best_time;
  std::optional<double> best;
  for (const auto& t : {a.q1_time, a.q2_time, a.q3_time}) {
    if (t && *t > 0.0 && (!best || *t < *best)) best = t;
  }
  return best;
}

std::optional<double> pole_time_of(const std::vector<PreRaceAttributes>& drivers) {
  std::optional<double> pole;
  for (const auto& d : drivers) {
    const auto t = best_qualifying_time(d);
    if (t && std::isfinite(*t) && (!pole || *t < *pole)) pole = t;
  }
  return pole;
}

void add_pre_race_features(const PreRaceAttributes& a, SeasonRound target,
                           std::optional<double> pole_time, FeatureRow& row) {
  row["year"] = target.season;
  row["round_number"] = target.round;
  row["driver_number"] = a.driver_number;

  const double grid = a.grid_position.value_or(a.qualifying_position.value_or(kNeutralPosition));
  const double quali = a.qualifying_position.value_or(a.grid_position.value_or(kNeutralPosition));
  row["grid_position"] = grid;
  row["qualifying_position"] = quali;

  row["q1_time"] = a.q1_time.value_or(0.0);
  row["q2_time"] = a.q2_time.value_or(0.0);
  row["q3_time"] = a.q3_time.value_or(0.0);
  const auto best = best_qualifying_time(a);
  row["qualifying_best_time"] = best.value_or(0.0);
  row["qualifying_time_from_pole"] =
      (best && pole_time) ? std::max(0.0, *best - *pole_time) : kUnknownQualifyingGap;

  row["avg_air_temp"] = a.avg_air_temp.value_or(0.0);
  row["avg_track_temp"] = a.avg_track_temp.value_or(0.0);
  row["avg_humidity"] = a.avg_humidity.value_or(0.0);
  row["avg_wind_speed"] = a.avg_wind_speed.value_or(0.0);
  const double rain = a.max_rainfall.value_or(0.0);
  row["max_rainfall"] = rain;
  row["had_rain"] = a.had_rain.value_or(rain > 0.5) ? 1.0 : 0.0;
}

FeatureRow build_feature_row(const EventTable& history,
                             const PreRaceAttributes& driver,
                             SeasonRound target,
                             std::optional<double> pole_time,
                             const FeatureOptions& opt) {
  FeatureRow row;
  add_pre_race_features(driver, target, pole_time, row);
  add_stats_features(compute_historical_stats(history, driver, target), row);
  transform_row(row, opt.transform);
  add_encoded_features(driver, row, opt.encoding_modulus);
  add_bucket_features(row);
  return row;
}

const std::vector<std::string>& feature_catalog() {
  static const std::vector<std::string> names =
      row_names(build_feature_row(EventTable{}, PreRaceAttributes{}, SeasonRound{2000, 1}, std::nullopt));
  return names;
}

void validate_feature_catalog(const std::set<std::string>& forbidden) {
  validate_no_leakage(feature_catalog(), forbidden);
}

} // namespace f1ml
