#include <f1ml/validation.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <f1ml/constants.hpp>
#include <f1ml/logging.hpp>

namespace f1ml {

const std::set<std::string>& forbidden_features_at_prediction() {
  static const std::set<std::string> names = {
    // Race results
    "race_position",
    "final_position",
    "position",
    "points",
    "dnf",
    "winner",
    "fastest_lap",
    "fastest_lap_time",
    "fastest_lap_rank",
    "race_time",
    "time_retired",
    "laps_completed",
    "status",
    // Derived from the result
    "podium",
    "points_scored",
    "finished",
    "classified",
  };
  return names;
}

void validate_no_leakage(const std::vector<std::string>& candidates,
                         const std::set<std::string>& forbidden) {
  std::set<std::string> leaked;
  for (const auto& c : candidates) {
    if (forbidden.count(c)) leaked.insert(c);
  }
  if (leaked.empty()) return;

  std::ostringstream msg;
  msg << "Data leakage: " << leaked.size()
      << " outcome feature(s) in candidate set:";
  for (const auto& f : leaked) msg << " " << f;
  logger()->error(msg.str());
  throw LeakageError(msg.str(), std::vector<std::string>(leaked.begin(), leaked.end()));
}

void validate_no_leakage(const std::vector<std::string>& candidates) {
  validate_no_leakage(candidates, forbidden_features_at_prediction());
}

static void check_range(const FeatureRow& row, std::size_t idx, const char* name,
                        double lo, double hi, std::vector<std::string>& issues) {
  auto it = row.find(name);
  if (it == row.end() || !std::isfinite(it->second)) return;
  if (it->second < lo || it->second > hi) {
    std::ostringstream s;
    s << "row " << idx << ": " << name << "=" << it->second
      << " outside [" << lo << ", " << hi << "]";
    issues.push_back(s.str());
  }
}

std::vector<std::string> check_feature_ranges(const std::vector<FeatureRow>& rows) {
  std::vector<std::string> issues;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& row = rows[i];
    check_range(row, i, "grid_position", kGridMin, kGridMax, issues);
    check_range(row, i, "qualifying_position", kGridMin, kGridMax, issues);
    check_range(row, i, "win_rate", 0.0, 1.0, issues);
    check_range(row, i, "avg_air_temp", -10.0, 60.0, issues);
    check_range(row, i, "avg_track_temp", -10.0, 60.0, issues);
    for (const auto& name : non_finite_features(row)) {
      issues.push_back("row " + std::to_string(i) + ": " + name + " is not finite");
    }
  }
  return issues;
}

void validate_feature_ranges(const std::vector<FeatureRow>& rows) {
  const auto issues = check_feature_ranges(rows);
  if (issues.empty()) return;
  std::ostringstream msg;
  msg << "Data quality: " << issues.size() << " problem(s)";
  for (const auto& i : issues) msg << "\n  - " << i;
  logger()->error(msg.str());
  throw DataQualityError(msg.str());
}

void validate_required_features(const std::vector<std::string>& available,
                                const std::vector<std::string>& required) {
  std::vector<std::string> missing;
  for (const auto& r : required) {
    if (std::find(available.begin(), available.end(), r) == available.end()) missing.push_back(r);
  }
  if (missing.empty()) return;
  std::ostringstream msg;
  msg << "Missing " << missing.size() << " required feature(s):";
  for (const auto& m : missing) msg << " " << m;
  logger()->error(msg.str());
  throw DataQualityError(msg.str());
}

static std::string record_label(const EventRecord& e) {
  std::ostringstream s;
  s << e.season << "/" << e.round << " " << (e.driver_code.empty() ? "?" : e.driver_code);
  return s.str();
}

std::vector<std::string> check_event_records(const EventTable& events,
                                             std::vector<std::string>* warnings) {
  std::vector<std::string> issues;
  for (const auto& e : events) {
    const bool first = e.race_position && *e.race_position == 1.0;
    std::ostringstream s;
    if (e.winner && !first) {
      s << record_label(e) << ": winner flag set but race_position is ";
      if (e.race_position) s << *e.race_position;
      else s << "missing";
      issues.push_back(s.str());
    } else if (!e.winner && first) {
      issues.push_back(record_label(e) + ": race_position is 1 but winner flag is not set");
    }
    if (first && !e.dnf && e.points < kWinPoints) {
      s.str("");
      s << record_label(e) << ": winner scored " << e.points << " points, expected at least " << kWinPoints;
      issues.push_back(s.str());
    }
    if (!std::isfinite(e.points) || e.points < 0.0 || e.points > kMaxEventPoints) {
      s.str("");
      s << record_label(e) << ": points=" << e.points << " outside [0, " << kMaxEventPoints << "]";
      issues.push_back(s.str());
    }
    if (e.driver_number < kDriverNumberMin || e.driver_number > kDriverNumberMax) {
      s.str("");
      s << record_label(e) << ": driver_number=" << e.driver_number
        << " outside [" << kDriverNumberMin << ", " << kDriverNumberMax << "]";
      issues.push_back(s.str());
    }
    if (warnings && e.qualifying_position && *e.qualifying_position <= kQ3Cutoff && !e.q3_time) {
      s.str("");
      s << record_label(e) << ": qualified P" << *e.qualifying_position << " without a Q3 time";
      warnings->push_back(s.str());
    }
  }
  return issues;
}

void validate_event_records(const EventTable& events) {
  std::vector<std::string> warnings;
  const auto issues = check_event_records(events, &warnings);
  for (const auto& w : warnings) logger()->warn(w);
  if (issues.empty()) return;
  std::ostringstream msg;
  msg << "Data quality: " << issues.size() << " inconsistent event record(s)";
  for (const auto& i : issues) msg << "\n  - " << i;
  logger()->error(msg.str());
  throw DataQualityError(msg.str());
}

} // namespace f1ml
