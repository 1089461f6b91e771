#include <f1ml/training.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <limits>
#include <f1ml/errors.hpp>
#include <f1ml/logging.hpp>
#include <f1ml/validation.hpp>

namespace f1ml {

TrainingSet build_training_set(const EventTable& events,
                               const FeatureOptions& opt,
                               const std::set<std::string>& forbidden) {
  TrainingSet ts;
  ts.feature_names = feature_catalog();
  validate_no_leakage(ts.feature_names, forbidden);
  validate_event_records(events);

  // Pole laps are per event; rows walk the table in time order.
  const auto events_by_key = target_events_of(events);
  std::map<SeasonRound, std::optional<double>> poles;
  for (const auto& ev : events_by_key) poles.emplace(ev.key, pole_time_of(ev.drivers));

  std::vector<const EventRecord*> ordered;
  ordered.reserve(events.size());
  for (const auto& e : events) ordered.push_back(&e);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const EventRecord* a, const EventRecord* b) { return a->key() < b->key(); });

  std::vector<FeatureRow> built;
  built.reserve(ordered.size());
  for (const EventRecord* e : ordered) {
    const PreRaceAttributes driver = pre_race_attributes_of(*e);
    const FeatureRow row = build_feature_row(events, driver, e->key(), poles.at(e->key()), opt);
    if (row.size() != ts.feature_names.size()) {
      throw DataQualityError("feature row for " + driver.driver_code +
                             " does not match the feature catalog");
    }

    std::vector<double> x;
    x.reserve(ts.feature_names.size());
    for (const auto& name : ts.feature_names) x.push_back(row_value(row, name));

    ts.rows.push_back(std::move(x));
    ts.keys.push_back(e->key());
    ts.drivers.push_back(e->driver_code);
    ts.y_winner.push_back(e->winner ? 1.0 : 0.0);
    ts.y_position.push_back((e->race_position && !e->dnf)
                              ? *e->race_position
                              : std::numeric_limits<double>::quiet_NaN());
    ts.y_points.push_back(e->points);
    built.push_back(row);
  }
  validate_feature_ranges(built);

  logger()->info("Built training set: {} rows x {} features from {} events",
                 ts.size(), ts.feature_names.size(), events_by_key.size());
  return ts;
}

} // namespace f1ml
