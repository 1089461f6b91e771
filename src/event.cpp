#include <f1ml/event.hpp>
#include <algorithm>
#include <map>

namespace f1ml {

PreRaceAttributes pre_race_attributes_of(const EventRecord& e) {
  PreRaceAttributes a;
  a.driver_code = e.driver_code;
  a.driver_number = e.driver_number;
  a.constructor = e.constructor;
  a.circuit_name = e.circuit_name;
  a.country = e.country;
  a.event_name = e.event_name;
  a.grid_position = e.grid_position;
  a.qualifying_position = e.qualifying_position;
  a.q1_time = e.q1_time;
  a.q2_time = e.q2_time;
  a.q3_time = e.q3_time;
  a.qualifying_best_time = e.qualifying_best_time;
  a.avg_air_temp = e.avg_air_temp;
  a.avg_track_temp = e.avg_track_temp;
  a.avg_humidity = e.avg_humidity;
  a.avg_wind_speed = e.avg_wind_speed;
  a.max_rainfall = e.max_rainfall;
  a.had_rain = e.had_rain;
  return a;
}

std::vector<TargetEvent> target_events_of(const EventTable& events) {
  std::map<SeasonRound, std::size_t> slot;
  std::vector<TargetEvent> out;
  for (const auto& e : events) {
    auto it = slot.find(e.key());
    if (it == slot.end()) {
      it = slot.emplace(e.key(), out.size()).first;
      out.push_back(TargetEvent{e.key(), {}});
    }
    out[it->second].drivers.push_back(pre_race_attributes_of(e));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const TargetEvent& a, const TargetEvent& b) { return a.key < b.key; });
  return out;
}

} // namespace f1ml
