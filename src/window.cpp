#include <f1ml/window.hpp>
#include <algorithm>
#include <set>
#include <sstream>
#include <f1ml/errors.hpp>
#include <f1ml/logging.hpp>

namespace f1ml {

template <class Pred>
HistoricalWindow window_if_(const EventTable& events, SeasonRound target, Pred pred) {
  std::vector<EventRecord> recs;
  for (const auto& e : events) {
    if (e.key() < target && pred(e)) recs.push_back(e);
  }
  // Input order is kept within one (season, round).
  std::stable_sort(recs.begin(), recs.end(),
                   [](const EventRecord& a, const EventRecord& b) { return a.key() < b.key(); });
  return HistoricalWindow(target, std::move(recs));
}

HistoricalWindow historical_window(const EventTable& events,
                                   const std::string& driver_code,
                                   int target_season,
                                   int target_round) {
  auto w = window_if_(events, SeasonRound{target_season, target_round},
                      [&](const EventRecord& e) { return e.driver_code == driver_code; });
  if (w.empty()) {
    logger()->debug("No history for driver '{}' before {}/{}", driver_code, target_season, target_round);
  }
  return w;
}

HistoricalWindow constructor_window(const EventTable& events,
                                    const std::string& constructor,
                                    int target_season,
                                    int target_round) {
  return window_if_(events, SeasonRound{target_season, target_round},
                    [&](const EventRecord& e) { return e.constructor == constructor; });
}

HistoricalWindow circuit_window(const HistoricalWindow& driver_window,
                                const std::string& circuit_name) {
  std::vector<EventRecord> recs;
  for (const auto& e : driver_window) {
    if (e.circuit_name == circuit_name) recs.push_back(e);
  }
  return HistoricalWindow(driver_window.target(), std::move(recs));
}

void validate_temporal_consistency(const std::vector<EventRecord>& records,
                                   int target_season,
                                   int target_round) {
  const SeasonRound target{target_season, target_round};
  std::set<std::pair<int, int>> future;
  for (const auto& e : records) {
    if (!(e.key() < target)) future.emplace(e.season, e.round);
  }
  if (future.empty()) return;

  std::ostringstream msg;
  msg << "Temporal inconsistency: " << future.size()
      << " event(s) at or after " << target_season << "/" << target_round << ":";
  for (const auto& [s, r] : future) msg << " " << s << "/" << r;
  logger()->error(msg.str());
  throw DataQualityError(msg.str());
}

} // namespace f1ml
