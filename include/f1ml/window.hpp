#pragma once
#include <string>
#include <vector>
#include <f1ml/event.hpp>

namespace f1ml {

// Time-ordered records strictly before a target (season, round).
// Only the window functions below construct one, so every record in it
// satisfies key() < target().
class HistoricalWindow {
public:
  const std::vector<EventRecord>& records() const { return records_; }
  SeasonRound target() const { return target_; }
  std::size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  auto begin() const { return records_.begin(); }
  auto end() const { return records_.end(); }

private:
  HistoricalWindow(SeasonRound target, std::vector<EventRecord> recs)
    : target_(target), records_(std::move(recs)) {}

  template <class Pred>
  friend HistoricalWindow window_if_(const EventTable& events, SeasonRound target, Pred pred);
  friend HistoricalWindow circuit_window(const HistoricalWindow& driver_window,
                                         const std::string& circuit_name);

  SeasonRound target_;
  std::vector<EventRecord> records_;
};

// All prior events of a driver: season < S, or season == S and round < R.
// Never includes the target event itself, even when present in `events`.
// Empty for a new driver.
HistoricalWindow historical_window(const EventTable& events,
                                   const std::string& driver_code,
                                   int target_season,
                                   int target_round);

// All prior entries of a constructor (every driver that raced for it).
HistoricalWindow constructor_window(const EventTable& events,
                                    const std::string& constructor,
                                    int target_season,
                                    int target_round);

// Narrow a driver window to one circuit.
HistoricalWindow circuit_window(const HistoricalWindow& driver_window,
                                const std::string& circuit_name);

// Throws DataQualityError if any record is at or after the target.
void validate_temporal_consistency(const std::vector<EventRecord>& records,
                                   int target_season,
                                   int target_round);

} // namespace f1ml
