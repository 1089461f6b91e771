#include <f1ml/event_csv.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <f1ml/logging.hpp>
#include "strings.hpp"

namespace f1ml {

namespace {

using detail::trim;
using detail::lower;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      if (quoted && i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
      else quoted = !quoted;
    } else if (c == ',' && !quoted) {
      cols.push_back(trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  cols.push_back(trim(cur));
  return cols;
}

// Header name -> column index.
using Header = std::unordered_map<std::string, std::size_t>;

Header make_header(const std::vector<std::string>& cols) {
  Header h;
  for (std::size_t i = 0; i < cols.size(); ++i) h.emplace(lower(cols[i]), i);
  return h;
}

bool is_missing(const std::string& s) {
  if (s.empty()) return true;
  const auto l = lower(s);
  return l == "nan" || l == "none" || l == "null" || l == "na";
}

// Cell lookup for one parsed row.
class Row {
public:
  Row(const Header& h, const std::vector<std::string>& cols) : h_(h), cols_(cols) {}

  bool has(const char* name) const {
    auto it = h_.find(name);
    return it != h_.end() && it->second < cols_.size() && !is_missing(cols_[it->second]);
  }

  std::string text(const char* name) const {
    return has(name) ? cols_[h_.at(name)] : std::string{};
  }

  // nullopt when absent; `ok` false when present but not a number.
  std::optional<double> number(const char* name, bool& ok) const {
    ok = true;
    if (!has(name)) return std::nullopt;
    const std::string& s = cols_[h_.at(name)];
    try {
      std::size_t idx = 0;
      const double v = std::stod(s, &idx);
      if (idx != s.size()) { ok = false; return std::nullopt; }
      return v;
    } catch (const std::exception&) {
      ok = false;
      return std::nullopt;
    }
  }

  std::optional<bool> flag(const char* name, bool& ok) const {
    ok = true;
    if (!has(name)) return std::nullopt;
    const auto l = lower(cols_[h_.at(name)]);
    if (l == "1" || l == "1.0" || l == "true" || l == "yes") return true;
    if (l == "0" || l == "0.0" || l == "false" || l == "no") return false;
    ok = false;
    return std::nullopt;
  }

private:
  const Header& h_;
  const std::vector<std::string>& cols_;
};

// Lenient numeric read: a bad cell is reported and treated as missing.
std::optional<double> lenient(const Row& r, const char* name, const std::string& who) {
  bool ok = true;
  auto v = r.number(name, ok);
  if (!ok) logger()->warn("Malformed attribute '{}' for driver '{}'; treating as missing", name, who);
  return v;
}

// Whole numbers within int range only; "2023.9", "1e12" and "inf" are unparsable.
std::optional<int> parse_int_cell(const Row& r, const char* name) {
  bool ok = true;
  auto v = r.number(name, ok);
  if (!ok || !v || !std::isfinite(*v) || std::trunc(*v) != *v) return std::nullopt;
  if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
  return static_cast<int>(*v);
}

template <class Fn>
void for_each_data_row(std::istream& in, Fn&& fn) {
  std::string line;
  std::optional<Header> header;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = split_csv_line(raw);
    if (!header) { header = make_header(cols); continue; }
    fn(Row(*header, cols));
  }
}

std::optional<EventRecord> parse_event_row(const Row& r) {
  const auto season = parse_int_cell(r, "year");
  const auto round = parse_int_cell(r, "round_number");
  const std::string driver = r.text("driver_code");
  if (!season || !round || driver.empty()) return std::nullopt;

  EventRecord e;
  e.season = *season;
  e.round = *round;
  e.driver_code = driver;
  e.driver_number = parse_int_cell(r, "driver_number").value_or(0);
  e.constructor = r.text("constructor");
  e.circuit_name = r.text("circuit_name");
  e.country = r.text("country");
  e.event_name = r.text("event_name");

  bool ok = true;
  auto num = [&](const char* name) {
    bool cell_ok = true;
    auto v = r.number(name, cell_ok);
    ok = ok && cell_ok;
    return v;
  };
  auto flag = [&](const char* name) {
    bool cell_ok = true;
    auto v = r.flag(name, cell_ok);
    ok = ok && cell_ok;
    return v.value_or(false);
  };

  e.grid_position = num("grid_position");
  e.qualifying_position = num("qualifying_position");
  e.q1_time = num("q1_time");
  e.q2_time = num("q2_time");
  e.q3_time = num("q3_time");
  e.qualifying_best_time = num("qualifying_best_time");
  e.race_position = num("race_position");
  e.points = num("points").value_or(0.0);
  e.dnf = flag("dnf");
  e.winner = flag("winner");
  e.avg_air_temp = num("avg_air_temp");
  e.avg_track_temp = num("avg_track_temp");
  e.avg_humidity = num("avg_humidity");
  e.avg_wind_speed = num("avg_wind_speed");
  e.max_rainfall = num("max_rainfall");
  e.had_rain = flag("had_rain");
  if (!ok) return std::nullopt;

  // Winner flag follows the classified position when the column is absent.
  if (!r.has("winner") && e.race_position && !e.dnf) e.winner = (*e.race_position == 1.0);
  return e;
}

} // namespace

EventTable event_table_from_csv_stream(std::istream& in) {
  EventTable out;
  std::size_t skipped = 0;
  for_each_data_row(in, [&](const Row& r) {
    if (auto e = parse_event_row(r)) out.push_back(std::move(*e));
    else ++skipped;
  });
  if (skipped > 0) logger()->warn("Skipped {} invalid event rows", skipped);
  return out;
}

std::optional<EventTable> load_event_table_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  auto table = event_table_from_csv_stream(f);
  logger()->info("Loaded {} event rows from {}", table.size(), path);
  return table;
}

std::optional<TargetEvent> target_event_from_csv_stream(std::istream& in) {
  std::optional<TargetEvent> out;
  for_each_data_row(in, [&](const Row& r) {
    const auto season = parse_int_cell(r, "year");
    const auto round = parse_int_cell(r, "round_number");
    const std::string driver = r.text("driver_code");
    if (!season || !round || driver.empty()) {
      logger()->warn("Skipping pre-race row without year/round_number/driver_code");
      return;
    }
    const SeasonRound key{*season, *round};
    if (!out) out = TargetEvent{key, {}};
    if (!(out->key == key)) {
      logger()->warn("Skipping driver '{}' from {}/{}; expected {}/{}",
                     driver, key.season, key.round, out->key.season, out->key.round);
      return;
    }

    PreRaceAttributes a;
    a.driver_code = driver;
    a.driver_number = parse_int_cell(r, "driver_number").value_or(0);
    a.constructor = r.text("constructor");
    a.circuit_name = r.text("circuit_name");
    a.country = r.text("country");
    a.event_name = r.text("event_name");
    a.grid_position = lenient(r, "grid_position", driver);
    a.qualifying_position = lenient(r, "qualifying_position", driver);
    a.q1_time = lenient(r, "q1_time", driver);
    a.q2_time = lenient(r, "q2_time", driver);
    a.q3_time = lenient(r, "q3_time", driver);
    a.qualifying_best_time = lenient(r, "qualifying_best_time", driver);
    a.avg_air_temp = lenient(r, "avg_air_temp", driver);
    a.avg_track_temp = lenient(r, "avg_track_temp", driver);
    a.avg_humidity = lenient(r, "avg_humidity", driver);
    a.avg_wind_speed = lenient(r, "avg_wind_speed", driver);
    a.max_rainfall = lenient(r, "max_rainfall", driver);
    bool ok = true;
    a.had_rain = r.flag("had_rain", ok);
    if (!ok) logger()->warn("Malformed attribute 'had_rain' for driver '{}'; treating as missing", driver);
    out->drivers.push_back(std::move(a));
  });
  if (out && out->drivers.empty()) return std::nullopt;
  return out;
}

std::optional<TargetEvent> load_target_event_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return target_event_from_csv_stream(f);
}

} // namespace f1ml
