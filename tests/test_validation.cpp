#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <f1ml/features.hpp>
#include <f1ml/validation.hpp>

using namespace f1ml;

TEST_CASE("validate_no_leakage names every outcome feature in the candidates") {
  const std::vector<std::string> candidates{"grid_position", "race_position", "win_rate", "points"};
  try {
    validate_no_leakage(candidates);
    FAIL("expected LeakageError");
  } catch (const LeakageError& e) {
    REQUIRE(e.features() == std::vector<std::string>{"points", "race_position"});
    REQUIRE(std::string(e.what()).find("race_position") != std::string::npos);
  }
}

TEST_CASE("validate_no_leakage passes iff the intersection is empty") {
  const std::set<std::string> forbidden{"winner", "dnf"};
  const std::vector<std::vector<std::string>> cases{
    {},
    {"grid_position"},
    {"winner"},
    {"a", "dnf", "b"},
    {"winner_rate", "dnf_count"},    // exact names only
    {"WINNER"},
  };
  for (const auto& c : cases) {
    const bool leaky = std::any_of(c.begin(), c.end(),
                                   [&](const std::string& n) { return forbidden.count(n) > 0; });
    if (leaky) {
      REQUIRE_THROWS_AS(validate_no_leakage(c, forbidden), LeakageError);
    } else {
      REQUIRE_NOTHROW(validate_no_leakage(c, forbidden));
    }
  }
}

TEST_CASE("Forbidden list covers race outcomes") {
  const auto& f = forbidden_features_at_prediction();
  for (const char* n : {"race_position", "final_position", "position", "points",
                        "dnf", "winner", "fastest_lap", "status"}) {
    REQUIRE(f.count(n) == 1);
  }
  REQUIRE(f.count("grid_position") == 0);
  REQUIRE(f.count("points_so_far") == 0);
}

TEST_CASE("The feature catalog is leakage-free") {
  REQUIRE_NOTHROW(validate_feature_catalog());
  REQUIRE_FALSE(feature_catalog().empty());
  REQUIRE(std::is_sorted(feature_catalog().begin(), feature_catalog().end()));

  SECTION("a stricter forbidden set is still enforced") {
    REQUIRE_THROWS_AS(validate_feature_catalog({"grid_position"}), LeakageError);
  }
}

TEST_CASE("check_feature_ranges reports out-of-range and non-finite values") {
  const std::vector<FeatureRow> clean{
    {{"grid_position", 1.0}, {"win_rate", 0.0}, {"avg_air_temp", 25.0}},
    {{"grid_position", 20.0}, {"win_rate", 1.0}, {"avg_track_temp", 55.0}},
  };
  REQUIRE(check_feature_ranges(clean).empty());
  REQUIRE_NOTHROW(validate_feature_ranges(clean));

  const std::vector<FeatureRow> bad{
    {{"grid_position", 21.0}},
    {{"win_rate", 1.5}, {"avg_air_temp", -20.0}},
    {{"points_per_race", std::numeric_limits<double>::quiet_NaN()}},
  };
  const auto issues = check_feature_ranges(bad);
  REQUIRE(issues.size() == 4);
  REQUIRE(issues[0].find("grid_position") != std::string::npos);
  REQUIRE(issues.back().find("points_per_race") != std::string::npos);
  REQUIRE_THROWS_AS(validate_feature_ranges(bad), DataQualityError);
}

TEST_CASE("validate_required_features lists what is missing") {
  const std::vector<std::string> available{"grid_position", "win_rate"};
  REQUIRE_NOTHROW(validate_required_features(available, {"win_rate"}));
  REQUIRE_THROWS_AS(validate_required_features(available, {"win_rate", "circuit_avg_position"}),
                    DataQualityError);
}

static EventRecord classified(const std::string& driver, int number, std::optional<double> pos, double points) {
  EventRecord e;
  e.season = 2024;
  e.round = 8;
  e.driver_code = driver;
  e.driver_number = number;
  e.race_position = pos;
  e.points = points;
  e.winner = pos && *pos == 1.0;
  e.dnf = !pos.has_value();
  return e;
}

TEST_CASE("check_event_records accepts a consistent result table") {
  const EventTable events{
    classified("VER", 1, 1.0, 26.0),
    classified("NOR", 4, 2.0, 18.0),
    classified("ALB", 23, std::nullopt, 0.0),
  };
  REQUIRE(check_event_records(events).empty());
  REQUIRE_NOTHROW(validate_event_records(events));
}

TEST_CASE("check_event_records flags each inconsistency") {
  SECTION("winner flag without first place") {
    auto e = classified("NOR", 4, 2.0, 18.0);
    e.winner = true;
    const auto issues = check_event_records({e});
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].find("winner flag") != std::string::npos);
  }

  SECTION("first place without winner flag") {
    auto e = classified("VER", 1, 1.0, 25.0);
    e.winner = false;
    REQUIRE(check_event_records({e}).size() == 1);
  }

  SECTION("winner short of the win points") {
    const auto issues = check_event_records({classified("VER", 1, 1.0, 18.0)});
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].find("18") != std::string::npos);
  }

  SECTION("points outside [0, 26]") {
    REQUIRE(check_event_records({classified("NOR", 4, 2.0, 30.0)}).size() == 1);
    REQUIRE(check_event_records({classified("NOR", 4, 2.0, -1.0)}).size() == 1);
  }

  SECTION("driver number outside 1..99") {
    REQUIRE(check_event_records({classified("NOR", 0, 2.0, 18.0)}).size() == 1);
    REQUIRE(check_event_records({classified("NOR", 100, 2.0, 18.0)}).size() == 1);
  }

  SECTION("validate throws DataQualityError") {
    REQUIRE_THROWS_AS(validate_event_records({classified("VER", 1, 1.0, 10.0)}), DataQualityError);
  }
}

TEST_CASE("A top-10 qualifier without a Q3 time is only a warning") {
  auto e = classified("PIA", 81, 3.0, 15.0);
  e.qualifying_position = 7.0;

  std::vector<std::string> warnings;
  REQUIRE(check_event_records({e}, &warnings).empty());
  REQUIRE(warnings.size() == 1);
  REQUIRE(warnings[0].find("Q3") != std::string::npos);
  REQUIRE_NOTHROW(validate_event_records({e}));

  SECTION("no warning with a Q3 lap or outside the top ten") {
    warnings.clear();
    e.q3_time = 88.1;
    auto slow = classified("STR", 18, 12.0, 0.0);
    slow.qualifying_position = 14.0;
    REQUIRE(check_event_records({e, slow}, &warnings).empty());
    REQUIRE(warnings.empty());
  }
}
