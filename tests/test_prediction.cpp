#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <random>
#include <string>

#include <f1ml/errors.hpp>
#include <f1ml/prediction.hpp>

using Catch::Approx;
using namespace f1ml;
namespace fs = std::filesystem;

static ModelBundle linear_bundle(ModelKind kind, std::vector<std::string> features,
                                 std::vector<double> coef, double intercept,
                                 Link link = Link::Identity) {
  ModelBundle b;
  b.kind = kind;
  b.model = std::make_shared<const LinearModel>(std::move(coef), intercept, link);
  b.schema = FeatureSchema(std::move(features));
  b.meta.name = kind == ModelKind::Classifier ? "classifier_winner" : "regressor";
  b.meta.version = "1.2.0";
  return b;
}

// Win probability falls with grid slot; position tracks the grid; points
// fall 2 per slot from 30.
static BundleSet grid_models() {
  return BundleSet{
    linear_bundle(ModelKind::Classifier, {"grid_position_normalized"}, {-10.0}, 2.0, Link::Logistic),
    linear_bundle(ModelKind::Regressor, {"grid_position"}, {1.0}, 0.0),
    linear_bundle(ModelKind::Regressor, {"grid_position"}, {-2.0}, 30.0),
  };
}

static PreRaceAttributes entrant(const std::string& code, double grid) {
  PreRaceAttributes a;
  a.driver_code = code;
  a.constructor = "Team " + code;
  a.circuit_name = "Suzuka";
  a.grid_position = grid;
  a.qualifying_position = grid;
  return a;
}

static TargetEvent suzuka() {
  return TargetEvent{SeasonRound{2024, 4}, {entrant("NOR", 20.0), entrant("VER", 1.0), entrant("LEC", 2.0)}};
}

TEST_CASE("Clipping bounds raw model outputs") {
  REQUIRE(clip_probability(1.37) == Approx(1.0));
  REQUIRE(clip_probability(-0.2) == Approx(0.0));
  REQUIRE(clip_probability(0.42) == Approx(0.42));
  REQUIRE(clip_position(0.3, 20) == Approx(1.0));
  REQUIRE(clip_position(24.0, 20) == Approx(20.0));
  REQUIRE(clip_points(31.0) == Approx(kMaxEventPoints));
  REQUIRE(clip_points(-4.0) == Approx(0.0));

  SECTION("NaN goes to the least favourable value") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(clip_probability(nan) == Approx(0.0));
    REQUIRE(clip_position(nan, 20) == Approx(20.0));
    REQUIRE(clip_position(nan, 3) == Approx(3.0));
    REQUIRE(clip_points(nan) == Approx(0.0));
  }

  SECTION("idempotent and monotonic") {
    const double xs[] = {-5.0, -0.1, 0.0, 0.3, 0.99, 1.0, 1.7, 12.0, 19.5, 40.0};
    double prev_p = -1.0, prev_pos = 0.0, prev_pts = -1.0;
    for (double x : xs) {
      const double p = clip_probability(x);
      const double pos = clip_position(x, 20);
      const double pts = clip_points(x);
      REQUIRE(clip_probability(p) == p);
      REQUIRE(clip_position(pos, 20) == pos);
      REQUIRE(clip_points(pts) == pts);
      REQUIRE(p >= prev_p);
      REQUIRE(pos >= prev_pos);
      REQUIRE(pts >= prev_pts);
      prev_p = p;
      prev_pos = pos;
      prev_pts = pts;
    }
  }
}

TEST_CASE("Engine predicts a full field, sorted by position") {
  PredictionEngine engine(grid_models(), std::make_shared<const EventTable>());
  const auto results = engine.predict(suzuka());

  REQUIRE(results.size() == 3);
  REQUIRE(results[0].driver_code == "VER");
  REQUIRE(results[1].driver_code == "LEC");
  REQUIRE(results[2].driver_code == "NOR");

  const auto& ver = results[0];
  REQUIRE(ver.win_probability == Approx(1.0 / (1.0 + std::exp(-2.0))));
  REQUIRE(ver.predicted_winner);
  REQUIRE(ver.predicted_position == Approx(1.0));
  REQUIRE(ver.predicted_points == Approx(kMaxEventPoints));
  REQUIRE_FALSE(ver.defaulted);
  REQUIRE(ver.zero_filled == 0);

  const auto& nor = results[2];
  REQUIRE_FALSE(nor.predicted_winner);
  REQUIRE(nor.predicted_position == Approx(3.0));   // clipped to the field size
  REQUIRE(nor.predicted_points == Approx(0.0));

  for (const auto& r : results) {
    REQUIRE(r.win_probability >= 0.0);
    REQUIRE(r.win_probability <= 1.0);
  }
}

TEST_CASE("A malformed driver is defaulted without affecting the rest") {
  PredictionEngine engine(grid_models(), std::make_shared<const EventTable>());
  auto ev = suzuka();
  const auto clean = engine.predict(ev);

  auto bad = entrant("ALB", 5.0);
  bad.grid_position = -3.0;
  bad.qualifying_position = std::numeric_limits<double>::infinity();
  bad.avg_humidity = 300.0;
  ev.drivers.push_back(bad);
  const auto results = engine.predict(ev);
  REQUIRE(results.size() == 4);

  for (const auto& r : results) {
    if (r.driver_code == "ALB") {
      REQUIRE(r.defaulted);
      REQUIRE(std::isfinite(r.win_probability));
      // Grid falls back to the neutral slot, then clips to the field of four.
      REQUIRE(r.predicted_position == Approx(4.0));
    } else {
      REQUIRE_FALSE(r.defaulted);
    }
  }
  // Same win probabilities for the untouched drivers.
  REQUIRE(results[0].driver_code == clean[0].driver_code);
  REQUIRE(results[0].win_probability == Approx(clean[0].win_probability));
}

TEST_CASE("Schema columns the engine cannot produce are zero-filled and counted") {
  auto models = grid_models();
  models.points_regressor = linear_bundle(ModelKind::Regressor, {"grid_position", "tyre_age_laps"},
                                          {-2.0, 1.0}, 30.0);
  PredictionEngine engine(std::move(models), nullptr);
  const auto results = engine.predict(suzuka());
  for (const auto& r : results) REQUIRE(r.zero_filled == 1);
}

TEST_CASE("A NaN position from the regressor ranks the driver last") {
  auto models = grid_models();
  models.position_regressor = linear_bundle(ModelKind::Regressor, {"grid_position"},
                                            {std::numeric_limits<double>::quiet_NaN()}, 0.0);
  PredictionEngine engine(std::move(models), nullptr);
  const auto results = engine.predict(suzuka());
  REQUIRE(results.size() == 3);
  for (const auto& r : results) REQUIRE(r.predicted_position == Approx(3.0));
  // Ties fall back to win probability; pole sitter first.
  REQUIRE(results[0].driver_code == "VER");
}

TEST_CASE("Threaded prediction matches the sequential result") {
  TargetEvent ev{SeasonRound{2024, 4}, {}};
  for (int i = 1; i <= 20; ++i) ev.drivers.push_back(entrant("D" + std::to_string(i), double(i)));

  PredictionEngine seq(grid_models(), nullptr);
  EngineOptions opt;
  opt.threads = 4;
  PredictionEngine par(grid_models(), nullptr, opt);

  const auto a = seq.predict(ev);
  const auto b = par.predict(ev);
  REQUIRE(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    REQUIRE(a[i].driver_code == b[i].driver_code);
    REQUIRE(a[i].win_probability == b[i].win_probability);
    REQUIRE(a[i].predicted_position == b[i].predicted_position);
  }
}

TEST_CASE("An empty field yields no results") {
  PredictionEngine engine(grid_models(), nullptr);
  REQUIRE(engine.predict(TargetEvent{SeasonRound{2024, 1}, {}}).empty());
}

TEST_CASE("Engine refuses a model trained on outcome features") {
  auto models = grid_models();
  models.position_regressor = linear_bundle(ModelKind::Regressor, {"grid_position", "race_position"},
                                            {1.0, 1.0}, 0.0);
  REQUIRE_THROWS_AS(PredictionEngine(std::move(models), nullptr), LeakageError);
}

TEST_CASE("create_prediction_engine degrades to nullptr when bundles are missing") {
  const auto root = fs::temp_directory_path() / ("f1ml_engine_" + std::to_string(std::random_device{}()));
  REQUIRE(create_prediction_engine(root, nullptr) == nullptr);

  SECTION("but leakage still throws") {
    fs::create_directories(root / "v1");
    const char* leaky = "kind: regressor\nversion: 1\nfeatures: [points]\n"
                        "model: {type: linear, coefficients: [1.0]}\n";
    const char* clean = "kind: classifier\nversion: 1\nfeatures: [grid_position]\n"
                        "model: {type: linear, link: logistic, coefficients: [-0.1]}\n";
    std::ofstream(root / "v1" / kClassifierFile) << clean;
    std::ofstream(root / "v1" / kPositionRegressorFile) << leaky;
    std::ofstream(root / "v1" / kPointsRegressorFile) << leaky;
    REQUIRE_THROWS_AS(create_prediction_engine(root, nullptr, {}, std::string("v1")), LeakageError);
    fs::remove_all(root);
  }
}
