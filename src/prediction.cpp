#include <f1ml/prediction.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <initializer_list>
#include <thread>
#include <f1ml/errors.hpp>
#include <f1ml/logging.hpp>
#include <f1ml/validation.hpp>

namespace f1ml {

static inline double clamp_to(double x, double lo, double hi) {
  if (std::isnan(x)) return lo;
  return x < lo ? lo : (x > hi ? hi : x);
}

double clip_probability(double p) {
  return clamp_to(p, 0.0, 1.0);
}

double clip_position(double position, std::size_t field_size) {
  const double hi = static_cast<double>(std::max<std::size_t>(1, field_size));
  // A broken regressor output ranks last, not first.
  if (std::isnan(position)) return hi;
  return clamp_to(position, 1.0, hi);
}

double clip_points(double points) {
  return clamp_to(points, 0.0, kMaxEventPoints);
}

PredictionEngine::PredictionEngine(BundleSet bundles,
                                   std::shared_ptr<const EventTable> history,
                                   EngineOptions opt,
                                   const std::set<std::string>& forbidden)
  : bundles_(std::move(bundles)),
    history_(history ? std::move(history) : std::make_shared<const EventTable>()),
    opt_(opt) {
  validate_no_leakage(feature_catalog(), forbidden);
  for (const ModelBundle* b : {&bundles_.classifier, &bundles_.position_regressor, &bundles_.points_regressor}) {
    if (!b->model) throw ModelBundleLoadError("bundle '" + b->meta.name + "' has no model");
    validate_no_leakage(b->schema.names(), forbidden);
  }
  logger()->info("Prediction engine ready: {} historical rows, models v{}",
                 history_->size(), bundles_.classifier.meta.version);
}

PredictionResult PredictionEngine::predict_driver_(const PreRaceAttributes& driver,
                                                   SeasonRound target,
                                                   std::optional<double> pole_time,
                                                   std::size_t field_size) const {
  PredictionResult r;
  r.driver_code = driver.driver_code;
  r.driver_number = driver.driver_number;
  r.constructor = driver.constructor;

  PreRaceAttributes attrs = driver;
  const auto issues = sanitize_attributes(attrs);
  if (!issues.empty()) {
    r.defaulted = true;
    for (const auto& i : issues) {
      logger()->warn("Malformed attribute for driver '{}': {}; using default", driver.driver_code, i);
    }
  }
  if (driver.driver_code.empty()) {
    r.defaulted = true;
    logger()->warn("Driver #{} has no driver code; identity features defaulted", driver.driver_number);
  }

  FeatureRow row;
  try {
    row = build_feature_row(*history_, attrs, target, pole_time, opt_.features);
  } catch (const std::exception& e) {
    // Fall back to identity only; history and attributes take their defaults.
    logger()->warn("Featurizing driver '{}' failed ({}); using default row", driver.driver_code, e.what());
    r.defaulted = true;
    PreRaceAttributes bare;
    bare.driver_code = driver.driver_code;
    bare.driver_number = driver.driver_number;
    row = build_feature_row(EventTable{}, bare, target, std::nullopt, opt_.features);
  }

  AlignmentReport rep;
  r.win_probability = clip_probability(bundles_.classifier.predict(row, &rep));
  r.zero_filled += rep.zero_filled.size();
  r.predicted_position = clip_position(bundles_.position_regressor.predict(row, &rep), field_size);
  r.zero_filled += rep.zero_filled.size();
  r.predicted_points = clip_points(bundles_.points_regressor.predict(row, &rep));
  r.zero_filled += rep.zero_filled.size();
  r.predicted_winner = r.win_probability > 0.5;
  return r;
}

std::vector<PredictionResult> PredictionEngine::predict(const TargetEvent& event) const {
  const std::size_t n = event.drivers.size();
  std::vector<PredictionResult> out(n);
  if (n == 0) return out;

  const auto pole = pole_time_of(event.drivers);
  auto run = [&](std::size_t i) {
    out[i] = predict_driver_(event.drivers[i], event.key, pole, n);
  };

  const std::size_t workers = std::min(std::max<std::size_t>(1, opt_.threads), n);
  if (workers == 1) {
    for (std::size_t i = 0; i < n; ++i) run(i);
  } else {
    // Strided split; each slot of `out` has a single writer.
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&, w] {
        try {
          for (std::size_t i = w; i < n; i += workers) run(i);
        } catch (...) {
          errors[w] = std::current_exception();
        }
      });
    }
    for (auto& t : pool) t.join();
    for (const auto& e : errors) {
      if (e) std::rethrow_exception(e);
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const PredictionResult& a, const PredictionResult& b) {
    if (a.predicted_position != b.predicted_position) return a.predicted_position < b.predicted_position;
    return a.win_probability > b.win_probability;
  });
  logger()->info("Predicted {}/{} for {} drivers", event.key.season, event.key.round, n);
  return out;
}

std::unique_ptr<PredictionEngine> create_prediction_engine(
    const std::filesystem::path& models_root,
    std::shared_ptr<const EventTable> history,
    EngineOptions opt,
    std::optional<std::string> version) {
  try {
    auto bundles = load_bundle_set(models_root, std::move(version));
    return std::make_unique<PredictionEngine>(std::move(bundles), std::move(history), opt);
  } catch (const ModelBundleLoadError& e) {
    logger()->error("Prediction engine unavailable: {}", e.what());
    return nullptr;
  }
}

} // namespace f1ml
