#include <f1ml/bundle.hpp>
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <f1ml/constants.hpp>
#include <f1ml/errors.hpp>
#include <f1ml/logging.hpp>
#include "strings.hpp"

namespace fs = std::filesystem;

namespace f1ml {

namespace {

using detail::trim;

[[noreturn]] void fail(const std::string& what) {
  throw ModelBundleLoadError(what);
}

YAML::Node require(const YAML::Node& n, const char* key) {
  const YAML::Node v = n[key];
  if (!v) fail(std::string("missing key '") + key + "'");
  return v;
}

ModelKind parse_kind(const std::string& s) {
  if (s == "classifier") return ModelKind::Classifier;
  if (s == "regressor") return ModelKind::Regressor;
  fail("unknown model kind '" + s + "'");
}

Link parse_link(const YAML::Node& n) {
  const std::string s = n ? n.as<std::string>() : std::string("identity");
  if (s == "identity") return Link::Identity;
  if (s == "logistic") return Link::Logistic;
  fail("unknown link '" + s + "'");
}

Aggregation parse_aggregation(const YAML::Node& n) {
  const std::string s = n ? n.as<std::string>() : std::string("mean");
  if (s == "mean") return Aggregation::Mean;
  if (s == "sum") return Aggregation::Sum;
  fail("unknown aggregation '" + s + "'");
}

std::shared_ptr<const Model> parse_linear(const YAML::Node& m, const FeatureSchema& schema) {
  auto coef = require(m, "coefficients").as<std::vector<double>>();
  if (coef.size() != schema.size()) {
    fail("linear model has " + std::to_string(coef.size()) + " coefficients for " +
         std::to_string(schema.size()) + " features");
  }
  const double intercept = m["intercept"] ? m["intercept"].as<double>() : 0.0;
  return std::make_shared<const LinearModel>(std::move(coef), intercept, parse_link(m["link"]));
}

// Tree nodes name their split feature; names map to schema positions.
std::shared_ptr<const Model> parse_tree_ensemble(const YAML::Node& m, const FeatureSchema& schema) {
  std::unordered_map<std::string, int> index;
  for (std::size_t i = 0; i < schema.size(); ++i) index.emplace(schema.names()[i], static_cast<int>(i));

  std::vector<DecisionTree> trees;
  for (const auto& t : require(m, "trees")) {
    std::vector<TreeNode> nodes;
    for (const auto& n : require(t, "nodes")) {
      TreeNode nd;
      if (n["feature"]) {
        const auto name = n["feature"].as<std::string>();
        auto it = index.find(name);
        if (it == index.end()) fail("tree splits on '" + name + "' which is not in the schema");
        nd.feature = it->second;
        nd.threshold = require(n, "threshold").as<double>();
        nd.left = require(n, "left").as<int>();
        nd.right = require(n, "right").as<int>();
      } else {
        nd.value = require(n, "value").as<double>();
      }
      nodes.push_back(nd);
    }
    trees.emplace_back(std::move(nodes), schema.size());
  }
  const double base = m["base_score"] ? m["base_score"].as<double>() : 0.0;
  return std::make_shared<const TreeEnsembleModel>(std::move(trees), schema.size(),
                                                   parse_aggregation(m["aggregation"]),
                                                   base, parse_link(m["link"]));
}

ModelBundle load_expected(const fs::path& dir, const char* file, ModelKind kind) {
  auto b = load_model_bundle(dir / file);
  if (b.kind != kind) fail(std::string(file) + " does not hold the expected model kind");
  return b;
}

} // namespace

double ModelBundle::predict(const FeatureRow& row, AlignmentReport* report) const {
  return model->predict(align(row, schema, report));
}

ModelBundle model_bundle_from_yaml(const YAML::Node& doc) {
  try {
    ModelBundle b;
    b.kind = parse_kind(require(doc, "kind").as<std::string>());
    b.meta.name = doc["name"] ? doc["name"].as<std::string>() : std::string{};
    b.meta.version = require(doc, "version").as<std::string>();
    b.meta.trained_on = doc["trained_on"] ? doc["trained_on"].as<std::string>() : std::string{};
    if (const auto metrics = doc["metrics"]) {
      for (const auto& kv : metrics) {
        b.meta.metrics[kv.first.as<std::string>()] = kv.second.as<double>();
      }
    }

    const std::string scheme =
        doc["encoding_scheme"] ? doc["encoding_scheme"].as<std::string>() : std::string(kEncodingScheme);
    if (scheme != kEncodingScheme) {
      fail("bundle encoded with '" + scheme + "', this build uses '" + kEncodingScheme + "'");
    }
    b.schema = FeatureSchema(require(doc, "features").as<std::vector<std::string>>(), scheme);
    if (b.schema.empty()) fail("bundle has an empty feature schema");

    const YAML::Node m = require(doc, "model");
    const auto type = require(m, "type").as<std::string>();
    if (type == "linear") b.model = parse_linear(m, b.schema);
    else if (type == "tree_ensemble") b.model = parse_tree_ensemble(m, b.schema);
    else fail("unknown model type '" + type + "'");
    return b;
  } catch (const YAML::Exception& e) {
    throw ModelBundleLoadError(std::string("malformed bundle: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw ModelBundleLoadError(std::string("invalid model: ") + e.what());
  }
}

ModelBundle load_model_bundle(const fs::path& path) {
  if (!fs::is_regular_file(path)) throw ModelBundleLoadError("bundle not found: " + path.string());
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw ModelBundleLoadError("cannot parse " + path.string() + ": " + e.what());
  }
  try {
    auto b = model_bundle_from_yaml(doc);
    logger()->info("Loaded {} v{} ({} features) from {}",
                   b.meta.name.empty() ? path.stem().string() : b.meta.name,
                   b.meta.version, b.schema.size(), path.string());
    return b;
  } catch (const ModelBundleLoadError& e) {
    throw ModelBundleLoadError(path.string() + ": " + e.what());
  }
}

std::string resolve_current_version(const fs::path& models_root) {
  for (const char* name : {kCurrentPointer, kLatestPointer}) {
    const fs::path p = models_root / name;
    std::error_code ec;
    if (fs::is_symlink(p, ec)) {
      const auto target = fs::read_symlink(p, ec);
      if (!ec && !target.empty()) {
        // "v1.2.0/" style targets have an empty filename.
        const auto leaf = target.filename().empty() ? target.parent_path().filename() : target.filename();
        return leaf.string();
      }
    } else if (fs::is_regular_file(p, ec)) {
      std::ifstream f(p);
      std::string line;
      if (f && std::getline(f, line) && !trim(line).empty()) return trim(line);
    }
  }
  throw ModelBundleLoadError("no current/latest version pointer under " + models_root.string());
}

BundleSet load_bundle_set(const fs::path& models_root, std::optional<std::string> version) {
  const std::string v = version ? *version : resolve_current_version(models_root);
  const fs::path dir = models_root / v;
  if (!fs::is_directory(dir)) throw ModelBundleLoadError("model version not found: " + dir.string());

  BundleSet set{
    load_expected(dir, kClassifierFile, ModelKind::Classifier),
    load_expected(dir, kPositionRegressorFile, ModelKind::Regressor),
    load_expected(dir, kPointsRegressorFile, ModelKind::Regressor),
  };
  logger()->info("Model bundle set {} ready", v);
  return set;
}

} // namespace f1ml
