#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>
#include <f1ml/feature_row.hpp>
#include <f1ml/model.hpp>
#include <f1ml/schema.hpp>

namespace f1ml {

struct BundleMetadata {
  std::string name;                       // e.g., "classifier_winner"
  std::string version;                    // e.g., "1.2.0"
  std::string trained_on;                 // ISO timestamp, informational
  std::map<std::string, double> metrics;  // training metrics (roc_auc, rmse, ...)
};

// One trained model with the schema it was fitted on. Never mutated after load.
struct ModelBundle {
  ModelKind kind = ModelKind::Regressor;
  std::shared_ptr<const Model> model;
  FeatureSchema schema;
  BundleMetadata meta;

  // Align `row` to the schema and run the model (raw, unclipped output).
  double predict(const FeatureRow& row, AlignmentReport* report = nullptr) const;
};

// The three models the engine serves. Only built when all three loaded.
struct BundleSet {
  ModelBundle classifier;           // win probability
  ModelBundle position_regressor;   // finishing position
  ModelBundle points_regressor;     // points
};

// File names inside a version directory.
inline constexpr const char* kClassifierFile = "classifier_winner.yaml";
inline constexpr const char* kPositionRegressorFile = "regressor_position.yaml";
inline constexpr const char* kPointsRegressorFile = "regressor_points.yaml";

// Pointer names tried, in order, when no version is requested.
inline constexpr const char* kCurrentPointer = "current";
inline constexpr const char* kLatestPointer = "latest";

// Decode a bundle document. Throws ModelBundleLoadError.
ModelBundle model_bundle_from_yaml(const YAML::Node& doc);

// Throws ModelBundleLoadError if the file is missing or malformed, or its
// encoding scheme differs from kEncodingScheme.
ModelBundle load_model_bundle(const std::filesystem::path& path);

// Version named by <root>/current (symlink to a version directory, or a text
// file holding the version name); falls back to <root>/latest.
// Throws ModelBundleLoadError when neither resolves.
std::string resolve_current_version(const std::filesystem::path& models_root);

// Load all three bundles from <root>/<version>/. Any failure throws
// ModelBundleLoadError; no partially loaded set is ever returned.
BundleSet load_bundle_set(const std::filesystem::path& models_root,
                          std::optional<std::string> version = std::nullopt);

} // namespace f1ml
