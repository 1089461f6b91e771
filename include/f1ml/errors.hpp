#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace f1ml {

// Outcome-derived features reached a feature set. Never recovered.
class LeakageError : public std::runtime_error {
public:
  LeakageError(const std::string& what, std::vector<std::string> features)
    : std::runtime_error(what), features_(std::move(features)) {}

  // Offending names, sorted.
  const std::vector<std::string>& features() const { return features_; }

private:
  std::vector<std::string> features_;
};

// Rows from the future, out-of-range values, or missing required columns.
class DataQualityError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No aligned vector can be produced (empty schema).
class SchemaError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A model bundle is missing or malformed.
class ModelBundleLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace f1ml
