#pragma once
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace f1ml {

// Feature name -> value for one driver at one target event.
using FeatureRow = std::map<std::string, double>;

inline double row_value(const FeatureRow& row, const std::string& name, double fallback = 0.0) {
  auto it = row.find(name);
  return it == row.end() ? fallback : it->second;
}

inline std::vector<std::string> row_names(const FeatureRow& row) {
  std::vector<std::string> names;
  names.reserve(row.size());
  for (const auto& kv : row) names.push_back(kv.first);
  return names;
}

// Names of entries that are NaN or infinite.
inline std::vector<std::string> non_finite_features(const FeatureRow& row) {
  std::vector<std::string> out;
  for (const auto& kv : row) {
    if (!std::isfinite(kv.second)) out.push_back(kv.first);
  }
  return out;
}

} // namespace f1ml
