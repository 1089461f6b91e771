#include <f1ml/schema.hpp>
#include <cmath>
#include <unordered_set>
#include <f1ml/errors.hpp>
#include <f1ml/logging.hpp>

namespace f1ml {

std::vector<double> align(const FeatureRow& row,
                          const FeatureSchema& schema,
                          AlignmentReport* report) {
  if (schema.empty()) throw SchemaError("cannot align to an empty feature schema");

  AlignmentReport local;
  AlignmentReport& rep = report ? *report : local;
  rep.zero_filled.clear();
  rep.dropped.clear();

  std::vector<double> out;
  out.reserve(schema.size());
  for (const auto& name : schema.names()) {
    auto it = row.find(name);
    if (it == row.end() || !std::isfinite(it->second)) {
      rep.zero_filled.push_back(name);
      out.push_back(0.0);
    } else {
      out.push_back(it->second);
    }
  }

  const std::unordered_set<std::string> wanted(schema.names().begin(), schema.names().end());
  for (const auto& kv : row) {
    if (!wanted.count(kv.first)) rep.dropped.push_back(kv.first);
  }

  if (!rep.zero_filled.empty()) {
    logger()->warn("Schema mismatch: {} of {} feature(s) zero-filled (first: '{}')",
                   rep.zero_filled.size(), schema.size(), rep.zero_filled.front());
  }
  if (!rep.dropped.empty()) {
    logger()->debug("Schema mismatch: dropped {} feature(s) not in schema", rep.dropped.size());
  }
  return out;
}

} // namespace f1ml
