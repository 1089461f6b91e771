#pragma once
#include <string>
#include <vector>
#include <f1ml/constants.hpp>
#include <f1ml/feature_row.hpp>

namespace f1ml {

// Ordered feature names a trained model expects, plus the categorical
// encoding scheme it was trained with. Immutable once built.
class FeatureSchema {
public:
  FeatureSchema() = default;
  explicit FeatureSchema(std::vector<std::string> names,
                         std::string encoding_scheme = kEncodingScheme)
    : names_(std::move(names)), encoding_scheme_(std::move(encoding_scheme)) {}

  const std::vector<std::string>& names() const { return names_; }
  const std::string& encoding_scheme() const { return encoding_scheme_; }
  std::size_t size() const { return names_.size(); }
  bool empty() const { return names_.empty(); }

private:
  std::vector<std::string> names_;
  std::string encoding_scheme_{kEncodingScheme};
};

// What align() had to patch up. Zero-filled also covers non-finite values.
struct AlignmentReport {
  std::vector<std::string> zero_filled;
  std::vector<std::string> dropped;
  bool exact() const { return zero_filled.empty() && dropped.empty(); }
};

// One value per schema name, in schema order. Names absent from `row` (or
// non-finite there) become 0; names not in the schema are dropped. Both are
// recorded in `report` when given and logged as a schema-mismatch warning.
// Throws SchemaError when the schema is empty.
std::vector<double> align(const FeatureRow& row,
                          const FeatureSchema& schema,
                          AlignmentReport* report = nullptr);

} // namespace f1ml
