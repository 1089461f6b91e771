#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <f1ml/constants.hpp>
#include <f1ml/event.hpp>
#include <f1ml/feature_row.hpp>

namespace f1ml {

// Stable content hash in [0, modulus): MD5 of the bytes, read as a 128-bit
// big-endian integer, reduced mod `modulus`. Same string -> same value on any
// process or machine. Collisions are expected and harmless.
// Throws std::invalid_argument unless 1 <= modulus <= 2^48.
std::size_t encode_category(const std::string& value, std::size_t modulus = kEncodingModulus);

// Fixed vocabularies for the low-cardinality buckets. Columns for every
// label are always emitted, whatever the batch contains.
inline constexpr std::array<const char*, 3> kExperienceLevels{"Rookie", "Experienced", "Veteran"};
inline constexpr std::array<const char*, 3> kRainCategories{"Dry", "Light", "Heavy"};
inline constexpr std::array<const char*, 3> kQualifyingGapCategories{"Close", "Medium", "Far"};

// Rookie <= 10 races < Experienced <= 50 < Veteran
const char* experience_level(double races_so_far);
// Dry <= 0.1 mm < Light <= 1.0 mm < Heavy
const char* rain_category(double max_rainfall);
// Close <= 0.5 s < Medium <= 2.0 s < Far
const char* qualifying_gap_category(double gap_s);

// <col>_encoded for circuit_name, country, event_name, driver_code, constructor.
// Empty strings encode like any other value.
void add_encoded_features(const PreRaceAttributes& a, FeatureRow& row,
                          std::size_t modulus = kEncodingModulus);

// One-hot bucket columns (experience_level_*, rain_category_*, qualifying_gap_category_*).
// Reads races_so_far, max_rainfall and qualifying_time_from_pole from the row;
// a missing input falls in the first bucket (gap: "Far").
void add_bucket_features(FeatureRow& row);

} // namespace f1ml
