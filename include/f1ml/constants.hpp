#pragma once
#include <cstddef>
#include <set>
#include <string>

namespace f1ml {

// Shared by training and inference. Changing any of these is a model-breaking
// change; bump kEncodingScheme when the categorical encoding changes.

// Categorical hash: MD5 digest as a 128-bit big-endian integer, mod kEncodingModulus.
inline constexpr std::size_t kEncodingModulus = 1000;
inline constexpr const char* kEncodingScheme = "md5-mod1000-v1";

// Grid/qualifying positions are normalized against a fixed 1..20 range.
inline constexpr double kGridMin = 1.0;
inline constexpr double kGridMax = 20.0;

// Constructor points are rescaled against a fixed reference, not the batch max.
inline constexpr double kConstructorPointsReference = 1000.0;

// Recent-form window (prior classified finishes).
inline constexpr std::size_t kRecentFormWindow = 5;

// Midpoint of the grid range; stands in for position averages with no history.
inline constexpr double kNeutralPosition = (kGridMin + kGridMax) / 2.0;

// Qualifying gap (s) assumed when no lap time is known.
inline constexpr double kUnknownQualifyingGap = 10.0;

// 25 for the win + 1 for fastest lap.
inline constexpr double kMaxEventPoints = 26.0;

// Record checks on historical results.
inline constexpr double kWinPoints = 25.0;
inline constexpr int kDriverNumberMin = 1;
inline constexpr int kDriverNumberMax = 99;
inline constexpr double kQ3Cutoff = 10.0;   // qualifiers up to P10 set a Q3 lap

// Outcome-only fields. Any of these in a candidate feature set is leakage.
const std::set<std::string>& forbidden_features_at_prediction();

} // namespace f1ml
