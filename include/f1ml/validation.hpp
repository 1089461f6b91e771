#pragma once
#include <set>
#include <string>
#include <vector>
#include <f1ml/errors.hpp>
#include <f1ml/event.hpp>
#include <f1ml/feature_row.hpp>

namespace f1ml {

// Throws LeakageError naming every candidate that is in `forbidden`.
// Passes iff the intersection is empty.
void validate_no_leakage(const std::vector<std::string>& candidates,
                         const std::set<std::string>& forbidden);

// Same, against forbidden_features_at_prediction().
void validate_no_leakage(const std::vector<std::string>& candidates);

// Human-readable range problems across rows (empty when clean):
// grid/qualifying position outside [1, 20], win_rate outside [0, 1],
// air/track temperature outside [-10, 60] C, any non-finite value.
std::vector<std::string> check_feature_ranges(const std::vector<FeatureRow>& rows);

// Throws DataQualityError listing check_feature_ranges() issues.
void validate_feature_ranges(const std::vector<FeatureRow>& rows);

// Throws DataQualityError listing required names absent from `available`.
void validate_required_features(const std::vector<std::string>& available,
                                 const std::vector<std::string>& required);

// Consistency of historical results (empty when clean):
//  - winner flag set iff race_position == 1
//  - a winner that finished has at least kWinPoints
//  - points within [0, kMaxEventPoints]
//  - driver number within [kDriverNumberMin, kDriverNumberMax]
// A top-10 qualifier without a Q3 time is not an error; it is appended to
// `warnings` when given.
std::vector<std::string> check_event_records(const EventTable& events,
                                             std::vector<std::string>* warnings = nullptr);

// Logs the warnings, throws DataQualityError listing check_event_records() issues.
void validate_event_records(const EventTable& events);

} // namespace f1ml
