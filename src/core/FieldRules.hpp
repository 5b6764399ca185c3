#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <vector>

// Ordered column-name fallbacks for numeric attributes that have been
// published under several names. Rules are tried in order and the first
// value that parses (and, for positive_only rules, is > 0) wins.
struct NumericFieldRule {
  std::string field;
  bool positive_only = false;
};
using FieldRuleList = std::vector<NumericFieldRule>;

// TYC_AADT, AADT, AVG_AADT, TYC_AADT_EST, EST_AADT (all positive_only)
const FieldRuleList &aadt_rules();
// TOTAL_CRASHES, TOTAL, TOTAL_CRASHES_5YR, TOTAL_CRASH
const FieldRuleList &crash_count_rules();

// Text of a scalar JSON value: strings as is, numbers printed, else "".
std::string json_text(const Json &v);

// JSON number, or a string holding one. Anything else -> nullopt.
std::optional<double> json_number(const Json &v);

std::optional<double> first_numeric(const Json &properties,
                                    const FieldRuleList &rules);
