#include "core/FieldRules.hpp"
#include "core/Milepost.hpp"

#include <cmath>

const FieldRuleList &aadt_rules() {
  static const FieldRuleList rules{{"TYC_AADT", true},
                                   {"AADT", true},
                                   {"AVG_AADT", true},
                                   {"TYC_AADT_EST", true},
                                   {"EST_AADT", true}};
  return rules;
}

const FieldRuleList &crash_count_rules() {
  static const FieldRuleList rules{{"TOTAL_CRASHES", false},
                                   {"TOTAL", false},
                                   {"TOTAL_CRASHES_5YR", false},
                                   {"TOTAL_CRASH", false}};
  return rules;
}

std::string json_text(const Json &v) {
  if (v.is_string())
    return v.get<std::string>();
  if (v.is_number() || v.is_boolean())
    return v.dump();
  return "";
}

std::optional<double> json_number(const Json &v) {
  if (v.is_number()) {
    const double d = v.get<double>();
    return std::isfinite(d) ? std::optional<double>(d) : std::nullopt;
  }
  if (v.is_string())
    return parse_number(v.get<std::string>());
  return std::nullopt;
}

std::optional<double> first_numeric(const Json &properties,
                                    const FieldRuleList &rules) {
  if (!properties.is_object())
    return std::nullopt;
  for (const auto &r : rules) {
    auto it = properties.find(r.field);
    if (it == properties.end())
      continue;
    auto v = json_number(*it);
    if (!v || (r.positive_only && *v <= 0))
      continue;
    return v;
  }
  return std::nullopt;
}
