// Traffic averaging, crash-rate computation and merged line assembly.

#include "core/TrafficAggregator.hpp"
#include "core/FieldRules.hpp"
#include "core/Milepost.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

SignedRouteMap build_signed_route_map(
    const std::vector<std::pair<std::string, std::string>> &dept_to_signed) {
  SignedRouteMap m;
  for (const auto &row : dept_to_signed) {
    const std::string key = strip_trailing_letter(row.first);
    if (key.empty())
      continue;
    const std::string signed_route = trim(row.second);
    auto it = m.find(key);
    // first non-empty signed route wins
    if (it == m.end())
      m.emplace(key, signed_route);
    else if (it->second.empty() && !signed_route.empty())
      it->second = signed_route;
  }
  return m;
}

std::string lookup_signed_route(const SignedRouteMap &m,
                                const std::string &dept_id) {
  auto it = m.find(strip_trailing_letter(dept_id));
  return (it == m.end()) ? std::string() : it->second;
}

void average_traffic(std::vector<SegmentRecord> &base,
                     const std::vector<std::vector<SegmentRecord>> &others) {
  struct Acc {
    double sum = 0.0;
    int count = 0;
  };
  std::unordered_map<SegmentKey, Acc> acc;
  auto add = [&acc](const SegmentRecord &r, bool create) {
    auto it = acc.find(r.key);
    if (it == acc.end()) {
      if (!create)
        return;
      it = acc.emplace(r.key, Acc{}).first;
    }
    if (r.aadt) {
      it->second.sum += *r.aadt;
      ++it->second.count;
    }
  };
  for (const auto &r : base)
    add(r, true);
  for (const auto &year : others)
    for (const auto &r : year)
      add(r, false);

  for (auto &r : base) {
    const Acc &a = acc[r.key];
    if (a.count > 0)
      r.aadt = a.sum / a.count;
    r.years_with_data = a.count;
  }
  std::cerr << "[merge] averaged traffic over " << (others.size() + 1)
            << " tables for " << acc.size() << " segment keys\n";
}

std::vector<SegmentRates> compute_rates(const std::vector<SegmentRecord> &segs,
                                        const CrashCounts &counts,
                                        const RateParams &p) {
  std::vector<SegmentRates> out;
  out.reserve(segs.size());
  const double total_years = static_cast<double>(p.years.size());
  for (const auto &s : segs) {
    SegmentRates r;
    r.key = s.key;
    r.aadt = s.aadt;
    r.length_mi = s.length_mi;
    if (s.aadt && s.length_mi)
      r.miles_driven = *s.length_mi * *s.aadt;

    auto it = counts.find(s.key);
    r.total_crashes = (it == counts.end()) ? 0 : it->second;
    r.avg_crashes = r.total_crashes / total_years;

    if (r.miles_driven) {
      r.annual_vmt = *r.miles_driven * p.days_per_year;
      if (*r.annual_vmt > 0)
        r.per_100m_vmt = (r.avg_crashes / *r.annual_vmt) * 100000000.0;
    }
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<SegmentRates> filter_segments(const std::vector<SegmentRates> &in,
                                          const RateParams &p,
                                          FilterStats &stats) {
  std::vector<std::string> prefixes, kept;
  for (const auto &s : p.excluded_dept_prefixes)
    prefixes.push_back(normalize_id(s));
  for (const auto &s : p.kept_dept_ids)
    kept.push_back(normalize_id(s));

  std::vector<SegmentRates> out;
  out.reserve(in.size());
  for (const auto &r : in) {
    if (!r.aadt || *r.aadt < p.min_aadt) {
      ++stats.low_volume;
      continue;
    }
    const std::string &dept = r.key.dept_id;
    const bool prefixed =
        std::any_of(prefixes.begin(), prefixes.end(), [&](const auto &pre) {
          return !pre.empty() && dept.compare(0, pre.size(), pre) == 0;
        });
    if (prefixed && std::find(kept.begin(), kept.end(), dept) == kept.end()) {
      ++stats.dept_prefix;
      continue;
    }
    out.push_back(r);
  }
  if (stats.dept_prefix > 0)
    std::cerr << "[merge] filtered out " << stats.dept_prefix
              << " segments by DEPT_ID prefix\n";
  return out;
}

GeometryMap build_geometry_map(const std::vector<FeatureCollection> &sources,
                               const std::unordered_set<SegmentKey> *needed) {
  GeometryMap m;
  for (const auto &fc : sources) {
    for (const auto &f : fc.features) {
      const Json &p = f.properties;
      auto prop = [&p](const char *name) {
        auto it = p.find(name);
        return (it == p.end()) ? std::string() : json_text(*it);
      };
      SegmentKey key = SegmentKey::make(prop("CORR_ID"), prop("CORR_MP"),
                                        prop("CORR_ENDMP"), prop("DEPT_ID"));
      if (needed && needed->count(key) == 0)
        continue;
      m.emplace(std::move(key), f.geometry);
    }
  }
  return m;
}

static Json optional_number(const std::optional<double> &v) {
  return v ? Json(*v) : Json("");
}

FeatureCollection build_merged_lines(const std::vector<SegmentRates> &rates,
                                     const GeometryMap &geometries) {
  FeatureCollection fc;
  for (const auto &r : rates) {
    auto it = geometries.find(r.key);
    if (it == geometries.end() || it->second.raw.is_null())
      continue;

    Feature f;
    f.geometry = it->second;
    Json &props = f.properties;
    props["SEGMENT_KEY"] = r.key.to_string();
    props["CORRIDOR"] = r.key.corridor;
    props["CORR_MP"] = r.key.start_mp;
    props["CORR_ENDMP"] = r.key.end_mp;
    props["DEPT_ID"] = r.key.dept_id;
    props["SEC_LNT_MI"] = optional_number(r.length_mi);
    props["SIGNED_ROUTE"] = r.signed_route;
    props["TOTAL_CRASHES"] = r.total_crashes;
    props["AVG_CRASHES"] = r.avg_crashes;
    props["PER_100M_VMT"] = optional_number(r.per_100m_vmt);
    if (r.aadt && std::floor(*r.aadt) == *r.aadt &&
        std::fabs(*r.aadt) < 9.0e15)
      props["TYC_AADT"] = static_cast<int64_t>(*r.aadt);
    else
      props["TYC_AADT"] = optional_number(r.aadt);
    fc.features.push_back(std::move(f));
  }
  std::cerr << "[merge] built " << fc.features.size() << " lines from "
            << rates.size() << " segments\n";
  return fc;
}

const std::vector<std::string> &merged_columns() {
  static const std::vector<std::string> cols{
      "SEGMENT_KEY",  "CORRIDOR",      "CORR_MP",     "CORR_ENDMP",
      "DEPT_ID",      "SEC_LNT_MI",    "SIGNED_ROUTE", "TOTAL_CRASHES",
      "AVG_CRASHES",  "PER_100M_VMT",  "TYC_AADT"};
  return cols;
}
