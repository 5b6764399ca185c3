#include "core/RouteGroups.hpp"
#include "core/FieldRules.hpp"
#include "core/GeoUtils.hpp"
#include "core/Milepost.hpp"

#include <cmath>
#include <iostream>

SignedRouteIndex::SignedRouteIndex(const std::vector<Feature> &features) {
  for (const auto &f : features) {
    auto it = f.properties.find("SIGNED_ROUTE");
    const std::string sr =
        (it == f.properties.end()) ? std::string() : trim(json_text(*it));
    by_route_[sr].push_back(f);
  }
}

const std::vector<Feature> &
SignedRouteIndex::find(const std::string &signed_route) const {
  static const std::vector<Feature> kNone;
  auto it = by_route_.find(trim(signed_route));
  return (it == by_route_.end()) ? kNone : it->second;
}

std::string route_file_name(const std::string &name) {
  std::string safe = name;
  for (char &c : safe) {
    if (c == '/' || c == ' ')
      c = '_';
  }
  return "individual_" + safe + ".geojson";
}

std::vector<RouteGroupOutput>
build_route_groups(const SignedRouteIndex &index,
                   const RouteGroupConfig &groups) {
  std::vector<RouteGroupOutput> out;
  out.reserve(groups.size());
  for (const auto &kv : groups) {
    RouteGroupOutput g{kv.first, route_file_name(kv.first), {}};
    for (const auto &route : kv.second) {
      const auto &feats = index.find(route);
      g.features.features.insert(g.features.features.end(), feats.begin(),
                                 feats.end());
    }
    out.push_back(std::move(g));
  }
  return out;
}

std::vector<RouteGroupOutput>
build_route_files(const SignedRouteIndex &index,
                  const std::vector<std::string> &routes) {
  std::vector<RouteGroupOutput> out;
  out.reserve(routes.size());
  for (const auto &r : routes) {
    const std::string name = trim(r);
    out.push_back(
        RouteGroupOutput{name, route_file_name(name), {index.find(name)}});
  }
  return out;
}

void RateSummary::add(double length_mi, double rate, int crashes,
                      double vmt) {
  ++segments;
  total_crashes += crashes;
  daily_vmt += vmt;
  total_length_mi += length_mi;
  weighted_sum_ += rate * length_mi;
}

void RateSummary::finish() {
  weighted_rate = (total_length_mi > 0) ? weighted_sum_ / total_length_mi : 0;
  miles_per_crash = (weighted_rate > 0) ? 100000000.0 / weighted_rate : 0;
}

static bool starts_with_interstate(const std::string &s) {
  return s.compare(0, 2, "I-") == 0;
}

bool is_interstate(const Feature &f) {
  const Json &p = f.properties;
  auto sr = p.find("SIGNED_ROUTE");
  if (sr != p.end() && starts_with_interstate(json_text(*sr)))
    return true;
  auto dept = p.find("DEPT_ID");
  return dept != p.end() && starts_with_interstate(normalize_id(json_text(*dept)));
}

CategoryRates weighted_rates(const std::vector<Feature> &features) {
  CategoryRates out;
  std::size_t skipped = 0;
  for (const auto &f : features) {
    const Json &p = f.properties;
    auto rate_it = p.find("PER_100M_VMT");
    const auto rate =
        (rate_it == p.end()) ? std::nullopt : json_number(*rate_it);
    if (!rate || *rate <= 0) {
      ++skipped;
      continue;
    }

    // SEC_LNT_MI first, the drawn geometry otherwise
    auto len_it = p.find("SEC_LNT_MI");
    auto sec_len = (len_it == p.end()) ? std::nullopt : json_number(*len_it);
    double length_mi = 0.0;
    if (sec_len) {
      length_mi = *sec_len;
    } else if (auto line = f.geometry.type == "LineString"
                               ? linear_coords(f.geometry)
                               : std::nullopt) {
      length_mi = GeoUtils::lengthMiles(*line);
    } else {
      ++skipped;
      continue;
    }

    const auto crashes = first_numeric(p, crash_count_rules());
    const int total = crashes ? static_cast<int>(*crashes) : 0;
    const auto aadt = first_numeric(p, aadt_rules());
    const double vmt = aadt ? length_mi * *aadt : 0.0;

    out.all.add(length_mi, *rate, total, vmt);
    if (is_interstate(f))
      out.interstate.add(length_mi, *rate, total, vmt);
    else
      out.non_interstate.add(length_mi, *rate, total, vmt);
  }
  out.all.finish();
  out.interstate.finish();
  out.non_interstate.finish();
  std::cerr << "[rates] used=" << out.all.segments << " skipped=" << skipped
            << "\n";
  return out;
}
