#pragma once
#include "models/GeoFeature.hpp"
#include "models/params.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Features bucketed by exact (trimmed) SIGNED_ROUTE, input order kept.
class SignedRouteIndex {
public:
  explicit SignedRouteIndex(const std::vector<Feature> &features);

  const std::vector<Feature> &find(const std::string &signed_route) const;
  std::size_t routeCount() const noexcept { return by_route_.size(); }

private:
  std::unordered_map<std::string, std::vector<Feature>> by_route_;
};

struct RouteGroupOutput {
  std::string name;
  std::string file_name; // individual_<name>.geojson, '/' and ' ' -> '_'
  FeatureCollection features;
};

std::string route_file_name(const std::string &name);

// One output per configured group, concatenating its routes' features in
// the order the routes are listed.
std::vector<RouteGroupOutput> build_route_groups(const SignedRouteIndex &index,
                                                 const RouteGroupConfig &groups);

// One output per route.
std::vector<RouteGroupOutput>
build_route_files(const SignedRouteIndex &index,
                  const std::vector<std::string> &routes);

// Length-weighted crash rate over a set of merged lines.
struct RateSummary {
  std::size_t segments = 0;
  int total_crashes = 0;
  double daily_vmt = 0.0;
  double total_length_mi = 0.0;
  double weighted_rate = 0.0;   // per 100M VMT
  double miles_per_crash = 0.0; // 0 when the rate is 0

  void add(double length_mi, double rate, int crashes, double vmt);
  void finish();

private:
  double weighted_sum_ = 0.0;
};

struct CategoryRates {
  RateSummary all;
  RateSummary interstate;
  RateSummary non_interstate;
};

// Interstate when SIGNED_ROUTE (else DEPT_ID) starts with "I-".
bool is_interstate(const Feature &f);

// Uses features with a positive PER_100M_VMT. Length is SEC_LNT_MI when
// present, else the LineString length; features with neither are skipped.
CategoryRates weighted_rates(const std::vector<Feature> &features);
