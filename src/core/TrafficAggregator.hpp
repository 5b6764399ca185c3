#pragma once
#include "models/GeoFeature.hpp"
#include "models/SegmentModel.hpp"
#include "models/params.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// Departmental route (trailing letter stripped) -> signed route name.
using SignedRouteMap = std::unordered_map<std::string, std::string>;
using GeometryMap = std::unordered_map<SegmentKey, Geometry>;

struct FilterStats {
  std::size_t low_volume = 0;   // AADT missing or below min_aadt
  std::size_t dept_prefix = 0;  // DEPT_ID excluded by prefix
};

// First non-empty signed route per normalized departmental route.
SignedRouteMap
build_signed_route_map(const std::vector<std::pair<std::string, std::string>>
                           &dept_to_signed);

std::string lookup_signed_route(const SignedRouteMap &m,
                                const std::string &dept_id);

// Replaces each base record's AADT with the mean of all parseable AADT
// values for its key across base + other years, and sets years_with_data
// to the number of values used. Keys absent from the base are ignored.
void average_traffic(std::vector<SegmentRecord> &base,
                     const std::vector<std::vector<SegmentRecord>> &others);

// Exposure and crash-rate figures per segment, in base order.
std::vector<SegmentRates> compute_rates(const std::vector<SegmentRecord> &segs,
                                        const CrashCounts &counts,
                                        const RateParams &p);

// Drops low-volume segments, then those with an excluded DEPT_ID prefix
// unless explicitly kept.
std::vector<SegmentRates> filter_segments(const std::vector<SegmentRates> &in,
                                          const RateParams &p,
                                          FilterStats &stats);

// Geometry per key from yearly GeoJSON sources; earlier sources win.
// When `needed` is given only those keys are collected.
GeometryMap
build_geometry_map(const std::vector<FeatureCollection> &sources,
                   const std::unordered_set<SegmentKey> *needed = nullptr);

// One feature per rated segment that has a geometry.
FeatureCollection build_merged_lines(const std::vector<SegmentRates> &rates,
                                     const GeometryMap &geometries);

// Column order of the merged line properties.
const std::vector<std::string> &merged_columns();
