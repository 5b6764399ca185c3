// MergePipeline wires the interval index, the crash matcher and the rate
// computation together; deduplicate_lines does the same for the grid.

#include "core/MergePipeline.hpp"
#include "core/CorridorIntervalIndex.hpp"
#include "core/SpatialGridIndex.hpp"

#include <unordered_set>

MergeOutputs MergePipeline::run(const MergeInputs &in) const {
  MergeOutputs out;

  // 1) Multi-year AADT
  std::vector<SegmentRecord> segments = in.base_year;
  average_traffic(segments, in.other_years);

  // 2) Crash -> segment matching
  CorridorIntervalIndex index(segments);
  CrashMatcher matcher(index);
  out.crash_summary = matcher.countMatches(in.crashes);

  // 3) Rates for every segment, signed routes attached
  out.rates = compute_rates(segments, out.crash_summary.counts, P);
  for (auto &r : out.rates)
    r.signed_route = lookup_signed_route(in.signed_routes, r.key.dept_id);

  // 4) Filter, then only fetch geometry the output needs
  auto kept = filter_segments(out.rates, P, out.filter_stats);
  std::unordered_set<SegmentKey> needed;
  for (const auto &r : kept)
    needed.insert(r.key);
  const GeometryMap geometries =
      build_geometry_map(in.geometry_sources, &needed);
  out.lines = build_merged_lines(kept, geometries);
  return out;
}

DedupResult deduplicate_lines(const FeatureCollection &merged,
                              const FeatureCollection &candidates,
                              const MatchingParams &params) {
  params.validate();
  SpatialGridIndex grid(params.bin_size_deg);
  grid.addFeatures(merged.features, params.sample_count);
  LineDeduplicator dedup(grid, params);
  return dedup.run(candidates.features);
}
