#pragma once
#include "core/CrashMatcher.hpp"
#include "core/LineDeduplicator.hpp"
#include "core/TrafficAggregator.hpp"
#include "models/GeoFeature.hpp"
#include "models/SegmentModel.hpp"
#include "models/params.hpp"
#include <vector>

// Already-parsed inputs of one merge run.
struct MergeInputs {
  std::vector<SegmentRecord> base_year;
  std::vector<std::vector<SegmentRecord>> other_years;
  std::vector<CrashEvent> crashes;
  std::vector<FeatureCollection> geometry_sources; // newest year first
  SignedRouteMap signed_routes;
};

struct MergeOutputs {
  std::vector<SegmentRates> rates; // every base segment, base order
  FeatureCollection lines;         // filtered segments with geometry
  CrashMatchSummary crash_summary;
  FilterStats filter_stats;
};

// Orchestrates averaging -> corridor index -> crash matching -> rates ->
// filtering -> merged lines.
class MergePipeline {
public:
  explicit MergePipeline(RateParams p = RateParams{}) : P(std::move(p)) {}

  MergeOutputs run(const MergeInputs &in) const;

  const RateParams &params() const noexcept { return P; }

private:
  RateParams P;
};

// Builds the grid from `merged` and returns the candidates that are not
// already covered by it.
DedupResult deduplicate_lines(const FeatureCollection &merged,
                              const FeatureCollection &candidates,
                              const MatchingParams &params);
