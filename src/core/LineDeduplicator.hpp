#pragma once
#include "core/SpatialGridIndex.hpp"
#include "models/GeoFeature.hpp"
#include "models/params.hpp"
#include <vector>

struct DedupVerdict {
  bool keep = true;
  int samples = 0; // directional samples tested
  int hits = 0;    // samples with a grid match
  double match_fraction = 0.0;
};

struct DedupResult {
  std::vector<Feature> kept; // input order preserved
  std::size_t removed = 0;
};

// Decides whether a candidate line is already present in the grid: sample
// it, test each sample (with its bearing) against the index, and drop it
// when the matched share reaches params.match_fraction. Anything that
// cannot be sampled is kept.
class LineDeduplicator {
public:
  LineDeduplicator(const SpatialGridIndex &index, const MatchingParams &params)
      : index_(index), params_(params) {}

  DedupVerdict classify(const Geometry &geometry) const;
  DedupVerdict classifyLine(const Polyline &coords) const;

  DedupResult run(const std::vector<Feature> &candidates) const;

private:
  const SpatialGridIndex &index_;
  MatchingParams params_;
};
