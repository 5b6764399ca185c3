#include "core/LineDeduplicator.hpp"
#include "core/GeoUtils.hpp"

#include <iostream>

DedupVerdict LineDeduplicator::classify(const Geometry &geometry) const {
  auto coords = linear_coords(geometry);
  if (!coords)
    return DedupVerdict{}; // non-linear: keep
  return classifyLine(*coords);
}

DedupVerdict LineDeduplicator::classifyLine(const Polyline &coords) const {
  DedupVerdict v;
  const Polyline pts = GeoUtils::sampleLine(coords, params_.sample_count);
  v.samples = static_cast<int>(pts.size());
  // a lone point carries no direction to compare
  if (pts.size() < 2)
    return v;

  for (const auto &s : SpatialGridIndex::directionalSamples(pts)) {
    if (index_.matches(s.lon, s.lat, s.bearing_deg, params_.max_distance_m,
                       params_.max_bearing_diff_deg))
      ++v.hits;
  }
  v.match_fraction = static_cast<double>(v.hits) / static_cast<double>(v.samples);
  v.keep = v.match_fraction < params_.match_fraction;
  return v;
}

DedupResult LineDeduplicator::run(const std::vector<Feature> &candidates) const {
  DedupResult out;
  out.kept.reserve(candidates.size());
  for (const auto &f : candidates) {
    if (classify(f.geometry).keep)
      out.kept.push_back(f);
    else
      ++out.removed;
  }
  std::cerr << "[dedup] candidates=" << candidates.size()
            << " removed=" << out.removed << " kept=" << out.kept.size()
            << "\n";
  return out;
}
