#pragma once
#include "models/CoreTypes.hpp"
#include "models/GeoFeature.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

struct GridMatch {
  SpatialSample sample;
  double distance_m = 0.0;
  double bearing_diff_deg = 0.0;
};

// Coarse lon/lat grid of directional samples taken from existing lines.
// A query only looks at its own bin and the eight around it, so bin_size
// must be comfortably larger than the match distance (0.01 deg vs 50 m).
class SpatialGridIndex {
public:
  explicit SpatialGridIndex(double bin_size_deg = 0.01);

  BinKey binFor(double lon, double lat) const;

  void insert(const SpatialSample &s);

  // Samples the line with `sample_count` points and indexes every one of
  // them with its outgoing bearing (the last one with the final bearing).
  void addLine(const Polyline &coords, int sample_count);

  // Indexes every feature with a LineString / MultiLineString geometry.
  // Other geometries are ignored.
  void addFeatures(const std::vector<Feature> &features, int sample_count);

  // Best sample within both tolerances around (lon, lat): nearest by
  // distance, ties resolved by scan order (bins in (dx, dy) lexicographic
  // order, then insertion order). nullopt when nothing qualifies.
  std::optional<GridMatch> findMatch(double lon, double lat,
                                     double bearing_deg, double max_dist_m,
                                     double max_bearing_diff) const;

  bool matches(double lon, double lat, double bearing_deg, double max_dist_m,
               double max_bearing_diff) const {
    return findMatch(lon, lat, bearing_deg, max_dist_m, max_bearing_diff)
        .has_value();
  }

  double binSize() const noexcept { return bin_size_; }
  std::size_t binCount() const noexcept { return bins_.size(); }
  std::size_t sampleCount() const noexcept { return sample_count_; }
  std::size_t lineCount() const noexcept { return line_count_; }

  // Sampled points paired with their outgoing bearing: point i takes the
  // bearing towards i+1, the last point repeats the final pair's bearing.
  // A single point gets bearing 0.
  static std::vector<SpatialSample> directionalSamples(const Polyline &pts);

private:
  double bin_size_;
  std::unordered_map<BinKey, std::vector<SpatialSample>, BinKeyHash> bins_;
  std::size_t sample_count_ = 0;
  std::size_t line_count_ = 0;
};
