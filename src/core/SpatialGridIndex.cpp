#include "core/SpatialGridIndex.hpp"
#include "core/GeoUtils.hpp"
#include "models/params.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

// Cell indices are clamped well inside int64 so that neighbour offsets
// cannot overflow for out-of-range coordinates.
static constexpr double kMaxCell = 4.0e18;

static int64_t cell_of(double v, double bin) {
  const double c = std::floor(v / bin);
  if (!(c > -kMaxCell))
    return static_cast<int64_t>(-kMaxCell);
  if (c > kMaxCell)
    return static_cast<int64_t>(kMaxCell);
  return static_cast<int64_t>(c);
}

SpatialGridIndex::SpatialGridIndex(double bin_size_deg)
    : bin_size_(bin_size_deg) {
  if (!(bin_size_ >= kMinBinSizeDeg))
    throw std::invalid_argument(
        "SpatialGridIndex: bin size must be >= 1e-9 deg");
}

BinKey SpatialGridIndex::binFor(double lon, double lat) const {
  return BinKey{cell_of(lon, bin_size_), cell_of(lat, bin_size_)};
}

void SpatialGridIndex::insert(const SpatialSample &s) {
  bins_[binFor(s.lon, s.lat)].push_back(s);
  ++sample_count_;
}

std::vector<SpatialSample>
SpatialGridIndex::directionalSamples(const Polyline &pts) {
  std::vector<SpatialSample> out;
  if (pts.empty())
    return out;
  out.reserve(pts.size());
  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    out.push_back({pts[i][0], pts[i][1],
                   GeoUtils::bearingDegrees(pts[i], pts[i + 1])});
  }
  const std::size_t n = pts.size();
  const double last_br =
      (n >= 2) ? GeoUtils::bearingDegrees(pts[n - 2], pts[n - 1]) : 0.0;
  out.push_back({pts[n - 1][0], pts[n - 1][1], last_br});
  return out;
}

void SpatialGridIndex::addLine(const Polyline &coords, int sample_count) {
  const Polyline pts = GeoUtils::sampleLine(coords, sample_count);
  if (pts.empty())
    return;
  for (const auto &s : directionalSamples(pts))
    insert(s);
  ++line_count_;
}

void SpatialGridIndex::addFeatures(const std::vector<Feature> &features,
                                   int sample_count) {
  std::size_t skipped = 0;
  for (const auto &f : features) {
    auto coords = linear_coords(f.geometry);
    if (!coords || coords->empty()) {
      ++skipped;
      continue;
    }
    addLine(*coords, sample_count);
  }
  std::cerr << "[grid] lines=" << line_count_ << " samples=" << sample_count_
            << " bins=" << bins_.size() << " skipped=" << skipped << "\n";
}

std::optional<GridMatch>
SpatialGridIndex::findMatch(double lon, double lat, double bearing_deg,
                            double max_dist_m, double max_bearing_diff) const {
  const BinKey home = binFor(lon, lat);
  const Coord q{lon, lat};
  std::optional<GridMatch> best;

  for (int64_t dx = -1; dx <= 1; ++dx) {
    for (int64_t dy = -1; dy <= 1; ++dy) {
      auto it = bins_.find(BinKey{home.x + dx, home.y + dy});
      if (it == bins_.end())
        continue;
      for (const auto &s : it->second) {
        const double d = GeoUtils::distanceMeters(q, {s.lon, s.lat});
        if (d > max_dist_m)
          continue;
        const double diff = GeoUtils::bearingDiff(bearing_deg, s.bearing_deg);
        if (diff > max_bearing_diff)
          continue;
        if (!best || d < best->distance_m)
          best = GridMatch{s, d, diff};
      }
    }
  }
  return best;
}
