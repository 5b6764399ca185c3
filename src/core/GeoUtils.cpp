#include "core/GeoUtils.hpp"

#include <algorithm>
#include <cmath>

static inline double deg2rad(double d) { return d * (M_PI / 180.0); }
static inline double rad2deg(double r) { return r * (180.0 / M_PI); }

double GeoUtils::haversine(const Coord &p1, const Coord &p2, double radius) {
  const double phi1 = deg2rad(p1[1]);
  const double phi2 = deg2rad(p2[1]);
  const double delta_phi = deg2rad(p2[1] - p1[1]);
  const double delta_gamma = deg2rad(p2[0] - p1[0]);
  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_gamma / 2), 2);
  h = std::min(1.0, std::max(0.0, h)); // rounding can push h past 1
  return 2 * radius * std::asin(std::sqrt(h));
}

double GeoUtils::bearingDegrees(const Coord &p1, const Coord &p2) {
  const double lat1 = deg2rad(p1[1]);
  const double lat2 = deg2rad(p2[1]);
  const double dlon = deg2rad(p2[0] - p1[0]);
  const double x = std::sin(dlon) * std::cos(lat2);
  const double y = std::cos(lat1) * std::sin(lat2) -
                   std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  double br = std::fmod(rad2deg(std::atan2(x, y)) + 360.0, 360.0);
  if (br >= 360.0)
    br = 0.0;
  return br;
}

double GeoUtils::bearingDiff(double a, double b) {
  // abs((a - b + 180) mod 360 - 180) with a floored modulo
  double d = std::fmod(a - b + 180.0, 360.0);
  if (d < 0)
    d += 360.0;
  return std::fabs(d - 180.0);
}

// Segment lengths in metres plus their total.
static double segment_lengths(const Polyline &coords,
                              std::vector<double> &out) {
  out.clear();
  out.reserve(coords.size());
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < coords.size(); ++i) {
    const double d = GeoUtils::distanceMeters(coords[i], coords[i + 1]);
    out.push_back(d);
    total += d;
  }
  return total;
}

static Coord point_at(const Polyline &coords, const std::vector<double> &segs,
                      double total, double f) {
  if (f <= 0)
    return coords.front();
  if (f >= 1)
    return coords.back();
  if (total == 0)
    return coords.front();
  const double target = total * f;
  double acc = 0.0;
  for (std::size_t i = 0; i < segs.size(); ++i) {
    if (acc + segs[i] >= target) {
      const double remain = target - acc;
      const double t = (segs[i] != 0) ? remain / segs[i] : 0.0;
      const Coord &a = coords[i];
      const Coord &b = coords[i + 1];
      return {a[0] + (b[0] - a[0]) * t, a[1] + (b[1] - a[1]) * t};
    }
    acc += segs[i];
  }
  return coords.back();
}

std::optional<Coord> GeoUtils::pointAtFraction(const Polyline &coords,
                                               double f) {
  if (coords.empty())
    return std::nullopt;
  std::vector<double> segs;
  const double total = segment_lengths(coords, segs);
  return point_at(coords, segs, total, f);
}

Polyline GeoUtils::sampleLine(const Polyline &coords, int n) {
  if (coords.empty() || n <= 0)
    return {};
  if (coords.size() == 1 || n == 1)
    return {coords.front()};

  // lengths computed once for all fractions
  std::vector<double> segs;
  const double total = segment_lengths(coords, segs);
  Polyline out;
  out.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    const double frac = static_cast<double>(i) / static_cast<double>(n - 1);
    out.push_back(point_at(coords, segs, total, frac));
  }
  return out;
}

double GeoUtils::lengthMiles(const Polyline &coords) {
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < coords.size(); ++i)
    total += distanceMiles(coords[i], coords[i + 1]);
  return total;
}
