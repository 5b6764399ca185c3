#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <vector>

// Mean Earth radii. Metres drive the spatial matcher, miles the
// segment-length calculations.
constexpr double kEarthRadiusM = 6371000.0;
constexpr double kEarthRadiusMi = 3958.8;

class GeoUtils {
public:
  // haversine formulas
  static double haversine(const Coord &p1, const Coord &p2, double radius);
  static double distanceMeters(const Coord &p1, const Coord &p2) {
    return haversine(p1, p2, kEarthRadiusM);
  }
  static double distanceMiles(const Coord &p1, const Coord &p2) {
    return haversine(p1, p2, kEarthRadiusMi);
  }

  // Initial great-circle bearing p1 -> p2 in degrees, [0, 360).
  static double bearingDegrees(const Coord &p1, const Coord &p2);

  // Smallest circular difference between two bearings, [0, 180].
  static double bearingDiff(double a, double b);

  // Point at arc-length fraction f of the polyline (haversine lengths,
  // linear interpolation in lon/lat inside the bracketing segment).
  // f <= 0 gives the first vertex, f >= 1 the last, a zero-length line its
  // first vertex. nullopt only for an empty polyline.
  static std::optional<Coord> pointAtFraction(const Polyline &coords,
                                              double f);

  // n points at fractions i/(n-1). A single-vertex line (or n == 1) yields
  // one point, an empty line none.
  static Polyline sampleLine(const Polyline &coords, int n);

  // Total length in miles (SEC_LNT_MI fallback).
  static double lengthMiles(const Polyline &coords);
};
