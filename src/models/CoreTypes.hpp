#pragma once

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

using Json = nlohmann::json;

// Longitude/latitude pair in degrees, GeoJSON order: [lon, lat].
using Coord = std::array<double, 2>;
using Polyline = std::vector<Coord>;

// A point sampled along an indexed line together with the direction of
// travel leaving it.
struct SpatialSample {
  double lon = 0.0;
  double lat = 0.0;
  double bearing_deg = 0.0; // [0, 360)
};

// Grid cell coordinates: floor(lon / bin_size), floor(lat / bin_size).
struct BinKey {
  int64_t x = 0;
  int64_t y = 0;

  bool operator==(const BinKey &o) const { return x == o.x && y == o.y; }
  bool operator!=(const BinKey &o) const { return !(*this == o); }
  bool operator<(const BinKey &o) const {
    return x < o.x || (x == o.x && y < o.y);
  }
};

struct BinKeyHash {
  std::size_t operator()(const BinKey &k) const noexcept {
    // splitmix-style mix of the two cell indices
    uint64_t h = static_cast<uint64_t>(k.x) * 0x9E3779B97F4A7C15ull;
    h ^= static_cast<uint64_t>(k.y) + 0x7F4A7C159E3779B9ull + (h << 6) +
         (h >> 2);
    return static_cast<std::size_t>(h);
  }
};
