#pragma once

#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <vector>

// Structures modelling the subset of GeoJSON the engine reads and writes.
// Geometry JSON is kept verbatim so features pass through unchanged.

// ---------- Geometry ----------
struct Geometry {
  std::string type; // "LineString", "MultiLineString", ...; empty when null
  Json raw;         // the geometry object as read
};

// ---------- Feature ----------
struct Feature {
  Geometry geometry;
  Json properties = Json::object();
};

// ---------- FeatureCollection ----------
struct FeatureCollection {
  std::vector<Feature> features;
};

// Coordinates array -> polyline. Points with fewer than two numeric
// members are skipped.
inline Polyline parse_polyline(const Json &arr) {
  Polyline out;
  if (!arr.is_array())
    return out;
  out.reserve(arr.size());
  for (const auto &pt : arr) {
    if (pt.is_array() && pt.size() >= 2 && pt[0].is_number() &&
        pt[1].is_number())
      out.push_back({pt[0].get<double>(), pt[1].get<double>()});
  }
  return out;
}

// The line to sample for a feature: a LineString as is, the constituent
// with the most vertices for a MultiLineString, nothing for other types.
inline std::optional<Polyline> linear_coords(const Geometry &g) {
  if (!g.raw.is_object() || !g.raw.contains("coordinates"))
    return std::nullopt;
  const Json &coords = g.raw["coordinates"];
  if (g.type == "LineString")
    return parse_polyline(coords);
  if (g.type == "MultiLineString") {
    if (!coords.is_array() || coords.empty())
      return std::nullopt;
    Polyline best;
    for (const auto &part : coords) {
      Polyline p = parse_polyline(part);
      if (p.size() > best.size())
        best = std::move(p);
    }
    return best;
  }
  return std::nullopt;
}

// Define from_json()/to_json() overloads so json::get<>() works on them.

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  if (!j.is_object()) {
    g.type.clear();
    g.raw = nullptr;
    return;
  }
  // a null or non-string type leaves the geometry unsampleable
  auto t = j.find("type");
  g.type = (t != j.end() && t->is_string()) ? t->get<std::string>() : "";
  g.raw = j;
}

inline void to_json(Json &j, const Geometry &g) { j = g.raw; }

// --- Feature ----
inline void from_json(const Json &j, Feature &f) {
  if (j.contains("geometry"))
    f.geometry = j["geometry"].get<Geometry>();
  f.properties = Json::object();
  if (j.contains("properties") && j["properties"].is_object())
    f.properties = j["properties"];
}

inline void to_json(Json &j, const Feature &f) {
  j = Json{{"type", "Feature"},
           {"geometry", f.geometry},
           {"properties", f.properties}};
}

// --- FeatureCollection ----
inline void from_json(const Json &j, FeatureCollection &fc) {
  fc.features.clear();
  if (j.contains("features") && j["features"].is_array()) {
    fc.features.reserve(j["features"].size());
    for (const auto &f : j["features"]) {
      if (f.is_object())
        fc.features.push_back(f.get<Feature>());
    }
  }
}

inline void to_json(Json &j, const FeatureCollection &fc) {
  j = Json{{"type", "FeatureCollection"}, {"features", Json::array()}};
  for (const auto &f : fc.features)
    j["features"].push_back(f);
}
