#pragma once

#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Smallest grid bin accepted anywhere; keeps floor(lon / bin) well inside
// the int64 range.
constexpr double kMinBinSizeDeg = 1e-9;
// One degree of latitude on the 6371 km sphere.
constexpr double kMetersPerDegree = 111194.92664455873;

// Tolerances shared by the spatial grid index and the line deduplicator.
struct MatchingParams {
  int sample_count = 12;        // points sampled along every line
  double bin_size_deg = 0.01;   // ~1.1 km of latitude
  double max_distance_m = 50.0; // sample-to-sample proximity
  double max_bearing_diff_deg = 30.0;
  double match_fraction = 0.25; // matched share that marks a duplicate

  static MatchingParams from_json(const nlohmann::json &j) {
    return from_json(j, MatchingParams());
  }

  // Keys present in `j` override `p`.
  static MatchingParams from_json(const nlohmann::json &j, MatchingParams p) {
    if (j.contains("sample_count"))
      p.sample_count = j.at("sample_count").get<int>();
    if (j.contains("bin_size_deg"))
      p.bin_size_deg = j.at("bin_size_deg").get<double>();
    if (j.contains("max_distance_m"))
      p.max_distance_m = j.at("max_distance_m").get<double>();
    if (j.contains("max_bearing_diff_deg"))
      p.max_bearing_diff_deg = j.at("max_bearing_diff_deg").get<double>();
    if (j.contains("match_fraction"))
      p.match_fraction = j.at("match_fraction").get<double>();
    p.validate();
    return p;
  }

  void validate() const {
    if (sample_count < 2)
      throw std::runtime_error("matching.sample_count must be >= 2");
    if (!(bin_size_deg >= kMinBinSizeDeg))
      throw std::runtime_error("matching.bin_size_deg must be >= 1e-9");
    if (!(max_distance_m >= 0.0) || !(max_bearing_diff_deg >= 0.0))
      throw std::runtime_error("matching tolerances must be non-negative");
    // the 3x3 neighbourhood only covers max_distance_m if a bin is at
    // least that wide
    if (bin_size_deg * kMetersPerDegree < max_distance_m)
      throw std::runtime_error(
          "matching.bin_size_deg is smaller than max_distance_m");
    if (!(match_fraction > 0.0 && match_fraction <= 1.0))
      throw std::runtime_error("matching.match_fraction must be in (0, 1]");
  }
};

// Inputs to the crash-rate computation and the segment filter.
struct RateParams {
  std::vector<int> years{2023, 2022, 2021, 2020, 2019};
  // 365.20: one leap day across the five-year window
  double days_per_year = 365.20;
  std::vector<std::string> excluded_dept_prefixes{"R", "L", "X", "U"};
  std::vector<std::string> kept_dept_ids{"U-5832", "U-8133", "U-1216",
                                         "U-602", "U-8135"};
  double min_aadt = 1.0;

  static RateParams from_json(const nlohmann::json &j) {
    RateParams p;
    if (j.contains("years"))
      p.years = j.at("years").get<std::vector<int>>();
    if (j.contains("days_per_year"))
      p.days_per_year = j.at("days_per_year").get<double>();
    if (j.contains("excluded_dept_prefixes"))
      p.excluded_dept_prefixes =
          j.at("excluded_dept_prefixes").get<std::vector<std::string>>();
    if (j.contains("kept_dept_ids"))
      p.kept_dept_ids = j.at("kept_dept_ids").get<std::vector<std::string>>();
    if (j.contains("min_aadt"))
      p.min_aadt = j.at("min_aadt").get<double>();
    if (p.years.empty())
      throw std::runtime_error("rates.years must list at least one year");
    if (!(p.days_per_year > 0.0))
      throw std::runtime_error("rates.days_per_year must be positive");
    return p;
  }
};

struct ServerParams {
  int port = 5005;
  std::size_t payload_max_mb = 512;
  std::vector<std::string> post_endpoints{"/crashes/match", "/lines/dedup"};
  std::vector<std::string> get_endpoints{"/ping"};

  static ServerParams from_json(const nlohmann::json &j) {
    ServerParams p;
    p.port = j.value("port", p.port);
    p.payload_max_mb = j.value("payload_max_mb", p.payload_max_mb);
    if (j.contains("post_endpoints"))
      p.post_endpoints = j.at("post_endpoints").get<std::vector<std::string>>();
    if (j.contains("get_endpoints"))
      p.get_endpoints = j.at("get_endpoints").get<std::vector<std::string>>();
    return p;
  }
};

// group name -> signed routes belonging to it
using RouteGroupConfig = std::map<std::string, std::vector<std::string>>;

// Everything config/settings.json can carry. Absent sections keep defaults.
struct Settings {
  ServerParams server;
  MatchingParams matching;
  RateParams rates;
  RouteGroupConfig route_groups;

  static Settings from_json(const nlohmann::json &j) {
    Settings s;
    if (j.contains("server"))
      s.server = ServerParams::from_json(j.at("server"));
    if (j.contains("matching"))
      s.matching = MatchingParams::from_json(j.at("matching"));
    if (j.contains("rates"))
      s.rates = RateParams::from_json(j.at("rates"));
    if (j.contains("route_groups"))
      s.route_groups = j.at("route_groups").get<RouteGroupConfig>();
    return s;
  }

  static Settings load(const std::string &path) {
    std::ifstream in(path);
    if (!in)
      throw std::runtime_error("Cannot open " + path);
    nlohmann::json j;
    try {
      in >> j;
    } catch (const nlohmann::json::parse_error &e) {
      throw std::runtime_error(path + ": " + e.what());
    }
    try {
      return from_json(j);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(path + ": " + e.what());
    }
  }
};
