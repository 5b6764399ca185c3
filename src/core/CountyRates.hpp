#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// County keys are trimmed and lower-cased on both sides of the join.
using CountyCounts = std::unordered_map<std::string, int>;
using CountyPopulations = std::unordered_map<std::string, long long>;

struct CountyRate {
  std::string county; // title-cased display name
  int total_crashes = 0;
  std::optional<double> per_100k; // absent without a positive population
};

std::string county_key(const std::string &name);

// "lewis and clark" -> "Lewis And Clark"
std::string title_case(const std::string &s);

// Crashes per 100k residents for every county seen in either input
// (census-only counties with zero crashes). Sorted by rate descending,
// counties without a rate last, ties by name.
std::vector<CountyRate> rank_counties(const CountyCounts &crashes,
                                      const CountyPopulations &populations);
