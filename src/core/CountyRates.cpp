#include "core/CountyRates.hpp"
#include "core/Milepost.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

std::string county_key(const std::string &name) {
  std::string out = trim(name);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string title_case(const std::string &s) {
  std::string out(s);
  bool prev_alpha = false;
  for (char &c : out) {
    const auto uc = static_cast<unsigned char>(c);
    const bool alpha = std::isalpha(uc) != 0;
    if (alpha)
      c = static_cast<char>(prev_alpha ? std::tolower(uc) : std::toupper(uc));
    prev_alpha = alpha;
  }
  return out;
}

std::vector<CountyRate> rank_counties(const CountyCounts &crashes,
                                      const CountyPopulations &populations) {
  CountyCounts all = crashes;
  for (const auto &kv : populations)
    all.emplace(kv.first, 0);

  std::vector<CountyRate> out;
  out.reserve(all.size());
  for (const auto &kv : all) {
    if (kv.first.empty())
      continue;
    CountyRate r;
    r.county = title_case(kv.first);
    r.total_crashes = kv.second;
    auto pop = populations.find(kv.first);
    if (pop != populations.end() && pop->second > 0)
      r.per_100k = static_cast<double>(kv.second) /
                   static_cast<double>(pop->second) * 100000.0;
    out.push_back(std::move(r));
  }

  std::sort(out.begin(), out.end(),
            [](const CountyRate &a, const CountyRate &b) {
              const double ra = a.per_100k ? *a.per_100k : -1.0;
              const double rb = b.per_100k ? *b.per_100k : -1.0;
              if (ra != rb)
                return ra > rb;
              return a.county < b.county;
            });
  std::cerr << "[counties] ranked " << out.size() << " counties\n";
  return out;
}
