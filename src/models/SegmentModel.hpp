#pragma once

#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

// Composite identifier of one physical road segment. Compared and hashed
// field by field; the joined text form is only produced for output.
struct SegmentKey {
  std::string corridor; // CORR_ID, trimmed + upper-cased
  std::string start_mp; // CORR_MP as written in the source table
  std::string end_mp;   // CORR_ENDMP as written in the source table
  std::string dept_id;  // DEPT_ID, trimmed + upper-cased

  // Builds a key applying the same normalisation the tables get on load.
  static SegmentKey make(const std::string &corr_id, const std::string &mp,
                         const std::string &endmp, const std::string &dept);

  // "CORR_MP_ENDMP_DEPT", the historical SEGMENT_KEY column value.
  std::string to_string() const;

  bool operator==(const SegmentKey &o) const {
    return corridor == o.corridor && start_mp == o.start_mp &&
           end_mp == o.end_mp && dept_id == o.dept_id;
  }
  bool operator!=(const SegmentKey &o) const { return !(*this == o); }
  bool operator<(const SegmentKey &o) const {
    return std::tie(corridor, start_mp, end_mp, dept_id) <
           std::tie(o.corridor, o.start_mp, o.end_mp, o.dept_id);
  }
};

namespace std {
template <> struct hash<SegmentKey> {
  std::size_t operator()(const SegmentKey &k) const noexcept {
    std::hash<std::string> h;
    std::size_t seed = h(k.corridor);
    for (const std::string *s : {&k.start_mp, &k.end_mp, &k.dept_id})
      seed ^= h(*s) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    return seed;
  }
};
} // namespace std

// One row of a yearly traffic-count table.
struct SegmentRecord {
  SegmentKey key;
  std::optional<double> start_mp; // parsed CORR_MP
  std::optional<double> end_mp;   // parsed CORR_ENDMP
  std::optional<double> aadt;     // TYC_AADT (mean across years once averaged)
  std::optional<double> length_mi; // SEC_LNT_MI
  int years_with_data = 1;
};

// A crash as it comes out of the crash table; matched at most once.
struct CrashEvent {
  std::string corridor;  // CORRIDOR
  std::string ref_point; // REF_POINT, "major+minor"
};

using CrashCounts = std::unordered_map<SegmentKey, int>;

// Per-segment exposure and crash-rate figures.
struct SegmentRates {
  SegmentKey key;
  std::optional<double> aadt;
  std::optional<double> length_mi;
  std::optional<double> miles_driven;
  int total_crashes = 0;
  double avg_crashes = 0.0;
  std::optional<double> annual_vmt;
  std::optional<double> per_100m_vmt;
  std::string signed_route;
};
