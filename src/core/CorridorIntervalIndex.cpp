#include "core/CorridorIntervalIndex.hpp"
#include "core/Milepost.hpp"

#include <algorithm>
#include <iostream>

CorridorIntervalIndex::CorridorIntervalIndex(
    const std::vector<SegmentRecord> &segments) {
  struct Interval {
    double start;
    double end;
    const SegmentKey *key;
  };
  std::unordered_map<std::string, std::vector<Interval>> grouped;
  for (const auto &s : segments) {
    if (!s.start_mp || !s.end_mp) {
      ++skipped_;
      continue;
    }
    grouped[normalize_id(s.key.corridor)].push_back(
        {*s.start_mp, *s.end_mp, &s.key});
  }

  for (auto &kv : grouped) {
    auto &intervals = kv.second;
    // stable: equal starts keep table order, the later one wins lookups
    std::stable_sort(
        intervals.begin(), intervals.end(),
        [](const Interval &a, const Interval &b) { return a.start < b.start; });
    Corridor c;
    c.starts.reserve(intervals.size());
    c.ends.reserve(intervals.size());
    c.keys.reserve(intervals.size());
    for (const auto &it : intervals) {
      c.starts.push_back(it.start);
      c.ends.push_back(it.end);
      c.keys.push_back(*it.key);
    }
    segment_count_ += intervals.size();
    corridors_.emplace(kv.first, std::move(c));
  }

  std::cerr << "[index] corridors=" << corridors_.size()
            << " segments=" << segment_count_ << " skipped=" << skipped_
            << "\n";
}

const SegmentKey *CorridorIntervalIndex::lookup(const std::string &corridor,
                                                double milepost) const {
  auto it = corridors_.find(corridor);
  if (it == corridors_.end())
    return nullptr;
  const Corridor &c = it->second;
  // first start strictly greater than the milepost; the candidate is the
  // interval just before it
  auto ub = std::upper_bound(c.starts.begin(), c.starts.end(), milepost);
  if (ub == c.starts.begin())
    return nullptr;
  const std::size_t i = static_cast<std::size_t>(ub - c.starts.begin()) - 1;
  if (milepost > c.ends[i])
    return nullptr;
  return &c.keys[i];
}
