#pragma once
#include "models/SegmentModel.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Per-corridor milepost intervals, sorted by start milepost, for
// point-in-interval lookups. Built once; read-only afterwards.
class CorridorIntervalIndex {
public:
  CorridorIntervalIndex() = default;
  explicit CorridorIntervalIndex(const std::vector<SegmentRecord> &segments);

  // Segment whose interval contains `milepost` on `corridor` (already
  // normalized), or nullptr. Picks the last interval starting at or before
  // the milepost and rejects the point if it lies past that interval's end.
  const SegmentKey *lookup(const std::string &corridor,
                           double milepost) const;

  std::size_t corridorCount() const noexcept { return corridors_.size(); }
  std::size_t segmentCount() const noexcept { return segment_count_; }
  // Records dropped at build time because a milepost did not parse.
  std::size_t skippedCount() const noexcept { return skipped_; }

private:
  // parallel arrays, index-aligned
  struct Corridor {
    std::vector<double> starts;
    std::vector<double> ends;
    std::vector<SegmentKey> keys;
  };
  std::unordered_map<std::string, Corridor> corridors_;
  std::size_t segment_count_ = 0;
  std::size_t skipped_ = 0;
};
