#pragma once
#include "core/CorridorIntervalIndex.hpp"
#include "models/SegmentModel.hpp"
#include <vector>

struct CrashMatchSummary {
  CrashCounts counts; // segment -> crashes matched to it
  std::size_t matched = 0;
  std::size_t unmatched = 0;
};

// Maps crash events onto segment intervals. Events with an unknown
// corridor or an unparseable reference point are simply unmatched.
class CrashMatcher {
public:
  explicit CrashMatcher(const CorridorIntervalIndex &index) : index_(index) {}

  const SegmentKey *match(const CrashEvent &event) const;

  CrashMatchSummary countMatches(const std::vector<CrashEvent> &events) const;

private:
  const CorridorIntervalIndex &index_;
};

// Order-independent merge of partial results (per-key sum).
CrashMatchSummary mergeSummaries(const CrashMatchSummary &a,
                                 const CrashMatchSummary &b);
