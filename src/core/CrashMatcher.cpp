#include "core/CrashMatcher.hpp"
#include "core/Milepost.hpp"

#include <iostream>

const SegmentKey *CrashMatcher::match(const CrashEvent &event) const {
  const std::string corridor = normalize_id(event.corridor);
  if (corridor.empty())
    return nullptr;
  const auto ref = parse_milepost(event.ref_point);
  if (!ref)
    return nullptr;
  return index_.lookup(corridor, *ref);
}

CrashMatchSummary
CrashMatcher::countMatches(const std::vector<CrashEvent> &events) const {
  CrashMatchSummary out;
  for (const auto &ev : events) {
    if (const SegmentKey *key = match(ev)) {
      ++out.counts[*key];
      ++out.matched;
    } else {
      ++out.unmatched;
    }
  }
  std::cerr << "[crashes] matched=" << out.matched
            << " unmatched=" << out.unmatched
            << " segments_hit=" << out.counts.size() << "\n";
  return out;
}

CrashMatchSummary mergeSummaries(const CrashMatchSummary &a,
                                 const CrashMatchSummary &b) {
  CrashMatchSummary out = a;
  for (const auto &kv : b.counts)
    out.counts[kv.first] += kv.second;
  out.matched += b.matched;
  out.unmatched += b.unmatched;
  return out;
}
