#include "http/payloads.hpp"
#include "core/CorridorIntervalIndex.hpp"
#include "core/CrashMatcher.hpp"
#include "core/MergePipeline.hpp"
#include "io/RecordReader.hpp"
#include "models/GeoFeature.hpp"

#include <algorithm>
#include <stdexcept>

Json match_crashes_payload(const Json &body) {
  if (!body.is_object())
    throw std::runtime_error("body must be a JSON object");
  const auto segments = segments_from_json(body.value("segments", Json::array()));
  const auto crashes = crashes_from_json(body.value("crashes", Json::array()));

  CorridorIntervalIndex index(segments);
  CrashMatcher matcher(index);
  const CrashMatchSummary summary = matcher.countMatches(crashes);

  // sorted by key so responses are reproducible
  std::vector<std::pair<SegmentKey, int>> rows(summary.counts.begin(),
                                               summary.counts.end());
  std::sort(rows.begin(), rows.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  Json counts = Json::array();
  for (const auto &r : rows) {
    counts.push_back({{"segment_key", r.first.to_string()},
                      {"corridor", r.first.corridor},
                      {"corr_mp", r.first.start_mp},
                      {"corr_endmp", r.first.end_mp},
                      {"dept_id", r.first.dept_id},
                      {"count", r.second}});
  }
  return Json{{"counts", std::move(counts)},
              {"matched", summary.matched},
              {"unmatched", summary.unmatched}};
}

Json dedup_payload(const Json &body, const MatchingParams &defaults) {
  if (!body.is_object() || !body.contains("merged") ||
      !body.contains("candidates"))
    throw std::runtime_error("body needs 'merged' and 'candidates'");
  MatchingParams params = defaults;
  if (body.contains("params"))
    params = MatchingParams::from_json(body.at("params"), defaults);

  const auto merged = body.at("merged").get<FeatureCollection>();
  const auto candidates = body.at("candidates").get<FeatureCollection>();
  DedupResult result = deduplicate_lines(merged, candidates, params);

  Json out = FeatureCollection{std::move(result.kept)};
  out["removed"] = result.removed;
  return out;
}

Json summary_to_json(const RateSummary &s) {
  return Json{{"segments", s.segments},
              {"total_crashes", s.total_crashes},
              {"daily_vmt", s.daily_vmt},
              {"total_length_mi", s.total_length_mi},
              {"weighted_rate_per_100m_vmt", s.weighted_rate},
              {"miles_per_crash", s.miles_per_crash}};
}

Json rates_payload(const Json &body) {
  const auto fc = body.get<FeatureCollection>();
  const CategoryRates rates = weighted_rates(fc.features);
  return Json{{"all", summary_to_json(rates.all)},
              {"interstate", summary_to_json(rates.interstate)},
              {"non_interstate", summary_to_json(rates.non_interstate)}};
}
