#include "io/RecordReader.hpp"
#include "core/FieldRules.hpp"
#include "core/Milepost.hpp"

#include <stdexcept>

static SegmentRecord make_segment(const std::string &corr,
                                  const std::string &mp,
                                  const std::string &endmp,
                                  const std::string &dept,
                                  const std::string &aadt,
                                  const std::string &len) {
  SegmentRecord r;
  r.key = SegmentKey::make(corr, mp, endmp, dept);
  r.start_mp = parse_milepost(mp);
  r.end_mp = parse_milepost(endmp);
  r.aadt = parse_number(aadt);
  r.length_mi = parse_number(len);
  r.years_with_data = r.aadt ? 1 : 0;
  return r;
}

std::vector<SegmentRecord> segments_from_table(const CsvTable &t) {
  t.requireColumns({"CORR_ID", "CORR_MP", "CORR_ENDMP", "DEPT_ID"});
  std::vector<SegmentRecord> out;
  out.reserve(t.rowCount());
  for (std::size_t i = 0; i < t.rowCount(); ++i) {
    out.push_back(make_segment(t.get(i, "CORR_ID"), t.get(i, "CORR_MP"),
                               t.get(i, "CORR_ENDMP"), t.get(i, "DEPT_ID"),
                               t.get(i, "TYC_AADT"), t.get(i, "SEC_LNT_MI")));
  }
  return out;
}

std::vector<CrashEvent> crashes_from_table(const CsvTable &t) {
  t.requireColumns({"CORRIDOR", "REF_POINT"});
  std::vector<CrashEvent> out;
  out.reserve(t.rowCount());
  for (std::size_t i = 0; i < t.rowCount(); ++i)
    out.push_back(CrashEvent{t.get(i, "CORRIDOR"), t.get(i, "REF_POINT")});
  return out;
}

std::vector<std::pair<std::string, std::string>>
route_pairs_from_table(const CsvTable &t) {
  t.requireColumns({"DEPARTMENTAL ROUTE", "SIGNED ROUTE"});
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(t.rowCount());
  for (std::size_t i = 0; i < t.rowCount(); ++i)
    out.emplace_back(t.get(i, "DEPARTMENTAL ROUTE"), t.get(i, "SIGNED ROUTE"));
  return out;
}

static std::string field(const Json &obj, const char *name) {
  auto it = obj.find(name);
  return (it == obj.end()) ? std::string() : json_text(*it);
}

std::vector<SegmentRecord> segments_from_json(const Json &arr) {
  if (!arr.is_array())
    throw std::runtime_error("segments must be an array of objects");
  std::vector<SegmentRecord> out;
  out.reserve(arr.size());
  for (const auto &o : arr) {
    if (!o.is_object())
      continue;
    out.push_back(make_segment(field(o, "CORR_ID"), field(o, "CORR_MP"),
                               field(o, "CORR_ENDMP"), field(o, "DEPT_ID"),
                               field(o, "TYC_AADT"), field(o, "SEC_LNT_MI")));
  }
  return out;
}

std::vector<CrashEvent> crashes_from_json(const Json &arr) {
  if (!arr.is_array())
    throw std::runtime_error("crashes must be an array of objects");
  std::vector<CrashEvent> out;
  out.reserve(arr.size());
  for (const auto &o : arr) {
    if (!o.is_object())
      continue;
    out.push_back(CrashEvent{field(o, "CORRIDOR"), field(o, "REF_POINT")});
  }
  return out;
}
