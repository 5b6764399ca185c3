#include "io/CountyTables.hpp"
#include "core/Milepost.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

CountyCounts county_crashes_from_table(const CsvTable &t) {
  t.requireColumns({"COUNTY"});
  CountyCounts counts;
  for (std::size_t i = 0; i < t.rowCount(); ++i) {
    const std::string key = county_key(t.get(i, "COUNTY"));
    if (!key.empty())
      ++counts[key];
  }
  return counts;
}

CountyPopulations county_populations_from_table(const CsvTable &t) {
  t.requireColumns({"COUNTY", "TOT_POP"});
  CountyPopulations pops;
  for (std::size_t i = 0; i < t.rowCount(); ++i) {
    const std::string key = county_key(t.get(i, "COUNTY"));
    if (key.empty())
      continue;
    const auto v = parse_number(t.get(i, "TOT_POP"));
    const bool whole = v && std::floor(*v) == *v && std::fabs(*v) < 9.0e15;
    pops[key] = whole ? static_cast<long long>(*v) : 0;
  }
  return pops;
}

void write_county_ranking(const std::vector<CountyRate> &rows,
                          std::ostream &out) {
  write_csv_row(out, {"county", "totalAccidents", "accidentsPer100kResidents"});
  for (const auto &r : rows) {
    std::string rate;
    if (r.per_100k) {
      std::ostringstream ss;
      ss << std::fixed << std::setprecision(2) << *r.per_100k;
      rate = ss.str();
    }
    write_csv_row(out, {r.county, std::to_string(r.total_crashes), rate});
  }
}
