#pragma once
#include "core/CountyRates.hpp"
#include "io/CsvTable.hpp"
#include <iosfwd>

// COUNTY required. Rows with an empty county are not counted.
CountyCounts county_crashes_from_table(const CsvTable &t);

// COUNTY, TOT_POP required. A population that is not a whole number reads
// as 0; a repeated county keeps its last row.
CountyPopulations county_populations_from_table(const CsvTable &t);

// county,totalAccidents,accidentsPer100kResidents with the rate at two
// decimals, empty when absent.
void write_county_ranking(const std::vector<CountyRate> &rows,
                          std::ostream &out);
