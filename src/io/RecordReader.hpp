#pragma once
#include "io/CsvTable.hpp"
#include "models/CoreTypes.hpp"
#include "models/SegmentModel.hpp"
#include <string>
#include <utility>
#include <vector>

// Conversions from already-read tables / JSON payloads into engine records.
// Required columns missing -> std::runtime_error; bad cells are kept as
// unparsed (nullopt) values.

// CORR_ID, CORR_MP, CORR_ENDMP, DEPT_ID required; TYC_AADT, SEC_LNT_MI
// optional.
std::vector<SegmentRecord> segments_from_table(const CsvTable &t);

// CORRIDOR, REF_POINT required.
std::vector<CrashEvent> crashes_from_table(const CsvTable &t);

// (DEPARTMENTAL ROUTE, SIGNED ROUTE) pairs in file order.
std::vector<std::pair<std::string, std::string>>
route_pairs_from_table(const CsvTable &t);

// Same records from JSON arrays of objects keyed by the column names.
std::vector<SegmentRecord> segments_from_json(const Json &arr);
std::vector<CrashEvent> crashes_from_json(const Json &arr);
