#pragma once
#include "models/GeoFeature.hpp"
#include <iosfwd>
#include <string>
#include <utility>

// Reads a FeatureCollection file. Missing file / malformed JSON throw
// std::runtime_error with the path (and line/column for parse errors).
FeatureCollection load_feature_collection(const std::string &path);

// Writes compact JSON (no indentation), creating parent directories.
void save_feature_collection(const FeatureCollection &fc,
                             const std::string &path);

// Feature properties as CSV (no geometry), one column per name; absent
// properties are written empty.
void write_properties_csv(const FeatureCollection &fc,
                          const std::vector<std::string> &columns,
                          std::ostream &out);

// Returns (line, column) from a byte position in the raw text (1-based).
std::pair<std::size_t, std::size_t> calc_line_col(const std::string &s,
                                                  std::size_t byte_pos);
