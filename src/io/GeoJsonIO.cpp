#include "io/GeoJsonIO.hpp"
#include "core/FieldRules.hpp"
#include "io/CsvTable.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::pair<std::size_t, std::size_t> calc_line_col(const std::string &s,
                                                  std::size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  std::size_t line = 1, col = 1;
  for (std::size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

FeatureCollection load_feature_collection(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("Cannot open GeoJSON file: " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  const std::string raw = buf.str();

  Json j;
  try {
    j = Json::parse(raw);
  } catch (const Json::parse_error &e) {
    auto [line, col] = calc_line_col(raw, e.byte);
    throw std::runtime_error(path + ":" + std::to_string(line) + ":" +
                             std::to_string(col) + ": " + e.what());
  }
  if (!j.is_object())
    throw std::runtime_error(path + ": top level is not a JSON object");

  FeatureCollection fc = j.get<FeatureCollection>();
  std::cerr << "[geojson] read " << path << " features=" << fc.features.size()
            << "\n";
  return fc;
}

void save_feature_collection(const FeatureCollection &fc,
                             const std::string &path) {
  const fs::path p(path);
  if (p.has_parent_path())
    fs::create_directories(p.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out)
    throw std::runtime_error("Cannot write GeoJSON file: " + path);
  const Json j = fc;
  out << j.dump();
  if (!out)
    throw std::runtime_error("Write failed: " + path);
  std::cerr << "[geojson] wrote " << path
            << " features=" << fc.features.size() << "\n";
}

void write_properties_csv(const FeatureCollection &fc,
                          const std::vector<std::string> &columns,
                          std::ostream &out) {
  write_csv_row(out, columns);
  std::vector<std::string> row(columns.size());
  for (const auto &f : fc.features) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      auto it = f.properties.find(columns[i]);
      row[i] = (it == f.properties.end()) ? std::string() : json_text(*it);
    }
    write_csv_row(out, row);
  }
}
