#pragma once

#include <initializer_list>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

// Header-addressed CSV table, all cells kept as text. Quoted fields may
// hold "" escapes, commas and line breaks (read back as '\n').
class CsvTable {
public:
  static CsvTable load(const std::string &path); // throws on open failure
  static CsvTable parse(std::istream &in);

  const std::vector<std::string> &header() const noexcept { return header_; }
  std::size_t rowCount() const noexcept { return rows_.size(); }
  bool hasColumn(const std::string &name) const;

  // Cell text, or "" for a missing column or short row.
  const std::string &get(std::size_t row, const std::string &column) const;

  // Throws std::runtime_error naming the first absent column.
  void requireColumns(std::initializer_list<const char *> columns) const;

  static std::vector<std::string> splitLine(const std::string &line);

  std::string source; // path or "<stream>", for messages

private:
  std::vector<std::string> header_;
  std::unordered_map<std::string, std::size_t> column_index_;
  std::vector<std::vector<std::string>> rows_;
};

// Writes one CSV record, quoting fields that need it.
void write_csv_row(std::ostream &out, const std::vector<std::string> &fields);
