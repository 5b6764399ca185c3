#include "io/CsvTable.hpp"
#include "core/Milepost.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

static const std::string kEmpty;

std::vector<std::string> CsvTable::splitLine(const std::string &line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(std::move(cur));
  return out;
}

// True when a quoted field is still open at the end of `text`. Doubled
// quotes toggle twice and cancel out.
static bool inside_quotes(const std::string &text) {
  bool quoted = false;
  for (char c : text) {
    if (c == '"')
      quoted = !quoted;
  }
  return quoted;
}

static void chomp_cr(std::string &line) {
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
}

// One CSV record, which spans several physical lines when a quoted field
// holds line breaks. An unterminated quote runs to end of input.
static bool read_record(std::istream &in, std::string &record) {
  if (!std::getline(in, record))
    return false;
  chomp_cr(record);
  std::string more;
  while (inside_quotes(record) && std::getline(in, more)) {
    chomp_cr(more);
    record += '\n';
    record += more;
  }
  return true;
}

CsvTable CsvTable::parse(std::istream &in) {
  CsvTable t;
  t.source = "<stream>";
  std::string line;
  if (!read_record(in, line))
    return t;
  // UTF-8 BOM
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
    line.erase(0, 3);

  t.header_ = splitLine(line);
  for (std::size_t i = 0; i < t.header_.size(); ++i) {
    t.header_[i] = trim(t.header_[i]);
    t.column_index_.emplace(t.header_[i], i); // first duplicate wins
  }

  while (read_record(in, line)) {
    if (line.empty())
      continue;
    t.rows_.push_back(splitLine(line));
  }
  return t;
}

CsvTable CsvTable::load(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("Cannot open CSV file: " + path);
  CsvTable t = parse(in);
  t.source = path;
  std::cerr << "[csv] read " << path << " rows=" << t.rowCount()
            << " cols=" << t.header_.size() << "\n";
  return t;
}

bool CsvTable::hasColumn(const std::string &name) const {
  return column_index_.count(name) != 0;
}

const std::string &CsvTable::get(std::size_t row,
                                 const std::string &column) const {
  auto it = column_index_.find(column);
  if (it == column_index_.end() || row >= rows_.size())
    return kEmpty;
  const auto &r = rows_[row];
  return (it->second < r.size()) ? r[it->second] : kEmpty;
}

void CsvTable::requireColumns(
    std::initializer_list<const char *> columns) const {
  for (const char *c : columns) {
    if (!hasColumn(c))
      throw std::runtime_error(source + ": missing required column '" +
                               std::string(c) + "'");
  }
}

void write_csv_row(std::ostream &out, const std::vector<std::string> &fields) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i)
      out << ',';
    const std::string &f = fields[i];
    if (f.find_first_of(",\"\n\r") == std::string::npos) {
      out << f;
      continue;
    }
    out << '"';
    for (char c : f) {
      if (c == '"')
        out << '"';
      out << c;
    }
    out << '"';
  }
  out << '\n';
}
