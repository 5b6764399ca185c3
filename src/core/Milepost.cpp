#include "core/Milepost.hpp"
#include "models/SegmentModel.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

std::string trim(const std::string &s) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  return (b < e) ? std::string(b, e) : std::string();
}

std::string to_upper(const std::string &s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string normalize_id(const std::string &s) { return to_upper(trim(s)); }

std::string strip_trailing_letter(const std::string &s) {
  std::string out = normalize_id(s);
  if (!out.empty() && std::isalpha(static_cast<unsigned char>(out.back())))
    out.pop_back();
  return out;
}

std::optional<double> parse_number(const std::string &s) {
  const std::string t = trim(s);
  if (t.empty())
    return std::nullopt;
  try {
    std::size_t used = 0;
    const double v = std::stod(t, &used);
    if (used != t.size() || !std::isfinite(v))
      return std::nullopt;
    return v;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<double> parse_milepost(const std::string &text) {
  const auto plus = text.find('+');
  if (plus == std::string::npos || text.find('+', plus + 1) != std::string::npos)
    return std::nullopt;

  std::string major = trim(text.substr(0, plus));
  const std::string minor = text.substr(plus + 1);

  const auto nz = major.find_first_not_of('0');
  major = (nz == std::string::npos) ? "0" : major.substr(nz);

  auto a = parse_number(major);
  auto b = parse_number(minor);
  if (!a || !b)
    return std::nullopt;
  return *a + *b;
}

// ---- SegmentKey ----

SegmentKey SegmentKey::make(const std::string &corr_id, const std::string &mp,
                            const std::string &endmp,
                            const std::string &dept) {
  return SegmentKey{normalize_id(corr_id), mp, endmp, normalize_id(dept)};
}

std::string SegmentKey::to_string() const {
  return corridor + "_" + start_mp + "_" + end_mp + "_" + dept_id;
}
