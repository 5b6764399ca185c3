#pragma once

#include <optional>
#include <string>

// Text helpers shared by the table readers and both matchers. Also defines
// SegmentKey::make / SegmentKey::to_string.

std::string trim(const std::string &s);
std::string to_upper(const std::string &s);

// Corridor / department ids are compared trimmed and upper-cased.
std::string normalize_id(const std::string &s);

// Drops one trailing ASCII letter: "N-1A" -> "N-1", "U-8133" unchanged.
// The input is normalized first.
std::string strip_trailing_letter(const std::string &s);

// Strict decimal parse: surrounding whitespace allowed, the rest must be a
// finite number. nullopt otherwise.
std::optional<double> parse_number(const std::string &s);

// "663+0.0150" -> 663.015, "000+0.0000" -> 0.0. Exactly one '+' is
// required; leading zeros of the major part are ignored and an empty major
// part reads as 0. Anything else is unparseable (nullopt).
std::optional<double> parse_milepost(const std::string &text);
