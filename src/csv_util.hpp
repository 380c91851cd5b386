#pragma once
// Private helpers shared by the CSV-style loaders (track points, ride config).
#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rcr::detail {

inline std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

// Simple CSV: no quoted fields. Trailing "# ..." on a row is dropped.
inline std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == '#') break;
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

inline std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

inline std::optional<bool> to_bool(const std::string& s) {
  const std::string v = lower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "on")  return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  return std::nullopt;
}

} // namespace rcr::detail
