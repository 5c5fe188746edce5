#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace vp {

// Scene resource handle. Panes and layers take small ids from the layout
// plan; recipe resources are allocated from a high base.
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Decimal string form of an id, as accepted in command JSON.
// Throws std::invalid_argument on non-digits or overflow.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;
  constexpr Id kMax = std::numeric_limits<Id>::max();
  Id v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::invalid_argument("id '" + s + "' is not decimal");
    Id digit = static_cast<Id>(c - '0');
    if (v > (kMax - digit) / 10) throw std::invalid_argument("id '" + s + "' overflows");
    v = v * 10 + digit;
  }
  return v;
}

inline std::string idStr(Id id) { return std::to_string(id); }

} // namespace vp
