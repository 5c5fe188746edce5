#pragma once
#include <algorithm>
#include <cmath>
#include <vector>

namespace vp {

// q-th percentile (q in [0, 100]) with linear interpolation between closest
// ranks. NaN values are ignored; returns NaN if no finite value remains.
inline float percentile(std::vector<float> values, float q) {
  values.erase(std::remove_if(values.begin(), values.end(),
                              [](float v) { return std::isnan(v); }),
               values.end());
  if (values.empty()) return std::nanf("");

  std::sort(values.begin(), values.end());
  q = std::max(0.0f, std::min(100.0f, q));

  double pos = static_cast<double>(q) / 100.0 * static_cast<double>(values.size() - 1);
  std::size_t lo = static_cast<std::size_t>(std::floor(pos));
  std::size_t hi = std::min(lo + 1, values.size() - 1);
  double frac = pos - static_cast<double>(lo);
  return static_cast<float>(values[lo] + frac * (values[hi] - values[lo]));
}

// Evenly spaced samples over [start, stop], both included.
inline std::vector<float> linspace(float start, float stop, int num = 50) {
  std::vector<float> out;
  if (num <= 0) return out;
  if (num == 1) { out.push_back(start); return out; }
  out.reserve(static_cast<std::size_t>(num));
  double step = (static_cast<double>(stop) - start) / static_cast<double>(num - 1);
  for (int i = 0; i < num; i++) {
    out.push_back(static_cast<float>(start + step * i));
  }
  out.back() = stop;
  return out;
}

} // namespace vp
