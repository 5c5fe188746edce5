#pragma once
#include <string>

namespace vp {

struct Theme {
  std::string name;

  float backgroundColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  // Uniform point color when no color key resolves
  float pointColor[4] = {0.5f, 0.5f, 0.5f, 1.0f};

  // Steady-state lines on phase portraits (round-robin)
  float fitColors[4][4] = {
    {0.5f, 0.0f, 0.5f, 1.0f},  // purple
    {0.0f, 0.5f, 0.0f, 1.0f},  // green
    {0.0f, 0.4f, 0.8f, 1.0f},  // blue
    {0.9f, 0.5f, 0.0f, 1.0f}   // orange
  };
  float fitLineWidth{1.5f};

  // Neutral dashed lines on stochastic panels
  float neutralLineColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float dashedLineWidth{1.0f};
  float dashLength{0.02f};

  // Categorical colorings use this map name
  std::string categoricalMap{"tab20"};
};

// Built-in presets
Theme lightTheme();
Theme darkTheme();

} // namespace vp
