#include "vp/style/Theme.hpp"

namespace vp {

Theme lightTheme() {
  Theme t;
  t.name = "Light";
  // All fields already carry the light-theme defaults from the struct initializers.
  return t;
}

Theme darkTheme() {
  Theme t;
  t.name = "Dark";

  t.backgroundColor[0] = 0.1f; t.backgroundColor[1] = 0.1f;
  t.backgroundColor[2] = 0.12f; t.backgroundColor[3] = 1.0f;

  t.pointColor[0] = 0.7f; t.pointColor[1] = 0.7f;
  t.pointColor[2] = 0.75f; t.pointColor[3] = 1.0f;

  t.fitColors[0][0] = 0.8f; t.fitColors[0][1] = 0.4f;
  t.fitColors[0][2] = 0.9f; t.fitColors[0][3] = 1.0f;

  t.fitColors[1][0] = 0.3f; t.fitColors[1][1] = 0.9f;
  t.fitColors[1][2] = 0.4f; t.fitColors[1][3] = 1.0f;

  t.neutralLineColor[0] = 0.9f; t.neutralLineColor[1] = 0.9f;
  t.neutralLineColor[2] = 0.92f; t.neutralLineColor[3] = 1.0f;

  return t;
}

} // namespace vp
