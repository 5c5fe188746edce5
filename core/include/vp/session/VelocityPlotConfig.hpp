#pragma once
#include "vp/render/PanelStyle.hpp"

#include <string>
#include <vector>

namespace vp {

// Which genes, layers and fits to show.
struct SelectionOptions {
  std::vector<std::string> varNames;
  std::string groupBy;
  std::vector<std::string> groups;
  std::string vkey{"velocity"};
  bool allFits{false};
  std::vector<std::string> fits{"velocity", "dynamics"};
  bool allLayers{true};
  std::vector<std::string> layers;
  bool useRaw{false};
  std::string basis;  // empty = default embedding
};

struct LayoutOptions {
  bool stochastic{false};
  int ncols{1};
  float figWidth{7.0f};
  float figHeight{5.0f};
  int dpi{80};
  bool show{true};
  std::string save;  // empty = do not save
};

struct StyleOptions {
  PanelStyle panel;
  bool sizeSet{false};  // false = 120000 / n_cells / 2
  std::string theme{"light"};
};

struct VelocityPlotConfig {
  SelectionOptions selection;
  LayoutOptions layout;
  StyleOptions style;
};

// Load options from a JSON object. Keys not listed in the option table fail
// with "UNKNOWN_OPTION:<key>", values of the wrong type with "BAD_OPTION:<key>".
// On failure `out` is left untouched.
bool parseVelocityPlotConfig(const std::string& json, VelocityPlotConfig& out,
                             std::string& err);

} // namespace vp
