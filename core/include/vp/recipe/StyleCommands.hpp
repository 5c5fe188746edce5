#pragma once
#include "vp/scene/Types.hpp"
#include <string>

namespace vp {

// JSON command builders for pane/draw-item state.
std::string makePaneRegionCmd(Id paneId, const PaneRegion& region);
std::string makePaneStyleCmd(Id paneId, const PaneStyle& style);
std::string makePaneDataRangeCmd(Id paneId, const DataRange& range);
std::string makeDrawItemStyleCmd(Id drawItemId, const DrawItemStyle& style);

} // namespace vp
