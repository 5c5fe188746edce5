#include "vp/recipe/StyleCommands.hpp"
#include "vp/commands/CommandJson.hpp"

#include <cstdio>

namespace vp {

std::string makePaneRegionCmd(Id paneId, const PaneRegion& region) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setPaneRegion","id":%llu,"clipYMin":%.9g,"clipYMax":%.9g,"clipXMin":%.9g,"clipXMax":%.9g})",
    static_cast<unsigned long long>(paneId),
    static_cast<double>(region.clipYMin),
    static_cast<double>(region.clipYMax),
    static_cast<double>(region.clipXMin),
    static_cast<double>(region.clipXMax));
  return buf;
}

std::string makePaneStyleCmd(Id paneId, const PaneStyle& style) {
  char nums[160];
  std::snprintf(nums, sizeof(nums),
    R"("frameOn":%s,"colorbar":%s,"fontSize":%.9g,"legendFontSize":%.9g)",
    style.frameOn ? "true" : "false",
    style.colorbar ? "true" : "false",
    static_cast<double>(style.fontSize),
    static_cast<double>(style.legendFontSize));

  return R"({"cmd":"setPaneStyle","id":)" + idStr(paneId) +
         R"(,"title":)" + jsonQuote(style.title) +
         R"(,"xlabel":)" + jsonQuote(style.xlabel) +
         R"(,"ylabel":)" + jsonQuote(style.ylabel) +
         R"(,"legendLoc":)" + jsonQuote(style.legendLoc) +
         "," + nums + "}";
}

std::string makePaneDataRangeCmd(Id paneId, const DataRange& range) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setPaneDataRange","id":%llu,"xMin":%.17g,"xMax":%.17g,"yMin":%.17g,"yMax":%.17g})",
    static_cast<unsigned long long>(paneId),
    range.xMin, range.xMax, range.yMin, range.yMax);
  return buf;
}

std::string makeDrawItemStyleCmd(Id drawItemId, const DrawItemStyle& style) {
  char buf[320];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%llu,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g,)"
    R"("pointSize":%.9g,"lineWidth":%.9g,"dashLength":%.9g,"vmin":%.9g,"vmax":%.9g,"colorMap":)",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(style.color[0]),
    static_cast<double>(style.color[1]),
    static_cast<double>(style.color[2]),
    static_cast<double>(style.color[3]),
    static_cast<double>(style.pointSize),
    static_cast<double>(style.lineWidth),
    static_cast<double>(style.dashLength),
    static_cast<double>(style.vmin),
    static_cast<double>(style.vmax));
  return std::string(buf) + jsonQuote(style.colorMap) + "}";
}

} // namespace vp
