#include "vp/render/Figure.hpp"
#include "vp/commands/CommandJson.hpp"
#include "vp/recipe/StyleCommands.hpp"

#include <stdexcept>

namespace vp {

Figure::Figure(const FigureSize& size)
  : size_(size), cp_(scene_, reg_) {}

void Figure::apply(const std::string& cmd) {
  CmdResult r = cp_.applyJsonText(cmd);
  if (!r.ok) {
    throw std::runtime_error("Figure: " + r.err.code + ": " + r.err.message +
                             " " + r.err.details);
  }
}

void Figure::applyAll(const std::vector<std::string>& cmds) {
  for (const auto& cmd : cmds) apply(cmd);
}

void Figure::setVertices(Id bufferId, const std::vector<float>& values) {
  if (!scene_.hasBuffer(bufferId)) {
    throw std::runtime_error("Figure: setVertices on unknown buffer " + idStr(bufferId));
  }
  buffers_.setFloats(bufferId, values);
  buffers_.syncBufferLengths(scene_);
}

Id Figure::reserveIds(std::uint32_t count) {
  Id base = nextRecipeId_;
  nextRecipeId_ += count;
  return base;
}

void Figure::addPanels(const LayoutPlan& plan) {
  for (const auto& p : plan.panels) {
    std::string name = p.gene + "/" + toString(p.kind);
    apply(R"({"cmd":"createPane","id":)" + idStr(p.paneId) +
          R"(,"name":)" + jsonQuote(name) + "}");
    apply(makePaneRegionCmd(p.paneId, p.region));
    apply(R"({"cmd":"createLayer","id":)" + idStr(p.layerId) +
          R"(,"paneId":)" + idStr(p.paneId) + R"(,"name":"main"})");
  }
}

} // namespace vp
