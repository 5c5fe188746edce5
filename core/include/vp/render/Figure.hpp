#pragma once
#include "vp/commands/CommandProcessor.hpp"
#include "vp/layout/LayoutPlanner.hpp"
#include "vp/scene/BufferStore.hpp"
#include "vp/scene/ResourceRegistry.hpp"
#include "vp/scene/Scene.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vp {

// The shared rendering surface of one plot call: a scene graph mutated only
// through JSON commands, plus CPU-side vertex payloads.
class Figure {
public:
  explicit Figure(const FigureSize& size);

  Figure(const Figure&) = delete;
  Figure& operator=(const Figure&) = delete;

  const FigureSize& size() const { return size_; }

  const Scene& scene() const { return scene_; }
  const ResourceRegistry& registry() const { return reg_; }
  CommandProcessor& commands() { return cp_; }
  const CommandProcessor& commands() const { return cp_; }
  const BufferStore& buffers() const { return buffers_; }

  // Apply a command; throws std::runtime_error carrying the CmdError on failure.
  void apply(const std::string& cmd);
  void applyAll(const std::vector<std::string>& cmds);

  // One frame per gene; a finalized figure has no open frame.
  void beginFrame() { apply(R"({"cmd":"beginFrame"})"); }
  void commitFrame() { apply(R"({"cmd":"commitFrame"})"); }

  // Store vertex floats for a buffer and update its byteLength.
  void setVertices(Id bufferId, const std::vector<float>& values);

  // Reserve a contiguous block of recipe IDs.
  Id reserveIds(std::uint32_t count);

  // Create one pane (+ layer) per planned panel, in plan order.
  void addPanels(const LayoutPlan& plan);

  static constexpr Id kRecipeIdBase = 1000000000ull;

private:
  FigureSize size_;
  Scene scene_;
  ResourceRegistry reg_;
  CommandProcessor cp_;
  BufferStore buffers_;
  Id nextRecipeId_{kRecipeIdBase};
};

} // namespace vp
