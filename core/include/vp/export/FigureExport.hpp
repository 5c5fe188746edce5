#pragma once
#include "vp/collab/Finalizer.hpp"
#include "vp/render/Figure.hpp"

#include <memory>
#include <string>

namespace vp {

// Scene description of a figure: size, panes (region, style, data range) and
// the draw items of each pane with their vertex payloads.
std::string serializeFigure(const Figure& figure);

// Write serializeFigure() output to a file. Returns false on I/O failure.
bool writeFigureJson(const std::string& path, const Figure& figure);

// "name" -> "velocity_name.json"; paths already ending in ".json" are kept.
std::string resolveSavePath(const std::string& save);

// Default finalizer: saves the scene description and logs a summary on show.
class JsonFigureFinalizer : public Finalizer {
public:
  std::unique_ptr<Figure> finalize(std::unique_ptr<Figure> figure,
                                   const FinalizeOptions& options) override;

  const std::string& lastSavedPath() const { return lastSavedPath_; }

private:
  std::string lastSavedPath_;
};

} // namespace vp
