#pragma once
#include "vp/render/Figure.hpp"

#include <memory>
#include <string>

namespace vp {

struct FinalizeOptions {
  bool show{true};
  std::string save;  // empty = do not save
  int dpi{80};
};

// Saves and/or shows a finished figure. Returns the figure when it is not
// shown, nullptr otherwise.
class Finalizer {
public:
  virtual ~Finalizer() = default;
  virtual std::unique_ptr<Figure> finalize(std::unique_ptr<Figure> figure,
                                           const FinalizeOptions& options) = 0;
};

} // namespace vp
