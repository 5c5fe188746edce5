#pragma once
#include <stdexcept>
#include <string>

namespace vp {

// Raised before any drawing when the requested plot cannot be configured
// (no gene source, nothing left to select, no embedding, bad column count).
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what)
    : std::runtime_error(what) {}
};

} // namespace vp
