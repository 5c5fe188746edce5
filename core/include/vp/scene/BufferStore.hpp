#pragma once
#include "vp/ids/Id.hpp"
#include "vp/scene/Scene.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace vp {

// CPU-side vertex payloads for scene buffers.
class BufferStore {
public:
  const std::uint8_t* getBufferData(Id id) const;
  std::uint32_t getBufferSize(Id id) const;

  void ensureBuffer(Id id);
  void setBufferData(Id id, const std::uint8_t* data, std::uint32_t len);
  void setFloats(Id id, const std::vector<float>& values);
  std::vector<float> getFloats(Id id) const;
  void eraseBuffer(Id id);

  // Copy payload sizes into the scene's Buffer::byteLength.
  void syncBufferLengths(Scene& scene) const;

private:
  struct CpuBuffer {
    Id id{0};
    std::vector<std::uint8_t> data;
  };

  std::unordered_map<Id, CpuBuffer> buffers_;
};

} // namespace vp
