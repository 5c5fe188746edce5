#include "vp/scene/BufferStore.hpp"
#include <cstring>

namespace vp {

const std::uint8_t* BufferStore::getBufferData(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return it->second.data.data();
}

std::uint32_t BufferStore::getBufferSize(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return 0;
  return static_cast<std::uint32_t>(it->second.data.size());
}

void BufferStore::ensureBuffer(Id id) {
  if (buffers_.find(id) == buffers_.end()) {
    CpuBuffer b;
    b.id = id;
    buffers_[id] = std::move(b);
  }
}

void BufferStore::setBufferData(Id id, const std::uint8_t* data, std::uint32_t len) {
  ensureBuffer(id);
  auto& d = buffers_[id].data;
  d.assign(data, data + len);
}

void BufferStore::setFloats(Id id, const std::vector<float>& values) {
  setBufferData(id, reinterpret_cast<const std::uint8_t*>(values.data()),
                static_cast<std::uint32_t>(values.size() * sizeof(float)));
}

std::vector<float> BufferStore::getFloats(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return {};
  const auto& d = it->second.data;
  std::vector<float> out(d.size() / sizeof(float));
  if (!out.empty()) std::memcpy(out.data(), d.data(), out.size() * sizeof(float));
  return out;
}

void BufferStore::eraseBuffer(Id id) {
  buffers_.erase(id);
}

void BufferStore::syncBufferLengths(Scene& scene) const {
  for (auto& [id, buf] : buffers_) {
    Buffer* b = scene.getBufferMutable(id);
    if (b) {
      b->byteLength = static_cast<std::uint32_t>(buf.data.size());
    }
  }
}

} // namespace vp
