#include "vp/scene/Scene.hpp"
#include <algorithm>

namespace vp {

bool Scene::hasPane(Id id) const     { return panes_.find(id) != panes_.end(); }
bool Scene::hasLayer(Id id) const    { return layers_.find(id) != layers_.end(); }
bool Scene::hasDrawItem(Id id) const { return drawItems_.find(id) != drawItems_.end(); }
bool Scene::hasBuffer(Id id) const   { return buffers_.find(id) != buffers_.end(); }
bool Scene::hasGeometry(Id id) const { return geometries_.find(id) != geometries_.end(); }

const Pane* Scene::getPane(Id id) const {
  auto it = panes_.find(id);
  return it == panes_.end() ? nullptr : &it->second;
}
const Layer* Scene::getLayer(Id id) const {
  auto it = layers_.find(id);
  return it == layers_.end() ? nullptr : &it->second;
}
const DrawItem* Scene::getDrawItem(Id id) const {
  auto it = drawItems_.find(id);
  return it == drawItems_.end() ? nullptr : &it->second;
}
const Buffer* Scene::getBuffer(Id id) const {
  auto it = buffers_.find(id);
  return it == buffers_.end() ? nullptr : &it->second;
}
const Geometry* Scene::getGeometry(Id id) const {
  auto it = geometries_.find(id);
  return it == geometries_.end() ? nullptr : &it->second;
}
Pane* Scene::getPaneMutable(Id id) {
  auto it = panes_.find(id);
  return it == panes_.end() ? nullptr : &it->second;
}
DrawItem* Scene::getDrawItemMutable(Id id) {
  auto it = drawItems_.find(id);
  return it == drawItems_.end() ? nullptr : &it->second;
}
Buffer* Scene::getBufferMutable(Id id) {
  auto it = buffers_.find(id);
  return it == buffers_.end() ? nullptr : &it->second;
}

void Scene::addPane(Pane p)         { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)       { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d) { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)     { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g) { geometries_[g.id] = std::move(g); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  auto it = drawItems_.find(drawItemId);
  if (it == drawItems_.end()) return {};
  drawItems_.erase(it);
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  auto it = layers_.find(layerId);
  if (it == layers_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  for (Id id : drawItemsOfLayer(layerId)) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }

  layers_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  auto it = panes_.find(paneId);
  if (it == panes_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  for (Id lid : layersOfPane(paneId)) {
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }

  panes_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  auto it = buffers_.find(bufferId);
  if (it == buffers_.end()) return {};
  buffers_.erase(it);
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  auto it = geometries_.find(geometryId);
  if (it == geometries_.end()) return {};
  geometries_.erase(it);
  return {geometryId};
}

template <typename Map>
static std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return sortedKeys(buffers_); }
std::vector<Id> Scene::geometryIds() const { return sortedKeys(geometries_); }

std::vector<Id> Scene::layersOfPane(Id paneId) const {
  std::vector<Id> out;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> Scene::drawItemsOfLayer(Id layerId) const {
  std::vector<Id> out;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> Scene::drawItemsOfPane(Id paneId) const {
  std::vector<Id> out;
  for (Id lid : layersOfPane(paneId)) {
    auto items = drawItemsOfLayer(lid);
    out.insert(out.end(), items.begin(), items.end());
  }
  return out;
}

} // namespace vp
