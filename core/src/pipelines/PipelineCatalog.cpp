#include "vp/pipelines/PipelineCatalog.hpp"

namespace vp {

static const PipelineSpec kPipelines[] = {
  {"points@1",   VertexFormat::Point3, true,  false},
  {"line2d@1",   VertexFormat::Rect4,  false, false},
  {"lineDash@1", VertexFormat::Rect4,  false, true},
};

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  for (const PipelineSpec& p : kPipelines) {
    if (key == p.key) return &p;
  }
  return nullptr;
}

} // namespace vp
