#include "vp/export/FigureExport.hpp"
#include "vp/pipelines/PipelineCatalog.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <stdexcept>

namespace vp {

static rapidjson::Value colorArray(const float* c, rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (int i = 0; i < 4; i++) arr.PushBack(c[i], alloc);
  return arr;
}

static rapidjson::Value drawItemJson(const Figure& figure, const DrawItem& di,
                                     rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  obj.AddMember("id", di.id, alloc);
  obj.AddMember("name", rapidjson::Value(di.name.c_str(), alloc), alloc);
  obj.AddMember("pipeline", rapidjson::Value(di.pipeline.c_str(), alloc), alloc);
  if (const PipelineSpec* pipe = PipelineCatalog().find(di.pipeline)) {
    obj.AddMember("colorMapped", pipe->colorMapped, alloc);
    obj.AddMember("dashed", pipe->dashed, alloc);
  }

  rapidjson::Value st(rapidjson::kObjectType);
  st.AddMember("color", colorArray(di.style.color, alloc), alloc);
  st.AddMember("pointSize", di.style.pointSize, alloc);
  st.AddMember("lineWidth", di.style.lineWidth, alloc);
  st.AddMember("dashLength", di.style.dashLength, alloc);
  st.AddMember("colorMap", rapidjson::Value(di.style.colorMap.c_str(), alloc), alloc);
  st.AddMember("vmin", di.style.vmin, alloc);
  st.AddMember("vmax", di.style.vmax, alloc);
  obj.AddMember("style", st, alloc);

  const Geometry* geo = figure.scene().getGeometry(di.geometryId);
  if (geo) {
    obj.AddMember("format", rapidjson::Value(toString(geo->format), alloc), alloc);
    obj.AddMember("vertexCount", geo->vertexCount, alloc);
    rapidjson::Value verts(rapidjson::kArrayType);
    for (float f : figure.buffers().getFloats(geo->vertexBufferId)) {
      verts.PushBack(f, alloc);
    }
    obj.AddMember("vertices", verts, alloc);
  }
  return obj;
}

std::string serializeFigure(const Figure& figure) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();
  const Scene& scene = figure.scene();

  // Figure size
  rapidjson::Value size(rapidjson::kObjectType);
  size.AddMember("widthIn", figure.size().widthIn, alloc);
  size.AddMember("heightIn", figure.size().heightIn, alloc);
  size.AddMember("dpi", figure.size().dpi, alloc);
  size.AddMember("pixelWidth", figure.size().pixelWidth, alloc);
  size.AddMember("pixelHeight", figure.size().pixelHeight, alloc);
  size.AddMember("frames", figure.commands().frameCount(), alloc);
  doc.AddMember("figure", size, alloc);

  rapidjson::Value panes(rapidjson::kArrayType);
  for (Id paneId : scene.paneIds()) {
    const Pane* p = scene.getPane(paneId);
    rapidjson::Value pane(rapidjson::kObjectType);
    pane.AddMember("id", p->id, alloc);
    pane.AddMember("name", rapidjson::Value(p->name.c_str(), alloc), alloc);

    rapidjson::Value region(rapidjson::kObjectType);
    region.AddMember("clipXMin", p->region.clipXMin, alloc);
    region.AddMember("clipXMax", p->region.clipXMax, alloc);
    region.AddMember("clipYMin", p->region.clipYMin, alloc);
    region.AddMember("clipYMax", p->region.clipYMax, alloc);
    pane.AddMember("region", region, alloc);

    rapidjson::Value st(rapidjson::kObjectType);
    st.AddMember("title", rapidjson::Value(p->style.title.c_str(), alloc), alloc);
    st.AddMember("xlabel", rapidjson::Value(p->style.xlabel.c_str(), alloc), alloc);
    st.AddMember("ylabel", rapidjson::Value(p->style.ylabel.c_str(), alloc), alloc);
    st.AddMember("frameOn", p->style.frameOn, alloc);
    st.AddMember("colorbar", p->style.colorbar, alloc);
    st.AddMember("legendLoc", rapidjson::Value(p->style.legendLoc.c_str(), alloc), alloc);
    st.AddMember("fontSize", p->style.fontSize, alloc);
    st.AddMember("legendFontSize", p->style.legendFontSize, alloc);
    pane.AddMember("style", st, alloc);

    if (p->hasDataRange) {
      rapidjson::Value dr(rapidjson::kObjectType);
      dr.AddMember("xMin", p->dataRange.xMin, alloc);
      dr.AddMember("xMax", p->dataRange.xMax, alloc);
      dr.AddMember("yMin", p->dataRange.yMin, alloc);
      dr.AddMember("yMax", p->dataRange.yMax, alloc);
      pane.AddMember("dataRange", dr, alloc);
    }

    rapidjson::Value items(rapidjson::kArrayType);
    for (Id diId : scene.drawItemsOfPane(paneId)) {
      const DrawItem* di = scene.getDrawItem(diId);
      if (di) items.PushBack(drawItemJson(figure, *di, alloc), alloc);
    }
    pane.AddMember("drawItems", items, alloc);

    panes.PushBack(pane, alloc);
  }
  doc.AddMember("panes", panes, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool writeFigureJson(const std::string& path, const Figure& figure) {
  std::string json = serializeFigure(figure);
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  std::size_t written = std::fwrite(json.data(), 1, json.size(), f);
  bool ok = written == json.size();
  if (std::fclose(f) != 0) ok = false;
  return ok;
}

std::string resolveSavePath(const std::string& save) {
  static const std::string ext = ".json";
  if (save.size() >= ext.size() &&
      save.compare(save.size() - ext.size(), ext.size(), ext) == 0) {
    return save;
  }
  return "velocity_" + save + ext;
}

std::unique_ptr<Figure> JsonFigureFinalizer::finalize(std::unique_ptr<Figure> figure,
                                                      const FinalizeOptions& options) {
  if (!figure) throw std::invalid_argument("JsonFigureFinalizer: null figure");
  if (figure->commands().inFrame()) {
    throw std::logic_error("JsonFigureFinalizer: figure has an open frame");
  }

  if (!options.save.empty()) {
    std::string path = resolveSavePath(options.save);
    if (!writeFigureJson(path, *figure)) {
      throw std::runtime_error("JsonFigureFinalizer: cannot write " + path);
    }
    lastSavedPath_ = path;
    std::fprintf(stderr, "[Figure] saved %s (dpi %d)\n", path.c_str(), options.dpi);
  }

  if (options.show) {
    const FigureSize& sz = figure->size();
    std::fprintf(stderr, "[Figure] %zu panes, %zu draw items, %.1fx%.1f in @ %d dpi\n",
                 figure->registry().count(ResourceKind::Pane),
                 figure->registry().count(ResourceKind::DrawItem),
                 static_cast<double>(sz.widthIn), static_cast<double>(sz.heightIn), sz.dpi);
    return nullptr;
  }
  return figure;
}

} // namespace vp
