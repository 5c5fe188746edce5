#include "vp/render/SceneScatterRenderer.hpp"
#include "vp/math/Percentile.hpp"
#include "vp/recipe/LineRecipe.hpp"
#include "vp/recipe/ScatterRecipe.hpp"
#include "vp/recipe/StyleCommands.hpp"
#include "vp/render/Figure.hpp"
#include "vp/select/FitParams.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace vp {

static const Pane& requirePane(const Figure& figure, Id paneId) {
  const Pane* pane = figure.scene().getPane(paneId);
  if (!pane) {
    throw std::runtime_error("SceneScatterRenderer: unknown pane " + idStr(paneId));
  }
  return *pane;
}

DataRange SceneScatterRenderer::computeDataRange(const std::vector<float>& x,
                                                 const std::vector<float>& y,
                                                 float marginFraction) {
  double xMin = std::numeric_limits<double>::max(), xMax = -xMin;
  double yMin = xMin, yMax = -xMin;
  bool any = false;

  const std::size_t n = std::min(x.size(), y.size());
  for (std::size_t i = 0; i < n; i++) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
    xMin = std::min(xMin, static_cast<double>(x[i]));
    xMax = std::max(xMax, static_cast<double>(x[i]));
    yMin = std::min(yMin, static_cast<double>(y[i]));
    yMax = std::max(yMax, static_cast<double>(y[i]));
    any = true;
  }

  DataRange r;
  if (!any) return r;

  auto pad = [marginFraction](double& lo, double& hi) {
    double span = hi - lo;
    if (span <= 0.0) {
      lo -= 0.5;
      hi += 0.5;
      return;
    }
    lo -= span * marginFraction;
    hi += span * marginFraction;
  };
  pad(xMin, xMax);
  pad(yMin, yMax);

  r.xMin = xMin; r.xMax = xMax;
  r.yMin = yMin; r.yMax = yMax;
  return r;
}

ColorValues SceneScatterRenderer::resolveColor(const Dataset& dataset,
                                               const ScatterRequest& request) {
  ColorValues cv;

  if (!request.colorLayer.empty()) {
    cv.kind = ColorValues::Kind::Continuous;
    cv.values = dataset.layer(request.colorLayer).column(dataset.geneIndex(request.color));
    return cv;
  }

  if (request.color.empty()) return cv;

  if (dataset.hasObsKey(request.color)) {
    const Categorical& cat = dataset.obsCategorical(request.color);
    cv.kind = ColorValues::Kind::Categorical;
    cv.categoryCount = cat.categories.size();
    cv.values.reserve(cat.codes.size());
    for (int code : cat.codes) {
      cv.values.push_back(code < 0 ? std::nanf("") : static_cast<float>(code));
    }
    return cv;
  }

  if ((request.color == "X" && dataset.hasX()) || dataset.hasLayer(request.color)) {
    if (auto gene = dataset.findGene(request.gene)) {
      cv.kind = ColorValues::Kind::Continuous;
      cv.values = dataset.layer(request.color).column(*gene);
      return cv;
    }
  }

  if (dataset.hasGene(request.color) && dataset.hasX()) {
    cv.kind = ColorValues::Kind::Continuous;
    cv.values = dataset.layer("X").column(dataset.geneIndex(request.color));
    return cv;
  }

  std::fprintf(stderr, "[SceneScatterRenderer] color key '%s' not found; using uniform color\n",
               request.color.c_str());
  return cv;
}

void SceneScatterRenderer::renderScatter(Figure& figure, const Dataset& dataset,
                                         const ScatterRequest& request, const Panel& target) {
  std::vector<float> x, y;
  if (request.source == ScatterRequest::Source::Embedding) {
    const auto& xy = dataset.embedding(request.basis);
    x.reserve(dataset.nCells());
    y.reserve(dataset.nCells());
    for (std::size_t c = 0; c < dataset.nCells(); c++) {
      x.push_back(xy[2 * c]);
      y.push_back(xy[2 * c + 1]);
    }
  } else {
    if (request.x.size() != request.y.size()) {
      throw std::invalid_argument("SceneScatterRenderer: x and y lengths differ");
    }
    x = request.x;
    y = request.y;
  }

  ColorValues color = resolveColor(dataset, request);
  DataRange range = computeDataRange(x, y, config_.marginFraction);
  const PaneRegion region = requirePane(figure, target.paneId).region;
  std::vector<float> points = ScatterRecipe::computePoints(x, y, color.values, range, region);

  ScatterRecipeConfig rc;
  rc.layerId = target.layerId;
  rc.name = target.gene + "_scatter";
  rc.pointCount = static_cast<std::uint32_t>(points.size() / 3);
  ScatterRecipe recipe(figure.reserveIds(ScatterRecipe::ID_SLOTS), rc);
  figure.applyAll(recipe.build().createCommands);
  figure.setVertices(recipe.bufferId(), points);

  DrawItemStyle st;
  st.pointSize = request.size;
  for (int i = 0; i < 3; i++) st.color[i] = config_.theme.pointColor[i];
  st.color[3] = request.alpha;
  if (color.kind == ColorValues::Kind::Continuous) {
    st.colorMap = request.colorMap;
    float lo = request.usePerc ? percentile(color.values, request.percLow)
                               : percentile(color.values, 0.0f);
    float hi = request.usePerc ? percentile(color.values, request.percHigh)
                               : percentile(color.values, 100.0f);
    if (std::isfinite(lo) && std::isfinite(hi)) {
      st.vmin = lo;
      st.vmax = std::max(lo, hi);
    }
  } else if (color.kind == ColorValues::Kind::Categorical) {
    st.colorMap = config_.theme.categoricalMap;
    st.vmin = 0.0f;
    st.vmax = color.categoryCount > 0 ? static_cast<float>(color.categoryCount - 1) : 0.0f;
  }
  figure.apply(makeDrawItemStyleCmd(recipe.drawItemId(), st));

  PaneStyle ps;
  ps.title = request.title;
  ps.xlabel = request.xlabel;
  ps.ylabel = request.ylabel;
  ps.frameOn = request.frameOn;
  ps.colorbar = request.colorbar && color.kind == ColorValues::Kind::Continuous;
  ps.legendLoc = request.legendLoc;
  ps.fontSize = request.fontSize;
  ps.legendFontSize = request.legendFontSize;
  figure.apply(makePaneStyleCmd(target.paneId, ps));
  figure.apply(makePaneDataRangeCmd(target.paneId, range));

  drawFitLines(figure, dataset, request, target, x, range);
}

// Steady-state lines u = gamma/beta * s + offset/beta; "dynamics" reads the
// "fit_" parameter columns.
void SceneScatterRenderer::drawFitLines(Figure& figure, const Dataset& dataset,
                                        const ScatterRequest& request, const Panel& target,
                                        const std::vector<float>& x, const DataRange& range) {
  if (request.fitLines.empty()) return;
  auto gene = dataset.findGene(request.gene);
  if (!gene) return;

  float xMax = 0.0f;
  for (float v : x) {
    if (std::isfinite(v)) xMax = std::max(xMax, v);
  }
  std::vector<float> xs = linspace(0.0f, xMax, config_.fitLineSamples);
  const PaneRegion region = requirePane(figure, target.paneId).region;

  std::size_t drawn = 0;
  for (const auto& fit : request.fitLines) {
    const std::string prefix = fit == "dynamics" ? "fit" : fit;
    if (!dataset.hasVarColumn(prefix + "_gamma")) continue;

    FitParams p = lookupFitParams(dataset, prefix, *gene);
    std::vector<float> ys;
    ys.reserve(xs.size());
    for (float xv : xs) {
      ys.push_back(static_cast<float>(p.gamma / p.beta * xv + p.offset / p.beta));
    }

    std::vector<float> segs = LineRecipe::computeSegments(xs, ys, range, region);
    LineRecipeConfig lc;
    lc.layerId = target.layerId;
    lc.name = fit;
    lc.segmentCount = static_cast<std::uint32_t>(segs.size() / 4);
    lc.dashed = false;
    LineRecipe recipe(figure.reserveIds(LineRecipe::ID_SLOTS), lc);
    figure.applyAll(recipe.build().createCommands);
    figure.setVertices(recipe.bufferId(), segs);

    DrawItemStyle st;
    const float* c = config_.theme.fitColors[drawn % 4u];
    for (int i = 0; i < 4; i++) st.color[i] = c[i];
    st.lineWidth = config_.theme.fitLineWidth;
    figure.apply(makeDrawItemStyleCmd(recipe.drawItemId(), st));
    drawn++;
  }
}

void SceneScatterRenderer::renderLine(Figure& figure, const LineRequest& request,
                                      const Panel& target) {
  const Pane pane = requirePane(figure, target.paneId);
  DataRange range = pane.hasDataRange
      ? pane.dataRange
      : computeDataRange(request.x, request.y, config_.marginFraction);

  std::vector<float> segs = LineRecipe::computeSegments(request.x, request.y, range, pane.region);

  LineRecipeConfig lc;
  lc.layerId = target.layerId;
  lc.name = request.name;
  lc.segmentCount = static_cast<std::uint32_t>(segs.size() / 4);
  lc.dashed = request.dashed;
  LineRecipe recipe(figure.reserveIds(LineRecipe::ID_SLOTS), lc);
  figure.applyAll(recipe.build().createCommands);
  figure.setVertices(recipe.bufferId(), segs);

  DrawItemStyle st;
  for (int i = 0; i < 4; i++) st.color[i] = config_.theme.neutralLineColor[i];
  st.lineWidth = config_.theme.dashedLineWidth;
  st.dashLength = request.dashed ? config_.theme.dashLength : 0.0f;
  figure.apply(makeDrawItemStyleCmd(recipe.drawItemId(), st));
}

} // namespace vp
