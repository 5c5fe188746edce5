#include "vp/render/StochasticOverlay.hpp"
#include "vp/math/Percentile.hpp"
#include "vp/select/FitParams.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace vp {

CorrectedCoordinates StochasticOverlay::correct(const std::vector<float>& s,
                                                const std::vector<float>& u,
                                                const std::vector<float>& ss,
                                                const std::vector<float>& us,
                                                double offset, double beta) {
  const std::size_t n = s.size();
  if (u.size() != n || ss.size() != n || us.size() != n) {
    throw std::invalid_argument("StochasticOverlay: s, u, ss and us must have equal length");
  }

  CorrectedCoordinates c;
  c.x.resize(n);
  c.y.resize(n);
  const double shift = 2.0 * offset / beta;
  for (std::size_t i = 0; i < n; i++) {
    double si = s[i], ui = u[i];
    c.x[i] = static_cast<float>(2.0 * (ss[i] - si * si) - si);
    c.y[i] = static_cast<float>(2.0 * (us[i] - ui * si) + ui + si * shift);
  }
  return c;
}

std::vector<LineRequest> StochasticOverlay::fitLines(const Dataset& dataset, std::size_t gene,
                                                     const std::vector<std::string>& fits,
                                                     const std::vector<float>& x,
                                                     int samples, float extent) {
  std::vector<LineRequest> out;

  float lo = std::numeric_limits<float>::max();
  float hi = -std::numeric_limits<float>::max();
  for (float v : x) {
    if (!std::isfinite(v)) continue;
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
  if (lo > hi) return out;

  std::vector<float> xs = linspace(lo, hi * extent, samples);
  for (const auto& fit : fits) {
    FitParams p = lookupFitParams(dataset, fit, gene);
    LineRequest line;
    line.name = fit + "_stochastic";
    line.x = xs;
    line.y.reserve(xs.size());
    for (float xv : xs) {
      line.y.push_back(static_cast<float>(p.gamma / p.beta * xv + p.offset2 / p.beta));
    }
    line.dashed = true;
    out.push_back(std::move(line));
  }
  return out;
}

std::size_t StochasticOverlay::render(Figure& figure, const Dataset& dataset,
                                      const Panel& target, const GeneAbundance& abundance,
                                      const LayerResolution& resolution) {
  const std::size_t gene = dataset.geneIndex(target.gene);
  SecondOrderMoments m = moments_.compute(dataset, gene);

  FitParams first;
  if (!resolution.stochasticFits.empty()) {
    first = lookupFitParams(dataset, resolution.stochasticFits.front(), gene);
  } else {
    std::fprintf(stderr, "[StochasticOverlay] no stochastic fit for '%s'; drawing without lines\n",
                 target.gene.c_str());
  }

  CorrectedCoordinates c = correct(abundance.s, abundance.u, m.ss, m.us,
                                   first.offset, first.beta);

  const PanelStyle& st = config_.style;
  ScatterRequest r;
  r.source = ScatterRequest::Source::Coordinates;
  r.x = c.x;
  r.y = c.y;
  r.gene = target.gene;
  r.color = st.color;
  r.colorMap = st.colorMap.resolve(LayerResolver::isExpressionLayer(st.color, resolution.skey));
  r.usePerc = st.usePerc;
  r.percLow = st.percLow;
  r.percHigh = st.percHigh;
  r.title = target.gene;
  r.xlabel = config_.xlabel;
  r.ylabel = config_.ylabel;
  r.fontSize = st.fontSize;
  r.legendFontSize = st.legendFontSize;
  r.size = st.size;
  r.alpha = st.alpha;
  r.frameOn = true;
  r.colorbar = st.colorbar;
  scatter_.renderScatter(figure, dataset, r, target);

  std::vector<LineRequest> lines = fitLines(dataset, gene, resolution.stochasticFits, c.x,
                                            config_.lineSamples, config_.lineExtent);
  for (const auto& line : lines) {
    scatter_.renderLine(figure, line, target);
  }
  return lines.size();
}

} // namespace vp
