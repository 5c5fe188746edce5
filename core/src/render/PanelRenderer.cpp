#include "vp/render/PanelRenderer.hpp"

namespace vp {

GeneAbundance PanelRenderer::extract(const Dataset& dataset, const std::string& gene,
                                     const LayerResolution& resolution) {
  std::size_t g = dataset.geneIndex(gene);
  GeneAbundance a;
  a.s = dataset.layer(resolution.skey).column(g);
  a.u = dataset.layer(resolution.ukey).column(g);
  return a;
}

ScatterRequest PanelRenderer::phaseRequest(const std::string& gene,
                                           const GeneAbundance& abundance,
                                           const LayerResolution& resolution,
                                           bool lastGene) const {
  const PanelStyle& st = config_.style;

  ScatterRequest r;
  r.source = ScatterRequest::Source::Coordinates;
  r.x = abundance.s;
  r.y = abundance.u;
  r.gene = gene;
  r.color = st.color;
  r.fitLines = resolution.fits;
  r.colorMap = st.colorMap.resolve(LayerResolver::isExpressionLayer(st.color, resolution.skey));
  r.usePerc = st.usePerc;
  r.percLow = st.percLow;
  r.percHigh = st.percHigh;
  r.title = gene;
  r.xlabel = st.xlabel;
  r.ylabel = st.ylabel;
  r.fontSize = st.fontSize;
  r.legendFontSize = st.legendFontSize;
  r.size = st.size;
  r.alpha = st.alpha;
  r.frameOn = true;
  r.colorbar = st.colorbar;
  r.legendLoc = lastGene ? st.legendLoc : "none";
  return r;
}

ScatterRequest PanelRenderer::layerRequest(const std::string& gene, const std::string& layer,
                                           const LayerResolution& resolution) const {
  const PanelStyle& st = config_.style;
  const bool expression = LayerResolver::isExpressionLayer(layer, resolution.skey);

  ScatterRequest r;
  r.source = ScatterRequest::Source::Embedding;
  r.basis = config_.basis;
  r.gene = gene;
  r.color = gene;
  r.colorLayer = layer;
  r.colorMap = st.colorMap.resolve(expression);
  r.usePerc = st.usePerc;
  r.percLow = st.percLow;
  r.percHigh = st.percHigh;
  r.title = expression ? "expression" : layer;
  r.fontSize = st.fontSize;
  r.legendFontSize = st.legendFontSize;
  r.size = st.size;
  r.alpha = st.alpha;
  r.frameOn = false;
  r.colorbar = st.colorbar;
  return r;
}

GeneAbundance PanelRenderer::renderGene(Figure& figure, const Dataset& dataset,
                                        const LayoutPlan& plan, std::size_t geneIndex,
                                        const LayerResolution& resolution, bool lastGene) {
  const Panel& phase = plan.panel(geneIndex, 0);
  GeneAbundance abundance = extract(dataset, phase.gene, resolution);

  scatter_.renderScatter(figure, dataset,
                         phaseRequest(phase.gene, abundance, resolution, lastGene), phase);

  for (std::size_t l = 0; l < resolution.layers.size(); l++) {
    const Panel& target = plan.panel(geneIndex, l + 1);
    scatter_.renderScatter(figure, dataset,
                           layerRequest(phase.gene, resolution.layers[l], resolution), target);
  }
  return abundance;
}

} // namespace vp
