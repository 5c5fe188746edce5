// V6.2 — StochasticOverlay test (pure C++, fake moments + recording renderer)
// Tests: corrected coordinates, first-fit offset/beta, one dashed line per
//        stochastic fit over [min x, 1.02 max x], no lines without a fit,
//        length mismatches.

#include "vp/collab/MomentEstimator.hpp"
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/data/Dataset.hpp"
#include "vp/layout/LayoutPlanner.hpp"
#include "vp/render/Figure.hpp"
#include "vp/render/StochasticOverlay.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

class FakeMoments : public vp::MomentEstimator {
public:
  vp::SecondOrderMoments compute(const vp::Dataset&, std::size_t gene) override {
    calls++;
    lastGene = gene;
    return result;
  }

  vp::SecondOrderMoments result;
  int calls{0};
  std::size_t lastGene{0};
};

class RecordingRenderer : public vp::ScatterRenderer {
public:
  void renderScatter(vp::Figure&, const vp::Dataset&, const vp::ScatterRequest& request,
                     const vp::Panel& target) override {
    scatters.push_back(request);
    targets.push_back(target.paneId);
  }

  void renderLine(vp::Figure&, const vp::LineRequest& request, const vp::Panel& target) override {
    lines.push_back(request);
    targets.push_back(target.paneId);
  }

  std::vector<vp::ScatterRequest> scatters;
  std::vector<vp::LineRequest> lines;
  std::vector<vp::Id> targets;
};

int main() {
  // --- Test 1: transform with unit inputs ---
  {
    auto c = vp::StochasticOverlay::correct({1.0f}, {1.0f}, {1.0f}, {1.0f}, 0.0, 1.0);
    requireClose(c.x[0], -1.0f, 1e-6f, "x = 2*(1-1)-1");
    requireClose(c.y[0], 1.0f, 1e-6f, "y = 2*(1-1)+1+0");

    // s=2, u=3, ss=5, us=7, offset=1, beta=2
    // x = 2*(5-4)-2 = 0 ; y = 2*(7-6)+3+2*2*1/2 = 7
    c = vp::StochasticOverlay::correct({2.0f}, {3.0f}, {5.0f}, {7.0f}, 1.0, 2.0);
    requireClose(c.x[0], 0.0f, 1e-6f, "x with offset");
    requireClose(c.y[0], 7.0f, 1e-6f, "y with offset/beta");

    bool threw = false;
    try {
      vp::StochasticOverlay::correct({1.0f, 2.0f}, {1.0f, 2.0f}, {1.0f}, {1.0f, 2.0f}, 0.0, 1.0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "length mismatch");

    std::printf("  Test 1 (corrected coordinates) PASS\n");
  }

  // --- Test 2: line sampling and fit parameters ---
  {
    vp::Dataset ds(1, {"g"});
    ds.setVarColumn("velocity_gamma", {2.0});
    ds.setVarColumn("velocity_beta", {4.0});
    ds.setVarColumn("velocity_offset2", {8.0});

    auto lines = vp::StochasticOverlay::fitLines(ds, 0, {"velocity", "stochastic"},
                                                 {-1.0f, std::nanf(""), 3.0f}, 50, 1.02f);
    requireTrue(lines.size() == 2, "one line per fit");
    const auto& l = lines[0];
    requireTrue(l.dashed, "dashed");
    requireTrue(l.x.size() == 50 && l.y.size() == 50, "50 samples");
    requireClose(l.x.front(), -1.0f, 1e-6f, "starts at min x");
    requireClose(l.x.back(), 3.06f, 1e-5f, "ends at 1.02 * max x");
    // y = 2/4 x + 8/4
    requireClose(l.y.front(), 1.5f, 1e-5f, "y at min");
    requireClose(l.y.back(), 0.5f * 3.06f + 2.0f, 1e-5f, "y at max");

    // "stochastic" has no columns: gamma = beta = 1, offset2 = 0
    requireClose(lines[1].y.back(), 3.06f, 1e-5f, "fallback line is y = x");

    auto none = vp::StochasticOverlay::fitLines(ds, 0, {"velocity"},
                                                {std::nanf("")}, 50, 1.02f);
    requireTrue(none.empty(), "no finite x -> no lines");

    std::printf("  Test 2 (fit lines) PASS\n");
  }

  // --- Test 3: render uses the first stochastic fit and draws every fit ---
  {
    vp::Dataset ds(2, {"Sox2", "Pax6"});
    ds.setVarColumn("velocity_offset", {0.0, 1.0});
    ds.setVarColumn("velocity_beta", {1.0, 2.0});
    ds.setVarColumn("velocity_gamma", {1.0, 1.0});
    ds.setVarColumn("second_gamma", {3.0, 3.0});

    vp::LayoutPlanner lp;
    auto plan = lp.plan({"Sox2", "Pax6"}, {}, true);
    vp::Figure fig(plan.figure);
    const auto& target = plan.panel(1, 1);
    requireTrue(target.kind == vp::PanelKind::Stochastic, "stochastic slot");

    FakeMoments moments;
    moments.result.ss = {5.0f, 5.0f};
    moments.result.us = {7.0f, 7.0f};
    RecordingRenderer rec;
    vp::StochasticOverlay overlay(rec, moments);

    vp::GeneAbundance a;
    a.s = {2.0f, 2.0f};
    a.u = {3.0f, 3.0f};
    vp::LayerResolution res;
    res.skey = "spliced";
    res.stochasticFits = {"velocity", "second"};

    std::size_t drawn = overlay.render(fig, ds, target, a, res);
    requireTrue(moments.calls == 1 && moments.lastGene == 1, "moments for Pax6");
    requireTrue(drawn == 2, "every stochastic fit drawn");
    requireTrue(rec.scatters.size() == 1 && rec.lines.size() == 2, "1 scatter + 2 lines");
    requireClose(rec.scatters[0].y[0], 7.0f, 1e-6f, "offset/beta of first fit (Pax6)");
    requireTrue(rec.scatters[0].source == vp::ScatterRequest::Source::Coordinates, "x/y override");
    requireTrue(rec.scatters[0].title == "Pax6", "title is gene");
    requireTrue(rec.scatters[0].xlabel != "spliced", "corrected axis labels");
    for (vp::Id id : rec.targets) requireTrue(id == target.paneId, "all draws in stochastic pane");

    std::printf("  Test 3 (render with fits) PASS\n");
  }

  // --- Test 4: no stochastic fit -> scatter only, zero lines ---
  {
    vp::Dataset ds(1, {"g"});
    vp::LayoutPlanner lp;
    auto withLayers = lp.plan({"g"}, {"velocity"}, true);
    vp::Figure fig(withLayers.figure);

    FakeMoments moments;
    moments.result.ss = {1.0f};
    moments.result.us = {1.0f};
    RecordingRenderer rec;
    vp::StochasticOverlay overlay(rec, moments);

    vp::GeneAbundance a;
    a.s = {1.0f};
    a.u = {1.0f};
    vp::LayerResolution res;
    res.skey = "spliced";

    std::size_t drawn = overlay.render(fig, ds, withLayers.panel(0, 2), a, res);
    requireTrue(drawn == 0 && rec.lines.empty(), "no overlay lines");
    requireTrue(withLayers.panelsPerGene == 4, "panel count unchanged");
    requireClose(rec.scatters[0].x[0], -1.0f, 1e-6f, "fallback offset 0, beta 1 (x)");
    requireClose(rec.scatters[0].y[0], 1.0f, 1e-6f, "fallback offset 0, beta 1 (y)");

    moments.result.ss = {1.0f, 2.0f};
    bool threw = false;
    try {
      overlay.render(fig, ds, withLayers.panel(0, 2), a, res);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "moment length mismatch propagates");

    std::printf("  Test 4 (no stochastic fit) PASS\n");
  }

  std::printf("V6.2 stochastic overlay: ALL PASS\n");
  return 0;
}
