// V3.2 — LayerResolver test (pure C++)
// Tests: raw vs smoothed layer pair, "all" layers, explicit layers with X,
//        fit filtering with a single trailing "dynamics", stochastic fits.

#include "vp/data/Dataset.hpp"
#include "vp/select/LayerResolver.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireList(const std::vector<std::string>& got,
                        const std::vector<std::string>& expected, const char* msg) {
  if (got != expected) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got", msg);
    for (const auto& g : got) std::fprintf(stderr, " %s", g.c_str());
    std::fprintf(stderr, ")\n");
    std::exit(1);
  }
}

static vp::LayerMatrix zeros() {
  return vp::LayerMatrix::dense(2, 2, {0, 0, 0, 0});
}

static vp::Dataset makeDataset(bool smoothed) {
  vp::Dataset ds(2, {"g0", "g1"});
  ds.setLayer("spliced", zeros());
  ds.setLayer("unspliced", zeros());
  if (smoothed) {
    ds.setLayer("Ms", zeros());
    ds.setLayer("Mu", zeros());
  }
  ds.setLayer("velocity", zeros());
  ds.setVarColumn("velocity_gamma", {1.0, 1.0});
  return ds;
}

static std::size_t countOf(const std::vector<std::string>& v, const std::string& s) {
  return static_cast<std::size_t>(std::count(v.begin(), v.end(), s));
}

int main() {
  // --- Test 1: layer pair selection ---
  {
    vp::LayerResolver lr;
    vp::Dataset raw = makeDataset(false);
    auto res = lr.resolve(raw);
    requireTrue(res.skey == "spliced" && res.ukey == "unspliced", "no Ms -> raw pair");

    vp::Dataset smooth = makeDataset(true);
    res = lr.resolve(smooth);
    requireTrue(res.skey == "Ms" && res.ukey == "Mu", "Ms present -> smoothed pair");

    vp::LayerResolverConfig cfg;
    cfg.useRaw = true;
    lr.setConfig(cfg);
    res = lr.resolve(smooth);
    requireTrue(res.skey == "spliced" && res.ukey == "unspliced", "use_raw forces raw pair");

    std::printf("  Test 1 (layer pair) PASS\n");
  }

  // --- Test 2: "all" layers and explicit layers ---
  {
    vp::Dataset ds = makeDataset(true);
    vp::LayerResolver lr;
    requireList(lr.resolve(ds).layers, {"velocity", "Ms"}, "all -> {vkey, skey}");

    vp::LayerResolverConfig cfg;
    cfg.allLayers = false;
    cfg.layers = {"X", "spliced", "missing", "velocity"};
    lr.setConfig(cfg);
    requireList(lr.resolve(ds).layers, {"X", "spliced", "velocity"},
                "missing layer dropped, X kept");

    cfg.allLayers = true;
    cfg.vkey = "velocity_u";
    lr.setConfig(cfg);
    requireList(lr.resolve(ds).layers, {"Ms"}, "absent vkey dropped");

    cfg.allLayers = false;
    cfg.layers.clear();
    lr.setConfig(cfg);
    requireTrue(lr.resolve(ds).layers.empty(), "no extra layers");

    std::printf("  Test 2 (layers) PASS\n");
  }

  // --- Test 3: fits always end with exactly one "dynamics" ---
  {
    vp::Dataset ds = makeDataset(false);
    vp::LayerResolver lr;
    requireList(lr.resolve(ds).fits, {"velocity", "dynamics"}, "default fits");

    vp::LayerResolverConfig cfg;
    cfg.fits = {"dynamics", "velocity", "deterministic"};
    lr.setConfig(cfg);
    auto fits = lr.resolve(ds).fits;
    requireTrue(countOf(fits, "dynamics") == 1, "dynamics exactly once");
    requireTrue(countOf(fits, "deterministic") == 0, "fit without _gamma dropped");
    requireTrue(countOf(fits, "velocity") == 1, "velocity kept");

    cfg.fits.clear();
    lr.setConfig(cfg);
    requireList(lr.resolve(ds).fits, {"dynamics"}, "empty request -> dynamics");

    cfg.allFits = true;
    lr.setConfig(cfg);
    requireList(lr.resolve(ds).fits, {"velocity", "dynamics"},
                "all -> layer names with a _gamma column");

    std::printf("  Test 3 (fits) PASS\n");
  }

  // --- Test 4: stochastic fits need a variance_<fit> layer ---
  {
    vp::Dataset ds = makeDataset(true);
    vp::LayerResolverConfig cfg;
    cfg.stochastic = true;
    vp::LayerResolver lr;
    lr.setConfig(cfg);
    requireTrue(lr.resolve(ds).stochasticFits.empty(), "no variance layer");

    ds.setLayer("variance_velocity", zeros());
    requireList(lr.resolve(ds).stochasticFits, {"velocity"}, "variance_velocity present");

    cfg.stochastic = false;
    lr.setConfig(cfg);
    requireTrue(lr.resolve(ds).stochasticFits.empty(), "only computed in stochastic mode");

    std::printf("  Test 4 (stochastic fits) PASS\n");
  }

  std::printf("V3.2 layer resolver: ALL PASS\n");
  return 0;
}
