// V8.1 — Figure export test (pure C++)
// Tests: save path resolution, scene JSON round-trip through RapidJSON, open frames,
//        JSON finalizer save/show behaviour, unwritable target.

#include "vp/export/FigureExport.hpp"
#include "vp/layout/LayoutPlanner.hpp"
#include "vp/recipe/ScatterRecipe.hpp"
#include "vp/recipe/StyleCommands.hpp"
#include "vp/render/Figure.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::unique_ptr<vp::Figure> makeFigure() {
  vp::LayoutPlanner lp;
  auto plan = lp.plan({"Sox2"}, {"velocity"}, false);
  auto fig = std::make_unique<vp::Figure>(plan.figure);
  fig->addPanels(plan);

  const auto& phase = plan.panel(0, 0);
  vp::PaneStyle ps;
  ps.title = "Sox2 \"quoted\"";
  ps.xlabel = "spliced";
  fig->apply(vp::makePaneStyleCmd(phase.paneId, ps));

  vp::ScatterRecipeConfig cfg;
  cfg.layerId = phase.layerId;
  cfg.name = "Sox2_scatter";
  cfg.pointCount = 2;
  vp::ScatterRecipe recipe(fig->reserveIds(vp::ScatterRecipe::ID_SLOTS), cfg);
  fig->applyAll(recipe.build().createCommands);
  fig->setVertices(recipe.bufferId(), {0.0f, 0.0f, 1.0f, 0.5f, 0.5f, 2.0f});
  return fig;
}

int main() {
  // --- Test 1: save path resolution ---
  {
    requireTrue(vp::resolveSavePath("panels") == "velocity_panels.json", "prefix + extension");
    requireTrue(vp::resolveSavePath("out/fig.json") == "out/fig.json", "json path kept");
    requireTrue(vp::resolveSavePath("fig.png") == "velocity_fig.png.json", "other extension");

    std::printf("  Test 1 (save path) PASS\n");
  }

  // --- Test 2: serialized scene parses back ---
  {
    auto fig = makeFigure();
    std::string json = vp::serializeFigure(*fig);

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    requireTrue(!doc.HasParseError() && doc.IsObject(), "valid JSON");
    requireTrue(doc["figure"]["dpi"].GetInt() == 80, "dpi");
    requireTrue(doc["figure"]["frames"].GetUint64() == 0, "no frames drawn");
    requireTrue(doc["panes"].IsArray() && doc["panes"].Size() == 2, "two panes");

    const auto& pane = doc["panes"][0];
    requireTrue(std::string(pane["name"].GetString()) == "Sox2/phase", "pane name");
    requireTrue(std::string(pane["style"]["title"].GetString()) == "Sox2 \"quoted\"",
                "escaped title survives");
    requireTrue(pane["region"]["clipXMin"].IsNumber(), "region");
    requireTrue(pane["drawItems"].Size() == 1, "one draw item");

    const auto& item = pane["drawItems"][0];
    requireTrue(std::string(item["pipeline"].GetString()) == "points@1", "pipeline");
    requireTrue(item["colorMapped"].GetBool() && !item["dashed"].GetBool(), "pipeline traits");
    requireTrue(std::string(item["format"].GetString()) == "point3", "format");
    requireTrue(item["vertexCount"].GetUint() == 2, "vertex count");
    requireTrue(item["vertices"].Size() == 6, "vertex payload");

    requireTrue(doc["panes"][1]["drawItems"].Size() == 0, "empty layer pane");

    std::printf("  Test 2 (serialize) PASS\n");
  }

  // --- Test 3: finalizer saves, returns the figure unless shown ---
  {
    vp::JsonFigureFinalizer fin;
    vp::FinalizeOptions opt;
    opt.show = false;
    opt.save = "v8_1_export_test.json";

    auto back = fin.finalize(makeFigure(), opt);
    requireTrue(back != nullptr, "not shown -> figure returned");
    requireTrue(fin.lastSavedPath() == "v8_1_export_test.json", "saved path");

    std::ifstream in(fin.lastSavedPath());
    std::stringstream ss;
    ss << in.rdbuf();
    requireTrue(ss.str() == vp::serializeFigure(*back), "file holds the scene");
    std::remove(fin.lastSavedPath().c_str());

    opt.show = true;
    opt.save.clear();
    requireTrue(fin.finalize(makeFigure(), opt) == nullptr, "shown -> no handle");

    opt.save = "no_such_dir/sub/fig.json";
    bool threw = false;
    try {
      fin.finalize(makeFigure(), opt);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "unwritable target throws");

    auto open = makeFigure();
    open->beginFrame();
    opt.save.clear();
    threw = false;
    try {
      fin.finalize(std::move(open), opt);
    } catch (const std::logic_error&) {
      threw = true;
    }
    requireTrue(threw, "open frame rejected");

    std::printf("  Test 3 (finalizer) PASS\n");
  }

  std::printf("V8.1 export: ALL PASS\n");
  return 0;
}
