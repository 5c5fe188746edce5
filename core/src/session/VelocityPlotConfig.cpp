#include "vp/session/VelocityPlotConfig.hpp"

#include <rapidjson/document.h>

#include <cstring>

namespace vp {

namespace {

using JsonValue = rapidjson::Value;

bool readString(const JsonValue& v, std::string& out) {
  if (!v.IsString()) return false;
  out = v.GetString();
  return true;
}

bool readBool(const JsonValue& v, bool& out) {
  if (!v.IsBool()) return false;
  out = v.GetBool();
  return true;
}

bool readFloat(const JsonValue& v, float& out) {
  if (!v.IsNumber()) return false;
  out = static_cast<float>(v.GetDouble());
  return true;
}

bool readInt(const JsonValue& v, int& out) {
  if (!v.IsInt()) return false;
  out = v.GetInt();
  return true;
}

// A single string is a one-element list.
bool readStringList(const JsonValue& v, std::vector<std::string>& out) {
  std::vector<std::string> list;
  if (v.IsString()) {
    list.push_back(v.GetString());
  } else if (v.IsArray()) {
    for (const auto& e : v.GetArray()) {
      if (!e.IsString()) return false;
      list.push_back(e.GetString());
    }
  } else {
    return false;
  }
  out = std::move(list);
  return true;
}

bool readFloatPair(const JsonValue& v, float& a, float& b) {
  if (!v.IsArray() || v.Size() != 2 || !v[0].IsNumber() || !v[1].IsNumber()) return false;
  a = static_cast<float>(v[0].GetDouble());
  b = static_cast<float>(v[1].GetDouble());
  return true;
}

// "all" or a list of names.
bool readAllOrList(const JsonValue& v, bool& all, std::vector<std::string>& list) {
  if (v.IsString() && std::strcmp(v.GetString(), "all") == 0) {
    all = true;
    list.clear();
    return true;
  }
  if (!readStringList(v, list)) return false;
  all = false;
  return true;
}

bool readColorMap(const JsonValue& v, ColorMapChoice& out) {
  if (v.IsString()) {
    out = ColorMapChoice::single(v.GetString());
    return true;
  }
  if (v.IsArray() && v.Size() == 2 && v[0].IsString() && v[1].IsString()) {
    out = ColorMapChoice::paired(v[0].GetString(), v[1].GetString());
    return true;
  }
  return false;
}

bool readMode(const JsonValue& v, bool& stochastic) {
  if (v.IsNull()) {
    stochastic = false;
    return true;
  }
  if (!v.IsString()) return false;
  std::string mode = v.GetString();
  if (mode == "stochastic") {
    stochastic = true;
    return true;
  }
  if (mode.empty()) {
    stochastic = false;
    return true;
  }
  return false;
}

bool applyOption(const std::string& key, const JsonValue& v, VelocityPlotConfig& c,
                 bool& known) {
  SelectionOptions& sel = c.selection;
  LayoutOptions& lay = c.layout;
  PanelStyle& st = c.style.panel;
  known = true;

  if (key == "var_names") return readStringList(v, sel.varNames);
  if (key == "groupby") return readString(v, sel.groupBy);
  if (key == "groups") return readStringList(v, sel.groups);
  if (key == "vkey") return readString(v, sel.vkey);
  if (key == "mode") return readMode(v, lay.stochastic);
  if (key == "fits") return readAllOrList(v, sel.allFits, sel.fits);
  if (key == "layers") return readAllOrList(v, sel.allLayers, sel.layers);
  if (key == "use_raw") return readBool(v, sel.useRaw);
  if (key == "basis") return readString(v, sel.basis);
  if (key == "color") return readString(v, st.color);
  if (key == "color_map") return readColorMap(v, st.colorMap);
  if (key == "colorbar") return readBool(v, st.colorbar);
  if (key == "perc") {
    if (v.IsNull()) {
      st.usePerc = false;
      return true;
    }
    if (!readFloatPair(v, st.percLow, st.percHigh)) return false;
    st.usePerc = true;
    return true;
  }
  if (key == "alpha") return readFloat(v, st.alpha);
  if (key == "size") {
    if (!readFloat(v, st.size)) return false;
    c.style.sizeSet = true;
    return true;
  }
  if (key == "legend_loc") return readString(v, st.legendLoc);
  if (key == "legend_fontsize") return readFloat(v, st.legendFontSize);
  if (key == "fontsize") return readFloat(v, st.fontSize);
  if (key == "figsize") return readFloatPair(v, lay.figWidth, lay.figHeight);
  if (key == "dpi") return readInt(v, lay.dpi);
  if (key == "ncols") return readInt(v, lay.ncols);
  if (key == "show") return readBool(v, lay.show);
  if (key == "save") {
    if (v.IsBool()) {
      lay.save = v.GetBool() ? "figure" : "";
      return true;
    }
    return readString(v, lay.save);
  }
  if (key == "xlabel") return readString(v, st.xlabel);
  if (key == "ylabel") return readString(v, st.ylabel);
  if (key == "theme") return readString(v, c.style.theme);

  known = false;
  return false;
}

} // namespace

bool parseVelocityPlotConfig(const std::string& json, VelocityPlotConfig& out,
                             std::string& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    err = "BAD_CONFIG";
    return false;
  }

  VelocityPlotConfig cfg = out;
  for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
    std::string key = it->name.GetString();
    bool known = false;
    if (!applyOption(key, it->value, cfg, known)) {
      err = (known ? "BAD_OPTION:" : "UNKNOWN_OPTION:") + key;
      return false;
    }
  }

  out = std::move(cfg);
  return true;
}

} // namespace vp
