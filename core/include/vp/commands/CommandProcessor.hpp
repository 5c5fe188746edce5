#pragma once
#include "vp/scene/Scene.hpp"
#include "vp/scene/ResourceRegistry.hpp"
#include "vp/ids/Id.hpp"
#include "vp/pipelines/PipelineCatalog.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace vp {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  // Apply a single JSON command object. Never throws for malformed input;
  // a bad string id is reported as BAD_ID.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  bool inFrame() const { return inFrame_; }
  std::uint64_t frameCount() const { return frameCounter_; }

  // Returns a JSON string (for logging / tests).
  std::string listResourcesJson() const;

private:
  Scene& scene_;
  ResourceRegistry& reg_;

  bool inFrame_{false};
  std::uint64_t frameCounter_{0};

  CmdResult dispatch(const std::string& cmd, const rapidjson::Value& obj);

  // ---- handlers ----
  CmdResult cmdBeginFrame(const rapidjson::Value& obj);
  CmdResult cmdCommitFrame(const rapidjson::Value& obj);

  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdSetPaneRegion(const rapidjson::Value& obj);
  CmdResult cmdSetPaneStyle(const rapidjson::Value& obj);
  CmdResult cmdSetPaneDataRange(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);

  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);

  PipelineCatalog catalog_;

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static bool readFloat(const rapidjson::Value& obj, const char* key, float& out);
  static bool readBool(const rapidjson::Value& obj, const char* key, bool& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace vp
