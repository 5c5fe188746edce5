#pragma once
#include <string>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace vp {

// Quote + escape a string as a JSON string literal (including the quotes).
inline std::string jsonQuote(const std::string& s) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
  return sb.GetString();
}

} // namespace vp
