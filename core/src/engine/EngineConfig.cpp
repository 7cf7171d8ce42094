#include "cs/engine/EngineConfig.hpp"

#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace cs {

CandleStyle EngineConfig::candleStyle() const {
  CandleStyle s;
  s.colorUp = theme.candleUp;
  s.colorDown = theme.candleDown;
  s.outlineColor = theme.outline;
  s.outlineWidthPx = outlineWidthPx;
  s.noiseStrength = noiseStrength;
  return s;
}

namespace {

// Each reader leaves `out` unchanged when the key is absent and fails
// when it is present with the wrong type.

bool readNumber(const rapidjson::Value& obj, const char* key, double& out, std::string& err) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber()) {
    err = std::string("'") + key + "' must be a number";
    return false;
  }
  out = v.GetDouble();
  return true;
}

bool readFloat(const rapidjson::Value& obj, const char* key, float& out, std::string& err) {
  double d = static_cast<double>(out);
  if (!readNumber(obj, key, d, err)) return false;
  out = static_cast<float>(d);
  return true;
}

bool readInt(const rapidjson::Value& obj, const char* key, int& out, std::string& err) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsInt()) {
    err = std::string("'") + key + "' must be an integer";
    return false;
  }
  out = v.GetInt();
  return true;
}

bool readUint(const rapidjson::Value& obj, const char* key, std::uint32_t& out, std::string& err) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsUint()) {
    err = std::string("'") + key + "' must be an unsigned 32-bit integer";
    return false;
  }
  out = v.GetUint();
  return true;
}

bool readString(const rapidjson::Value& obj, const char* key, std::string& out, std::string& err) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsString()) {
    err = std::string("'") + key + "' must be a string";
    return false;
  }
  out = v.GetString();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out, std::string& err) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsBool()) {
    err = std::string("'") + key + "' must be a boolean";
    return false;
  }
  out = v.GetBool();
  return true;
}

bool readColor(const rapidjson::Value& obj, const char* key, Rgb& out, std::string& err) {
  std::string hex;
  if (!obj.HasMember(key)) return true;
  if (!readString(obj, key, hex, err)) return false;
  if (!parseHexColor(hex, out)) {
    err = std::string("'") + key + "' must be a #RRGGBB colour, got \"" + hex + "\"";
    return false;
  }
  return true;
}

const rapidjson::Value* section(const rapidjson::Value& obj, const char* key, std::string& err) {
  if (!obj.HasMember(key)) return nullptr;
  const auto& v = obj[key];
  if (!v.IsObject()) {
    err = std::string("'") + key + "' must be an object";
    return nullptr;
  }
  return &v;
}

bool parseWindow(const rapidjson::Value& w, WindowConfig& out, std::string& err) {
  if (!readInt(w, "width", out.width, err)) return false;
  if (!readInt(w, "height", out.height, err)) return false;
  if (!readString(w, "title", out.title, err)) return false;
  if (out.width <= 0 || out.height <= 0) {
    err = "window size must be positive";
    return false;
  }
  return true;
}

bool parseAnimation(const rapidjson::Value& a, AnimationConfig& out, std::string& err) {
  if (!readNumber(a, "duration", out.duration, err)) return false;
  if (!readFloat(a, "step", out.step, err)) return false;

  if (a.HasMember("stepMode")) {
    std::string mode;
    if (!readString(a, "stepMode", mode, err)) return false;
    if (mode == "perTick") out.stepMode = AnimationStepMode::PerTick;
    else if (mode == "scaled") out.stepMode = AnimationStepMode::Scaled;
    else {
      err = "'stepMode' must be \"perTick\" or \"scaled\"";
      return false;
    }
  }

  if (out.duration < 0.0) {
    err = "animation duration must not be negative";
    return false;
  }
  return true;
}

bool parseTheme(const rapidjson::Value& t, Theme& out, std::string& err) {
  std::string name;
  if (!readString(t, "name", name, err)) return false;
  if (!name.empty() && !themeByName(name, out)) {
    err = "unknown theme \"" + name + "\"";
    return false;
  }
  return readColor(t, "candleUp", out.candleUp, err) &&
         readColor(t, "candleDown", out.candleDown, err) &&
         readColor(t, "outline", out.outline, err) &&
         readColor(t, "backgroundTint", out.backgroundTint, err) &&
         readColor(t, "clear", out.clearColor, err);
}

bool parseSeries(const rapidjson::Value& s, SeriesConfig& out, std::string& err) {
  int count = static_cast<int>(out.count);
  if (!readInt(s, "count", count, err)) return false;
  if (!readUint(s, "seed", out.seed, err)) return false;
  if (!readFloat(s, "volatility", out.volatility, err)) return false;
  if (count < 0) {
    err = "series count must not be negative";
    return false;
  }
  out.count = static_cast<std::size_t>(count);
  return true;
}

bool parseCandles(const rapidjson::Value& arr, std::vector<CandleItem>& out, std::string& err) {
  if (!arr.IsArray()) {
    err = "'candles' must be an array";
    return false;
  }
  std::vector<CandleItem> items;
  for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
    const auto& c = arr[i];
    if (!c.IsObject()) {
      err = "candle " + std::to_string(i) + " must be an object";
      return false;
    }
    CandleItem item;
    if (!readFloat(c, "x", item.position.x, err) ||
        !readFloat(c, "y", item.position.y, err) ||
        !readFloat(c, "w", item.scale.x, err) ||
        !readFloat(c, "h", item.scale.y, err) ||
        !readBool(c, "up", item.polarity, err)) {
      err = "candle " + std::to_string(i) + ": " + err;
      return false;
    }
    items.push_back(item);
  }
  out = std::move(items);
  return true;
}

} // namespace

bool parseEngineConfig(const std::string& json, EngineConfig& out, std::string& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    err = std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
          ": " + rapidjson::GetParseError_En(doc.GetParseError());
    return false;
  }
  if (!doc.IsObject()) {
    err = "config root must be an object";
    return false;
  }

  // Parse into a copy so a failure leaves `out` untouched.
  EngineConfig cfg = out;
  err.clear();

  if (const auto* w = section(doc, "window", err)) {
    if (!parseWindow(*w, cfg.window, err)) return false;
  } else if (!err.empty()) return false;

  if (!readNumber(doc, "frameRate", cfg.frameRate, err)) return false;
  if (cfg.frameRate <= 0.0) {
    err = "frameRate must be positive";
    return false;
  }
  if (!readFloat(doc, "panSpeed", cfg.panSpeed, err)) return false;

  if (const auto* a = section(doc, "animation", err)) {
    if (!parseAnimation(*a, cfg.animation, err)) return false;
  } else if (!err.empty()) return false;

  if (const auto* c = section(doc, "candle", err)) {
    if (!readFloat(*c, "outlineWidthPx", cfg.outlineWidthPx, err)) return false;
    if (!readFloat(*c, "noiseStrength", cfg.noiseStrength, err)) return false;
  } else if (!err.empty()) return false;

  if (const auto* b = section(doc, "background", err)) {
    if (!readFloat(*b, "radiusBase", cfg.background.radiusBase, err)) return false;
    if (!readFloat(*b, "radiusAmplitude", cfg.background.radiusAmplitude, err)) return false;
    if (!readFloat(*b, "radiusOmega", cfg.background.radiusOmega, err)) return false;
    if (!readFloat(*b, "falloff", cfg.background.falloff, err)) return false;
  } else if (!err.empty()) return false;

  if (const auto* t = section(doc, "theme", err)) {
    if (!parseTheme(*t, cfg.theme, err)) return false;
  } else if (!err.empty()) return false;

  if (const auto* s = section(doc, "series", err)) {
    if (!parseSeries(*s, cfg.series, err)) return false;
  } else if (!err.empty()) return false;

  if (doc.HasMember("candles")) {
    if (!parseCandles(doc["candles"], cfg.candles, err)) return false;
  }

  if (!readString(doc, "snapshot", cfg.snapshotPath, err)) return false;

  out = std::move(cfg);
  return true;
}

bool loadEngineConfigFile(const std::string& path, EngineConfig& out, std::string& err) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    err = "cannot open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (!parseEngineConfig(ss.str(), out, err)) {
    err = path + ": " + err;
    return false;
  }
  return true;
}

} // namespace cs
