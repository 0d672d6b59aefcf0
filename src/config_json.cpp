// config_json.cpp — implementation for config_json.hpp

#include "config_json.hpp"

#include <ArduinoJson.h>

namespace picorelay {

static const char* relay_key(uint8_t index) {
  static const char* keys[kRelayCount] = {"1", "2", "3", "4", "5", "6", "7", "8"};
  return keys[index];
}

bool encode_config(const RelayConfig& cfg, std::string& out) {
  JsonDocument doc;
  JsonObject root = doc.to<JsonObject>();

  JsonObject names = root["names"].to<JsonObject>();
  for (uint8_t i = 0; i < kRelayCount; ++i) names[relay_key(i)] = cfg.names[i];

  JsonObject settings = root["settings"].to<JsonObject>();
  settings["auto_save"]    = cfg.settings.auto_save;
  settings["created_time"] = cfg.settings.created_time;
  if (cfg.settings.has_last_saved) settings["last_saved"] = cfg.settings.last_saved;

  JsonObject states = root["states"].to<JsonObject>();
  for (uint8_t i = 0; i < kRelayCount; ++i) states[relay_key(i)] = cfg.states[i] ? 1 : 0;

  root["auto_load"] = cfg.auto_load;

  if (doc.overflowed()) return false;
  out.clear();
  serializeJson(doc, out);
  return true;
}

//
// decode_config()
// ---------------
// Start from defaults and overlay what the document provides. Each present
// member is type-checked before use.
//
bool decode_config(const std::string& text, RelayConfig& out) {
  JsonDocument doc;
  if (deserializeJson(doc, text)) return false;
  if (!doc.is<JsonObjectConst>()) return false;
  JsonObjectConst root = doc.as<JsonObjectConst>();

  RelayConfig cfg = make_default_config(0);

  JsonVariantConst names = root["names"];
  if (!names.isNull()) {
    if (!names.is<JsonObjectConst>()) return false;
    for (uint8_t i = 0; i < kRelayCount; ++i) {
      JsonVariantConst v = names[relay_key(i)];
      if (v.isNull()) continue;
      if (!v.is<const char*>()) return false;
      std::string name = v.as<const char*>();
      if (!is_valid_name_length(name)) return false;
      cfg.names[i] = name;
    }
  }

  JsonVariantConst states = root["states"];
  if (!states.isNull()) {
    if (!states.is<JsonObjectConst>()) return false;
    for (uint8_t i = 0; i < kRelayCount; ++i) {
      JsonVariantConst v = states[relay_key(i)];
      if (v.isNull()) continue;
      if (v.is<bool>())          cfg.states[i] = v.as<bool>() ? 1 : 0;
      else if (v.is<int>())      cfg.states[i] = v.as<int>() ? 1 : 0;
      else return false;
    }
  }

  JsonVariantConst auto_load = root["auto_load"];
  if (!auto_load.isNull()) {
    if (!auto_load.is<bool>()) return false;
    cfg.auto_load = auto_load.as<bool>();
  }

  JsonVariantConst settings = root["settings"];
  if (!settings.isNull()) {
    if (!settings.is<JsonObjectConst>()) return false;
    JsonVariantConst auto_save = settings["auto_save"];
    if (!auto_save.isNull()) {
      if (!auto_save.is<bool>()) return false;
      cfg.settings.auto_save = auto_save.as<bool>();
    }
    JsonVariantConst created = settings["created_time"];
    if (!created.isNull()) {
      if (!created.is<uint32_t>()) return false;
      cfg.settings.created_time = created.as<uint32_t>();
    }
    JsonVariantConst last = settings["last_saved"];
    if (!last.isNull()) {
      if (!last.is<uint32_t>()) return false;
      cfg.settings.has_last_saved = true;
      cfg.settings.last_saved     = last.as<uint32_t>();
    }
  }

  out = cfg;
  return true;
}

} // namespace picorelay
