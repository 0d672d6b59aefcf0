// board_config_store.cpp — implementation for board_config_store.hpp
// Preferences (NVS) handle + ArduinoJson document codec.

#include "board_config_store.hpp"
#include "board_config.hpp"
#include "config_json.hpp"
#include "relay_log.hpp"

#include <Arduino.h>
#include <Preferences.h>        // ESP32 NVS key/value storage

using picorelay::MediumStatus;
using picorelay::RelayConfig;

static Preferences s_prefs;     // single NVS handle for the config namespace

NvsConfigMedium::NvsConfigMedium() : open_(false) {}

NvsConfigMedium::~NvsConfigMedium() {
  if (open_) s_prefs.end();
}

// open() — lazy, read/write; retried on every call until it succeeds.
bool NvsConfigMedium::open() {
  if (!open_) open_ = s_prefs.begin(board::NVS_NAMESPACE, /*readOnly=*/false);
  return open_;
}

MediumStatus NvsConfigMedium::read(RelayConfig& out) {
  if (!open()) return MediumStatus::IO_ERROR;
  if (!s_prefs.isKey(board::NVS_KEY)) return MediumStatus::EMPTY;

  String raw = s_prefs.getString(board::NVS_KEY, "");
  if (raw.length() == 0) return MediumStatus::EMPTY;

  if (!picorelay::decode_config(std::string(raw.c_str()), out)) {
    return MediumStatus::CORRUPT;
  }
  return MediumStatus::OK;
}

//
// write()
// -------
// putString() returns the number of bytes stored; anything short of the
// full document counts as failure.
//
bool NvsConfigMedium::write(const RelayConfig& cfg) {
  if (!open()) return false;

  std::string text;
  if (!picorelay::encode_config(cfg, text)) {
    PICORELAY_LOG_ERROR("config encode failed");
    return false;
  }
  const size_t n = s_prefs.putString(board::NVS_KEY, text.c_str());
  if (n != text.size()) {
    PICORELAY_LOG_ERROR("nvs write %u/%u bytes", (unsigned)n, (unsigned)text.size());
    return false;
  }
  return true;
}
