// relay_config.cpp — implementation for relay_config.hpp
// Read-modify-write store over a ConfigMedium.

#include "relay_config.hpp"
#include "relay_backend.hpp"   // Clock
#include "relay_log.hpp"

#include <cstdio>              // snprintf

namespace picorelay {

std::string default_relay_name(uint8_t relay) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "Relay %u", static_cast<unsigned>(relay));
  return buf;
}

RelayConfig make_default_config(uint32_t now_ms) {
  RelayConfig cfg;
  for (uint8_t i = 0; i < kRelayCount; ++i) {
    cfg.names[i]  = default_relay_name(static_cast<uint8_t>(i + 1));
    cfg.states[i] = 0;
  }
  cfg.auto_load = true;
  cfg.settings.auto_save      = true;
  cfg.settings.created_time   = now_ms;
  cfg.settings.has_last_saved = false;
  cfg.settings.last_saved     = 0;
  return cfg;
}

PersistentConfigStore::PersistentConfigStore(ConfigMedium& medium, Clock& clock)
    : medium_(medium), clock_(clock) {}

//
// fetch()
// -------
// Read the current document. Anything but a clean read is replaced by
// defaults, which are written back immediately so the next read agrees.
// A failed write is logged and otherwise ignored; the caller still gets a
// usable document.
//
RelayConfig PersistentConfigStore::fetch() {
  RelayConfig cfg;
  const MediumStatus st = medium_.read(cfg);
  if (st == MediumStatus::OK) return cfg;

  switch (st) {
    case MediumStatus::EMPTY:    PICORELAY_LOG_WARN("config empty, writing defaults");      break;
    case MediumStatus::CORRUPT:  PICORELAY_LOG_WARN("config corrupt, writing defaults");    break;
    case MediumStatus::IO_ERROR: PICORELAY_LOG_ERROR("config unreadable, using defaults");  break;
    case MediumStatus::OK:       break;
  }
  cfg = make_default_config(clock_.millis());
  if (!medium_.write(cfg)) {
    PICORELAY_LOG_ERROR("config default write failed");
  }
  return cfg;
}

bool PersistentConfigStore::get_name(uint8_t relay, std::string& out) {
  if (!is_valid_relay(relay)) return false;
  out = fetch().names[relay - 1];
  return true;
}

bool PersistentConfigStore::set_name(uint8_t relay, const std::string& name) {
  if (!is_valid_relay(relay) || !is_valid_name_length(name)) return false;
  RelayConfig cfg = fetch();
  cfg.names[relay - 1] = name;
  return medium_.write(cfg);
}

bool PersistentConfigStore::get_auto_load(bool& out) {
  out = fetch().auto_load;
  return true;
}

bool PersistentConfigStore::set_auto_load(bool on) {
  RelayConfig cfg = fetch();
  cfg.auto_load = on;
  return medium_.write(cfg);
}

bool PersistentConfigStore::save_states(const std::string& storage) {
  if (!is_binary_pattern(storage)) return false;
  RelayConfig cfg = fetch();
  for (size_t i = 0; i < kRelayCount; ++i) {
    cfg.states[i] = (storage[i] == '1') ? 1 : 0;
  }
  cfg.settings.has_last_saved = true;
  cfg.settings.last_saved     = clock_.millis();
  return medium_.write(cfg);
}

LoadResult PersistentConfigStore::load_states(std::string& storage) {
  const RelayConfig cfg = fetch();
  if (!cfg.settings.has_last_saved) return LoadResult::ABSENT;

  storage.assign(kPatternLength, '0');
  for (size_t i = 0; i < kRelayCount; ++i) {
    if (cfg.states[i]) storage[i] = '1';
  }
  return LoadResult::LOADED;
}

bool PersistentConfigStore::clear_states() {
  RelayConfig cfg = fetch();
  for (size_t i = 0; i < kRelayCount; ++i) cfg.states[i] = 0;
  cfg.settings.has_last_saved = false;
  cfg.settings.last_saved     = 0;
  return medium_.write(cfg);
}

} // namespace picorelay
