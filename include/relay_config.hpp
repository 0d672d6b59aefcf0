#pragma once
/**
 * @page pr-config PicoRelay Persisted Configuration
 * @file relay_config.hpp
 * @brief Relay names, saved states, and the auto-load flag that survive reset.
 *
 * Overview
 * --------
 * Persisted configuration is small and rarely written: eight names, one saved
 * state snapshot, an auto-load flag, and a few timestamps. Two layers split
 * the job:
 *
 *   ConfigStore             what the dispatcher asks for (get/set name,
 *                           save/load/clear states, auto-load)
 *     PersistentConfigStore read-modify-write over a ConfigMedium, falls
 *                           back to defaults when the medium is empty,
 *                           corrupt or unreadable
 *   ConfigMedium            whole-document read/write. Firmware: NVS via
 *                           Preferences (board_config_store.*). Tests: memory.
 *
 * Every query re-reads the medium and every mutation writes it back. No
 * cache is kept, so a value read is always the value that will survive a
 * power cycle.
 *
 * Document Shape
 * --------------
 *   {
 *     "names":     { "1": "Relay 1", ..., "8": "Relay 8" },
 *     "settings":  { "auto_save": true, "created_time": <ms>,
 *                    "last_saved": <ms> (only after SAVE) },
 *     "states":    { "1": 0|1, ..., "8": 0|1 },
 *     "auto_load": true
 *   }
 *
 * "states" is storage order: key "1" is relay 1. A snapshot exists exactly
 * when settings.last_saved is present; CLEAR removes it together with the
 * state bits.
 *
 * Read Failures
 * -------------
 * Reads never fail. Whatever the medium reports, the store continues with
 * a usable document: defaults are substituted and a write of them is
 * attempted. An unreadable medium therefore looks like a fresh board: names
 * read back as "Relay <n>" and LOAD finds no snapshot. Only writes can fail.
 *
 * Non-Goals
 * ---------
 * - No locking. One device loop owns the store.
 * - No migration between document versions.
 *
 * @author Leo
 */

#include <cstdint>
#include <string>

#include "relay_grammar.hpp"   // kRelayCount, kNameMaxLength

namespace picorelay {

class Clock;

struct RelaySettings {
  bool     auto_save      = true;
  uint32_t created_time   = 0;
  bool     has_last_saved = false;
  uint32_t last_saved     = 0;
};

struct RelayConfig {
  std::string   names[kRelayCount];
  uint8_t       states[kRelayCount] = {0};   // storage order, [0] = relay 1
  bool          auto_load = true;
  RelaySettings settings;
};

/// Fresh document: names "Relay <n>", states 0, auto-load on, no snapshot.
RelayConfig make_default_config(uint32_t now_ms);

/// Default display name for a relay ("Relay 3").
std::string default_relay_name(uint8_t relay);

// -----------------------------------------------------------------------------
// Medium
// -----------------------------------------------------------------------------

enum class MediumStatus : uint8_t {
  OK,
  EMPTY,       ///< nothing stored yet
  CORRUPT,     ///< stored bytes did not decode into a document
  IO_ERROR     ///< the medium itself could not be read
};

class ConfigMedium {
 public:
  virtual ~ConfigMedium() {}
  virtual MediumStatus read(RelayConfig& out) = 0;
  virtual bool write(const RelayConfig& cfg) = 0;
};

// -----------------------------------------------------------------------------
// Store contract
// -----------------------------------------------------------------------------

enum class LoadResult : uint8_t {
  LOADED,
  ABSENT       ///< no snapshot saved, cleared, or medium unreadable
};

class ConfigStore {
 public:
  virtual ~ConfigStore() {}

  virtual bool get_name(uint8_t relay, std::string& out) = 0;
  /// Empty @p name clears it. Rejects relay outside 1..8 and names > 32 chars.
  virtual bool set_name(uint8_t relay, const std::string& name) = 0;

  virtual bool get_auto_load(bool& out) = 0;
  virtual bool set_auto_load(bool on) = 0;

  /// @p storage is 8 chars of '0'/'1', index 0 = relay 1.
  virtual bool save_states(const std::string& storage) = 0;
  virtual LoadResult load_states(std::string& storage) = 0;
  virtual bool clear_states() = 0;
};

/**
 * @class PersistentConfigStore
 * @brief ConfigStore that round-trips a ConfigMedium on every call.
 *
 * Timestamps come from @p clock (milliseconds since boot on the device).
 */
class PersistentConfigStore : public ConfigStore {
 public:
  PersistentConfigStore(ConfigMedium& medium, Clock& clock);

  bool get_name(uint8_t relay, std::string& out) override;
  bool set_name(uint8_t relay, const std::string& name) override;
  bool get_auto_load(bool& out) override;
  bool set_auto_load(bool on) override;
  bool save_states(const std::string& storage) override;
  LoadResult load_states(std::string& storage) override;
  bool clear_states() override;

 private:
  RelayConfig fetch();

  ConfigMedium& medium_;
  Clock&        clock_;
};

} // namespace picorelay
