#pragma once
/**
 * @file board_config_store.hpp
 * @brief ConfigMedium backed by ESP32 NVS (Preferences).
 *
 * The whole RelayConfig lives as one JSON string under a single key in its
 * own namespace (board::NVS_NAMESPACE / board::NVS_KEY). One key keeps the
 * write atomic from the store's point of view: a reset mid-save leaves
 * either the old document or the new one.
 *
 * read():
 *   - namespace cannot be opened  -> IO_ERROR
 *   - key absent or empty          -> EMPTY
 *   - JSON does not decode         -> CORRUPT
 */

#include "relay_config.hpp"

class NvsConfigMedium : public picorelay::ConfigMedium {
 public:
  NvsConfigMedium();
  ~NvsConfigMedium() override;

  picorelay::MediumStatus read(picorelay::RelayConfig& out) override;
  bool write(const picorelay::RelayConfig& cfg) override;

 private:
  bool open();
  bool open_;
};
