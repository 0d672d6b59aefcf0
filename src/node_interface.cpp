// node_interface.cpp — implementation for node_interface.hpp
// See node_interface.hpp for the boot sequence and module boundaries.

#include "node_interface.hpp"      // Node-facing API: begin, line handlers, uid
#include "node_link.hpp"           // node_link_send_line
#include "node_indicator.hpp"      // RGB outcome + boot color
#include "board_backend.hpp"       // BoardBackend, ArduinoClock
#include "board_config_store.hpp"  // NvsConfigMedium
#include "board_config.hpp"        // identity strings, boot beep
#include "relay_config.hpp"        // PersistentConfigStore
#include "relay_log.hpp"

#include <Arduino.h>               // ESP.getEfuseMac
#include <stdio.h>                 // snprintf

using picorelay::BoardIdentity;
using picorelay::Dispatcher;
using picorelay::ErrorCode;

// ============================================================================
// Owned instances
// ============================================================================

static BoardBackend                     s_backend;
static ArduinoClock                     s_clock;
static NvsConfigMedium                  s_medium;
static picorelay::PersistentConfigStore s_store(s_medium, s_clock);

static char s_uid[17] = "0000000000000000";

//
// make_uid()
// ----------
// The 48-bit eFuse MAC is unique per chip and survives reflashing. Printed
// as a zero-padded 64-bit value so the UID is always 16 hex chars.
//
static void make_uid() {
  const uint64_t mac = ESP.getEfuseMac();
  snprintf(s_uid, sizeof(s_uid), "%016llX", static_cast<unsigned long long>(mac));
}

static BoardIdentity make_identity() {
  BoardIdentity id;
  id.board_name       = board::BOARD_NAME;
  id.board_version    = board::BOARD_VERSION;
  id.firmware_version = board::FIRMWARE_VERSION;
  id.uid              = s_uid;
  return id;
}

// Constructed on first use, after make_uid() has run.
static Dispatcher& dispatcher() {
  static Dispatcher d(s_backend, s_store, s_clock, make_identity());
  return d;
}

// ============================================================================
// Public API
// ============================================================================

void node_interface_begin() {
  // Phase 1: outputs to a known state
  s_backend.begin();

  // Phase 2: identity, then the dispatcher that reports it
  make_uid();
  Dispatcher& d = dispatcher();

  // Phase 3: restore saved relay states (touches NVS, creating defaults)
  if (d.apply_boot_state()) {
    PICORELAY_LOG_INFO("boot: restored %s", s_backend.status_binary().c_str());
  }

  // Phase 4: audible "I'm up"
  if (s_backend.buzzer_ready()) {
    const picorelay::HwStatus s = s_backend.beep(board::BOOT_BEEP_MS, board::BUZZER_DEFAULT_HZ);
    if (s != picorelay::HwStatus::OK) {
      PICORELAY_LOG_WARN("boot beep failed: %s", picorelay::hw_status_name(s));
    }
  }

  node_indicator_show_boot();
  PICORELAY_LOG_INFO("%s fw %s uid %s ready", board::BOARD_NAME, board::FIRMWARE_VERSION, s_uid);
}

void node_interface_on_line(const char* line, size_t len) {
  Dispatcher& d = dispatcher();
  const std::string resp = d.process_line(std::string(line, len));
  node_link_send_line(resp.c_str(), resp.size());
  node_indicator_show_result(!d.last_failed());
}

void node_interface_on_overflow() {
  Dispatcher& d = dispatcher();
  const std::string resp = d.reject_line(ErrorCode::INVALID_COMMAND);
  node_link_send_line(resp.c_str(), resp.size());
  node_indicator_show_result(false);
}

const char* node_interface_uid() {
  return s_uid;
}

const picorelay::ProtocolStatistics& node_interface_statistics() {
  return dispatcher().statistics();
}
