#pragma once
/**
 * @page pr-node-interface PicoRelay Node Interface (wiring + line handlers)
 * @file node_interface.hpp
 * @brief Board-level glue: owns the backend, store and dispatcher instances.
 *
 * Overview
 * --------
 * This module is the operational core of the relay firmware. It owns the
 * concrete objects (BoardBackend, NvsConfigMedium, PersistentConfigStore,
 * Dispatcher), runs the boot sequence, and answers each line node_link hands
 * it. Think of it as the "control desk" between transport (node_link) and
 * presentation (node_indicator).
 *
 * Where It Sits
 * -------------
 * - Below: node_link.* (UART line assembly). Delivers complete request lines
 *   and writes response lines. node_interface never sees raw bytes.
 * - Beside: node_indicator.* (heartbeat + RGB). Told about each outcome.
 * - Inside: relay_dispatch.* does the protocol work; this file only wires.
 *
 * Boot Sequence (node_interface_begin)
 * ------------------------------------
 * 1) Relays driven OFF, buzzer channel attached.
 * 2) Config store opened; defaults written if NVS is empty or corrupt.
 * 3) Auto-load: saved states applied if enabled, present and non-zero.
 * 4) Boot beep when the buzzer came up.
 *
 * Nothing is printed on the protocol UART during boot. The first byte the
 * host sees is the answer to its first request.
 *
 * Non-Goals
 * ---------
 * - Parsing or validation (relay_grammar / relay_dispatch).
 * - Byte transport or line framing (node_link).
 *
 * @author Leo
 */

#include <stddef.h>
#include <stdint.h>

#include "relay_dispatch.hpp"   // ProtocolStatistics

/**
 * @brief Bring up hardware, storage and the dispatcher; restore saved state.
 *
 * Must be called once from setup(), after node_link_begin().
 */
void node_interface_begin();

/// Handle one request line and send exactly one response line.
void node_interface_on_line(const char* line, size_t len);

/// Answer a request that exceeded the line limit.
void node_interface_on_overflow();

/// 16 uppercase hex chars derived from the eFuse MAC.
const char* node_interface_uid();

/// Counters kept by the dispatcher since boot (or the last reset).
const picorelay::ProtocolStatistics& node_interface_statistics();
