#pragma once
/**
 * @file config_json.hpp
 * @brief RelayConfig <-> JSON text, using ArduinoJson.
 *
 * The layout is documented in relay_config.hpp. Decoding is lenient about
 * missing members (they take their default values) and strict about wrong
 * types: a member that is present but of the wrong kind, or a name longer
 * than 32 chars, fails the whole decode so the store rewrites defaults.
 */

#include <string>

#include "relay_config.hpp"

namespace picorelay {

bool encode_config(const RelayConfig& cfg, std::string& out);

/// @retval false Not JSON, root not an object, or a member has the wrong type.
bool decode_config(const std::string& text, RelayConfig& out);

} // namespace picorelay
