#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 *
 * Envelopes, RPC messages and the action manifest all go through this type.
 */
using json = nlohmann::json;
