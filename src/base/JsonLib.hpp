#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Every JSON value exchanged with the daemon is an `nlohmann::json`.
 */
using json = nlohmann::json;
