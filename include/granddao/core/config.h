#pragma once

#include <string>

#include "granddao/core/simulation.h"
#include "granddao/util/autosave.h"
#include "granddao/util/json.h"

namespace granddao {

// Overlays the keys present in `root` (a JSON object) onto *cfg. Unknown keys
// are ignored; a known key with the wrong type throws std::runtime_error.
//
// Tribulation knobs live under a nested "tribulation" object.
void apply_sim_config_json(const json::Value& root, SimConfig* cfg);

// Same for the optional "autosave" object ({"enabled": bool, "interval_seconds": int}).
void apply_autosave_config_json(const json::Value& root, AutosaveConfig* cfg);

// Reads a config file and overlays it onto the defaults.
// Throws std::runtime_error on IO, parse or type errors.
SimConfig load_sim_config_from_file(const std::string& path, AutosaveConfig* autosave = nullptr);

} // namespace granddao
