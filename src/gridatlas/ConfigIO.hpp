#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/Error.hpp"
#include "gridatlas/Json.hpp"

#include <string>

namespace gridatlas {

// JSON helpers for AtlasConfig.
//
// Layout (snake_case keys, every section optional):
//   {
//     "grid":      {"resolutions": [64,128,256], "bounds_margin": 0.0},
//     "selection": {"policy": "center", "tie_break": "lowest_id", "dense_cell_threshold": 50,
//                   "sub_grid_size": 10, "examples_per_cell": 100},
//     "density":   {"method": "log", "percentile": 0.99, "reference_resolution": 0},
//     "layout":    {"base_size": 400, "min_size": 100, "spacing": 50, "cell_pitch": 0,
//                   "caption_offset": 20, "caption_max_chars": 100},
//     "export":    {"include_examples": true, "include_placement": false, "image_template": "",
//                   "max_file_bytes": 52428800, "write_retries": 3},
//     "threads": 0
//   }
//
// Applying JSON has merge semantics: missing keys leave the existing value
// unchanged. Unknown keys are rejected so typos do not pass silently.

JsonValue AtlasConfigToJson(const AtlasConfig& cfg);

bool ApplyAtlasConfigJson(const JsonValue& root, AtlasConfig& ioCfg, AtlasError& err);

bool LoadAtlasConfigJsonFile(const std::string& path, AtlasConfig& ioCfg, AtlasError& err);

} // namespace gridatlas
