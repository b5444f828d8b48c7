#pragma once

#include "kisancpp/types.hpp"

#include <string>

namespace kisancpp {

// Overlays KISANCPP_DB_PATH, KISANCPP_EMBED_DIMS, KISANCPP_LOG_LEVEL and
// KISANCPP_EDGE_INDEX onto `base`. Throws ValidationError on malformed values.
KisanConfig LoadConfigFromEnvironment(KisanConfig base = {});

void ValidateConfig(const KisanConfig& config);

// Accepts trace/debug/info/warn/error/off.
void ConfigureLogging(const std::string& level);

}  // namespace kisancpp
