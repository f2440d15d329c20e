#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mdchunk {

// Shared "mdchunk" logger on stderr. The level comes from MDCHUNK_LOG_LEVEL
// (trace, debug, info, warn, error, critical, off) and defaults to info.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// spdlog level for `name`; `fallback` when the name is not a spdlog level.
spdlog::level::level_enum log_level_from_name(
    const std::string& name, spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace mdchunk
