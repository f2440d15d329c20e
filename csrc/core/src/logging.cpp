#include "logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mdchunk {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>("mdchunk", sink);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    created->set_level(spdlog::level::info);
    created->flush_on(spdlog::level::warn);

    if (const char* env = std::getenv("MDCHUNK_LOG_LEVEL"); env != nullptr && *env != '\0') {
        const auto level = log_level_from_name(env);
        if (level == spdlog::level::info && spdlog::level::from_str(env) != spdlog::level::info)
            created->warn("unknown MDCHUNK_LOG_LEVEL '{}', using info", env);
        created->set_level(level);
    }
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    // Function-local static: initialization is thread safe.
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

spdlog::level::level_enum log_level_from_name(
    const std::string& name, spdlog::level::level_enum fallback)
{
    // from_str maps every unknown name to off.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return fallback;
    return level;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mdchunk
