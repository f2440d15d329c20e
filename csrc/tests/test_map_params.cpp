#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "logging.hpp"
#include "map_params.hpp"

using mdchunk::MapParams;

TEST(MapParams, ResolutionOrder) {
    MapParams params("MDCHUNK_TEST_");
    ::unsetenv("MDCHUNK_TEST_CHUNK_SIZE");
    EXPECT_EQ(params.get_param_value("chunk_size", std::nullopt, 7), 7u);

    ::setenv("MDCHUNK_TEST_CHUNK_SIZE", "42", 1);
    EXPECT_EQ(params.get_param_value("chunk_size", std::nullopt, 7), 42u);

    params.set_default("chunk_size", 64);
    EXPECT_EQ(params.get_param_value("chunk_size", std::nullopt, 7), 64u);
    EXPECT_EQ(params.get_param_value("chunk_size", 3, 7), 3u);

    params.reset_default();
    EXPECT_EQ(params.get_param_value("chunk_size", std::nullopt, 7), 42u);
    ::unsetenv("MDCHUNK_TEST_CHUNK_SIZE");
}

TEST(MapParams, BadEnvironmentValue) {
    MapParams params("MDCHUNK_TEST_");
    ::setenv("MDCHUNK_TEST_OVERLAP", "lots", 1);
    EXPECT_THROW(params.get_param_value("overlap", std::nullopt, 1), std::invalid_argument);
    ::setenv("MDCHUNK_TEST_OVERLAP", "-1", 1);
    EXPECT_THROW(params.get_param_value("overlap", std::nullopt, 1), std::invalid_argument);
    ::setenv("MDCHUNK_TEST_OVERLAP", " -5", 1);
    EXPECT_THROW(params.get_param_value("overlap", std::nullopt, 1), std::invalid_argument);
    ::setenv("MDCHUNK_TEST_OVERLAP", "+5", 1);
    EXPECT_THROW(params.get_param_value("overlap", std::nullopt, 1), std::invalid_argument);
    ::setenv("MDCHUNK_TEST_OVERLAP", "12", 1);
    EXPECT_EQ(params.get_param_value("overlap", std::nullopt, 1), 12u);
    ::unsetenv("MDCHUNK_TEST_OVERLAP");
}

TEST(MapParams, GetDefault) {
    MapParams params;
    params.set_default({{"a", 1}, {"b", 2}});
    EXPECT_EQ(params.get_default().size(), 2u);
    EXPECT_EQ(params.get_default("b"), std::optional<size_t>(2));
    EXPECT_FALSE(params.get_default("c").has_value());
}

TEST(Logging, SharedNamedLogger) {
    auto log = mdchunk::logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->name(), "mdchunk");
    EXPECT_EQ(log, mdchunk::logger());

    mdchunk::set_log_level(spdlog::level::debug);
    EXPECT_EQ(log->level(), spdlog::level::debug);
    mdchunk::set_log_level(spdlog::level::info);
}

TEST(Logging, UnknownLevelNameFallsBack) {
    EXPECT_EQ(mdchunk::log_level_from_name("debug"), spdlog::level::debug);
    EXPECT_EQ(mdchunk::log_level_from_name("warn"), spdlog::level::warn);
    EXPECT_EQ(mdchunk::log_level_from_name("off"), spdlog::level::off);
    EXPECT_EQ(mdchunk::log_level_from_name("verbose"), spdlog::level::info);
    EXPECT_EQ(mdchunk::log_level_from_name("verbose", spdlog::level::err), spdlog::level::err);
}
