// planar_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <planar/core/log.hpp>
#include <filesystem>
#include <string>

using namespace planar_core;

// =============================================================================
// Level Parsing
// =============================================================================

TEST_CASE("parse_log_level", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("aliases") {
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    }

    SECTION("unknown names") {
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
        REQUIRE_FALSE(parse_log_level("INFO").has_value());
    }
}

TEST_CASE("log_level_name round trips through parse", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical,
                       spdlog::level::off}) {
        auto parsed = parse_log_level(log_level_name(level));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == level);
    }
}

// =============================================================================
// Named Loggers
// =============================================================================

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("get_logger returns one instance per name") {
        auto a = get_logger("planar_test_logger");
        auto b = get_logger("planar_test_logger");
        REQUIRE(a != nullptr);
        REQUIRE(a.get() == b.get());
        REQUIRE(a->name() == "planar_test_logger");
    }

    SECTION("module loggers") {
        REQUIRE(core_logger()->name() == "planar_core");
        REQUIRE(collision_logger()->name() == "planar_collision");
        REQUIRE(spdlog::get("planar_collision") != nullptr);
    }
}

TEST_CASE("Global level reaches named loggers", "[core][log]") {
    auto logger = get_logger("planar_level_test");
    const auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(logger->level() == spdlog::level::err);
    REQUIRE(collision_logger()->level() == spdlog::level::err);

    set_logger_level("planar_level_test", spdlog::level::trace);
    REQUIRE(logger->level() == spdlog::level::trace);
    REQUIRE(collision_logger()->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(logger->level() == previous);
}

TEST_CASE("configure_logging rebuilds the shared sinks", "[core][log]") {
    auto existing = get_logger("planar_sink_test");

    LogConfig config;
    config.console = false;
    config.level = spdlog::level::warn;
    configure_logging(config);

    SECTION("loggers created earlier lose the console") {
        REQUIRE(existing->sinks().empty());
        REQUIRE(existing->level() == spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
    }

    SECTION("new loggers pick up the same sinks") {
        auto quiet = get_logger("planar_quiet_logger");
        REQUIRE(quiet->sinks().empty());
        REQUIRE(quiet->level() == spdlog::level::warn);
        REQUIRE_NOTHROW(flush_all_loggers());
    }

    SECTION("a rotating file sink") {
        const auto path = std::filesystem::temp_directory_path() / "planar_log_test.log";
        config.file_path = path.string();
        configure_logging(config);

        REQUIRE(existing->sinks().size() == 1);
        existing->warn("written to {}", config.file_path);
        flush_all_loggers();
        REQUIRE(std::filesystem::exists(path));
    }

    configure_logging(LogConfig{});
    REQUIRE(existing->sinks().size() == 1);
    REQUIRE(existing->level() == spdlog::level::info);
}
