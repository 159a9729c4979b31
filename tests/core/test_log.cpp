// rhost_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <rhost/core/log.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <string>

using namespace rhost_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("INFO").has_value());
}

TEST_CASE("Named loggers are shared", "[core][log]") {
    auto a = get_logger("test_shared");
    auto b = get_logger("test_shared");
    REQUIRE(a == b);
    REQUIRE(a->name() == "test_shared");

    REQUIRE(scene_logger()->name() == "scene");
    REQUIRE(commands_logger()->name() == "commands");
    REQUIRE(modules_logger()->name() == "modules");
    REQUIRE(core_logger()->name() == "rhost_core");
}

TEST_CASE("configure_logging reaches loggers created earlier", "[core][log]") {
    auto early = get_logger("test_reconfigure");

    LogConfig quiet;
    quiet.console_enabled = false;
    quiet.level = spdlog::level::err;
    configure_logging(quiet);

    REQUIRE(early->level() == spdlog::level::err);
    REQUIRE(early->sinks().empty());
    REQUIRE(get_logger("test_reconfigure_late")->level() == spdlog::level::err);

    configure_logging(LogConfig{});
    REQUIRE(early->level() == spdlog::level::info);
    REQUIRE(early->sinks().size() == 1);
}

TEST_CASE("LogScope traces entry and exit", "[core][log]") {
    auto logger = get_logger("test_scope");
    auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
    ring->set_pattern("%v");
    logger->sinks().push_back(ring);
    logger->set_level(spdlog::level::trace);

    {
        RHOST_LOG_SCOPE("Scene::close", "test_scope");
        logger->info("inside");
    }

    auto lines = ring->last_formatted();
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == ">>> Scene::close");
    REQUIRE(lines[1] == "inside");
    REQUIRE(lines[2].rfind("<<< Scene::close (", 0) == 0);
    REQUIRE(lines[2].find("us)") != std::string::npos);

    logger->sinks().pop_back();
    logger->set_level(spdlog::level::info);
}
