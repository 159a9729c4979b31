// rhost_scene RegionConfigParser tests

#include <catch2/catch_test_macros.hpp>
#include <rhost/scene/config.hpp>

#include <filesystem>
#include <fstream>

using namespace rhost_scene;
using rhost_core::ErrorCode;

TEST_CASE("RegionConfigParser minimal document", "[scene][config]") {
    RegionConfigParser parser;
    auto result = parser.parse_string(R"(
        [region]
        name = "Sandbox"
    )");

    REQUIRE(result.is_ok());
    const auto& config = result.value();
    REQUIRE(config.region.region_name == "Sandbox");
    REQUIRE(config.region.location_x == 1000);
    REQUIRE(config.region.location_y == 1000);
    REQUIRE(config.region.max_agents == 100);
    REQUIRE(config.region.region_handle == RegionInfo::handle_for(1000, 1000));
    REQUIRE(config.local_id_seed == 720000);
    REQUIRE(config.logging.level == spdlog::level::info);
    REQUIRE(parser.last_error().empty());
}

TEST_CASE("RegionConfigParser full document", "[scene][config]") {
    RegionConfigParser parser;
    auto result = parser.parse_string(R"(
        [region]
        name = "Harbour"
        location_x = 1002
        location_y = 998
        max_agents = 40

        [scene]
        local_id_seed = 5000

        [logging]
        level = "debug"
        console = false
        file = true
        directory = "logs"
        max_file_size = 1048576
        max_files = 3
    )");

    REQUIRE(result.is_ok());
    const auto& config = result.value();
    REQUIRE(config.region.location_x == 1002);
    REQUIRE(config.region.location_y == 998);
    REQUIRE(config.region.region_handle ==
        ((static_cast<std::uint64_t>(1002 * 256) << 32) | static_cast<std::uint64_t>(998 * 256)));
    REQUIRE(config.region.max_agents == 40);
    REQUIRE(config.local_id_seed == 5000);
    REQUIRE(config.logging.level == spdlog::level::debug);
    REQUIRE_FALSE(config.logging.console_enabled);
    REQUIRE(config.logging.file_enabled);
    REQUIRE(config.logging.log_directory == "logs");
    REQUIRE(config.logging.max_file_size == 1048576);
    REQUIRE(config.logging.max_files == 3);
}

TEST_CASE("RegionConfigParser explicit handle", "[scene][config]") {
    RegionConfigParser parser;
    auto result = parser.parse_string(R"(
        [region]
        name = "Fixed"
        handle = 1099511628032000
    )");

    REQUIRE(result.is_ok());
    REQUIRE(result.value().region.region_handle == 1099511628032000ULL);
}

TEST_CASE("RegionConfigParser rejects invalid documents", "[scene][config]") {
    RegionConfigParser parser;

    SECTION("syntax error") {
        auto result = parser.parse_string("[region\nname = ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE_FALSE(parser.last_error().empty());
    }

    SECTION("missing region table") {
        auto result = parser.parse_string("[scene]\nlocal_id_seed = 1\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("empty name") {
        auto result = parser.parse_string("[region]\nname = \"\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<rhost_core::ConfigError>()->key == "region.name");
    }

    SECTION("negative coordinate") {
        auto result = parser.parse_string("[region]\nname = \"A\"\nlocation_x = -1\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<rhost_core::ConfigError>()->key == "region.location_x");
    }

    SECTION("seed out of range") {
        auto result = parser.parse_string("[region]\nname = \"A\"\n[scene]\nlocal_id_seed = 4294967296\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<rhost_core::ConfigError>()->key == "scene.local_id_seed");
    }

    SECTION("unknown log level") {
        auto result = parser.parse_string("[region]\nname = \"A\"\n[logging]\nlevel = \"loud\"\n");
        REQUIRE(result.is_err());
        REQUIRE(parser.last_error().find("loud") != std::string::npos);
    }

    SECTION("non-positive rotation settings") {
        auto result = parser.parse_string("[region]\nname = \"A\"\n[logging]\nmax_files = 0\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<rhost_core::ConfigError>()->key == "logging.max_files");
    }
}

TEST_CASE("RegionConfigParser reads files", "[scene][config]") {
    RegionConfigParser parser;

    SECTION("missing file") {
        auto result = parser.parse("/nonexistent/rhost/region.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "rhost_test_region.toml";
        {
            std::ofstream out(path);
            out << "[region]\nname = \"OnDisk\"\n";
        }

        auto result = parser.parse(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE(result.value().region.region_name == "OnDisk");
    }
}
