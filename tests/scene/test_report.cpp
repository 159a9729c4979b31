// rhost_scene diagnostics report tests

#include <catch2/catch_test_macros.hpp>
#include "test_modules.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace rhost_scene;
using namespace rhost_test;

TEST_CASE("scene_report describes a running scene", "[scene][report]") {
    SceneBuilder builder(RegionInfo::create("Sandbox", 1000, 1001), 500);
    auto creator = std::make_shared<CreatorModule>("trees", std::vector<PCode>{PCode::Tree, PCode::Grass});
    builder.add_module("terrain", std::make_shared<TerrainModule>());
    builder.add_module("trees", creator);
    builder.add_module("estate", std::make_shared<BasicModule>("estate", true));
    builder.stack_module_interface<IEntityCreator>(creator);
    auto scene = std::move(builder).build();

    auto first = std::make_shared<Commander>("first");
    first->add_command("show", "", "", nullptr);
    auto second = std::make_shared<Commander>("second");
    second->add_command("show", "", "", nullptr);
    second->add_command("own", "", "", nullptr);
    scene->register_module_commander(first);
    scene->register_module_commander(second);

    (void)scene->allocate_local_id();
    (void)scene->allocate_local_id();

    auto report = scene_report(*scene);

    REQUIRE(report["region"]["name"] == "Sandbox");
    REQUIRE(report["region"]["handle"] == RegionInfo::handle_for(1000, 1001));
    REQUIRE(report["region"]["status"] == "Up");

    REQUIRE(report["modules"].size() == 3);
    REQUIRE(report["modules"][0]["name"] == "terrain");
    REQUIRE(report["modules"][2]["shared"] == true);

    REQUIRE(report["capabilities"]["TerrainChannel"] == 1);
    REQUIRE(report["capabilities"]["EntityCreator"] == 1);
    REQUIRE_FALSE(report["capabilities"].contains("Chat"));

    REQUIRE(report["entity_creators"] == nlohmann::json::array({"Grass", "Tree"}));

    REQUIRE(report["commanders"]["first"] == nlohmann::json::array({"show"}));
    REQUIRE(report["commanders"]["second"] == nlohmann::json::array({"own"}));

    REQUIRE(report["local_ids"]["seed"] == 500);
    REQUIRE(report["local_ids"]["last_allocated"] == 502);
    REQUIRE(report["local_ids"]["allocated"] == 2);
}

TEST_CASE("scene_report after close", "[scene][report]") {
    SceneBuilder builder(RegionInfo::create("Sandbox", 1000, 1000));
    builder.add_module("terrain", std::make_shared<BasicModule>("terrain"));
    auto scene = std::move(builder).build();
    scene->close();

    auto report = scene_report(*scene);
    REQUIRE(report["modules"].empty());
    REQUIRE(report["region"]["status"] == "Down");
}

TEST_CASE("scene_report while commanders register", "[scene][report]") {
    auto scene = SceneBuilder(RegionInfo::create("Sandbox", 1000, 1000)).build();
    constexpr int commander_count = 32;
    std::atomic<bool> done{false};

    std::thread registrar([&]() {
        for (int i = 0; i < commander_count; ++i) {
            auto commander = std::make_shared<Commander>("c" + std::to_string(i));
            commander->add_command("cmd" + std::to_string(i), "", "", nullptr);
            scene->register_module_commander(commander);
        }
        done.store(true);
    });

    std::size_t largest = 0;
    while (!done.load()) {
        auto report = scene_report(*scene);
        largest = std::max(largest, report["commanders"].size());
    }
    registrar.join();

    REQUIRE(largest <= commander_count);

    auto report = scene_report(*scene);
    REQUIRE(report["commanders"].size() == commander_count);
    REQUIRE(report["commanders"]["c7"] == nlohmann::json::array({"cmd7"}));
}
