// rhost_scene Commander and CommandRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <rhost/core/log.hpp>
#include <rhost/scene/command_registry.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace rhost_scene;

namespace {

/// Capture everything the commands logger writes for the lifetime of the guard
class CommandLogCapture {
public:
    CommandLogCapture()
        : m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32)) {
        m_sink->set_pattern("%v");
        auto logger = rhost_core::commands_logger();
        logger->sinks().push_back(m_sink);
    }

    ~CommandLogCapture() {
        auto& sinks = rhost_core::commands_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    }

    bool contains(const std::string& text) const {
        for (const auto& line : m_sink->last_formatted()) {
            if (line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
};

std::shared_ptr<Commander> make_commander(const std::string& name,
                                          const std::vector<std::string>& commands,
                                          std::vector<std::string>* calls = nullptr) {
    auto commander = std::make_shared<Commander>(name, name + " commands");
    for (const auto& command : commands) {
        commander->add_command(command, command + " help", "", [calls, name, command](
            const std::string&, const std::vector<std::string>&) {
            if (calls) {
                calls->push_back(name + "." + command);
            }
        });
    }
    return commander;
}

} // anonymous namespace

// =============================================================================
// Commander
// =============================================================================

TEST_CASE("Commander runs its commands", "[scene][commands]") {
    std::vector<std::string> args_seen;
    Commander commander("terrain", "Terrain tools");
    commander.add_command("fill", "Fill terrain", "fill <height>",
        [&args_seen](const std::string& module, const std::vector<std::string>& args) {
            args_seen.push_back(module);
            args_seen.insert(args_seen.end(), args.begin(), args.end());
        });

    SECTION("known command") {
        auto result = commander.run("fill", {"21"});
        REQUIRE(result.is_ok());
        REQUIRE(args_seen == std::vector<std::string>{"terrain", "21"});
    }

    SECTION("unknown command") {
        auto result = commander.run("flatten", {});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == rhost_core::ErrorCode::NotFound);
        REQUIRE(*result.error().get_context("commander") == "terrain");
    }

    SECTION("help lists commands") {
        auto help = commander.help();
        REQUIRE(help.find("Terrain tools") != std::string::npos);
        REQUIRE(help.find("fill - Fill terrain") != std::string::npos);
    }
}

// =============================================================================
// CommandRegistry
// =============================================================================

TEST_CASE("CommandRegistry registers commanders and commands", "[scene][commands]") {
    CommandRegistry registry;
    auto region = make_commander("region", {"show-modules", "report"});

    REQUIRE(registry.register_module_commander(region));

    REQUIRE(registry.get_commander("region") == region);
    REQUIRE(registry.get_command("report") == region->commands().at("report"));
    REQUIRE(registry.owner_of("report") == "region");
    REQUIRE(registry.command_count() == 2);
    REQUIRE(registry.get_command("missing") == nullptr);
    REQUIRE(registry.get_commander("missing") == nullptr);
}

TEST_CASE("First commander keeps a contested command name", "[scene][commands]") {
    CommandRegistry registry;
    CommandLogCapture capture;
    std::vector<std::string> calls;

    auto first = make_commander("first", {"show", "first-only"}, &calls);
    auto second = make_commander("second", {"show", "second-only"}, &calls);

    REQUIRE(registry.register_module_commander(first));
    REQUIRE_NOTHROW(registry.register_module_commander(second));

    auto show = registry.get_command("show");
    REQUIRE(show == first->commands().at("show"));
    show->run("", {});
    REQUIRE(calls == std::vector<std::string>{"first.show"});

    // The rest of the second commander's commands are still published
    REQUIRE(registry.owner_of("second-only") == "second");
    REQUIRE(registry.get_commander("second") == second);

    REQUIRE(capture.contains(
        "Module commander second tried to register the command show which has already been registered by first"));
}

TEST_CASE("Duplicate commander name is rejected", "[scene][commands]") {
    CommandRegistry registry;
    auto original = make_commander("region", {"alloc-id"});
    auto impostor = make_commander("region", {"restart"});

    REQUIRE(registry.register_module_commander(original));
    REQUIRE_FALSE(registry.register_module_commander(impostor));

    REQUIRE(registry.get_commander("region") == original);
    REQUIRE(registry.get_command("restart") == nullptr);
    REQUIRE_FALSE(registry.register_module_commander(nullptr));
}

TEST_CASE("get_commanders is the live map", "[scene][commands]") {
    CommandRegistry registry;
    auto& live = registry.get_commanders();
    REQUIRE(live.empty());

    registry.register_module_commander(make_commander("region", {"report"}));

    REQUIRE(live.size() == 1);
    REQUIRE(live.count("region") == 1);
}

TEST_CASE("commanders_snapshot is a sorted copy", "[scene][commands]") {
    CommandRegistry registry;
    auto terrain = make_commander("terrain", {"fill"});
    registry.register_module_commander(make_commander("region", {"report"}));
    registry.register_module_commander(terrain);

    auto snapshot = registry.commanders_snapshot();
    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot[0].first == "region");
    REQUIRE(snapshot[1].second == terrain);

    registry.register_module_commander(make_commander("estate", {"ban"}));
    REQUIRE(snapshot.size() == 2);
}

TEST_CASE("CommandRegistry concurrent registration and lookup", "[scene][commands]") {
    CommandRegistry registry;
    constexpr int commander_count = 16;
    std::atomic<bool> done{false};
    std::atomic<int> lookups{0};

    std::thread reader([&]() {
        while (!done.load()) {
            if (registry.get_command("shared")) {
                lookups.fetch_add(1);
            }
            (void)registry.get_commander("c0");
        }
    });

    std::vector<std::thread> writers;
    for (int i = 0; i < commander_count; ++i) {
        writers.emplace_back([&registry, i]() {
            auto name = "c" + std::to_string(i);
            registry.register_module_commander(make_commander(name, {"shared", name + "-own"}));
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done.store(true);
    reader.join();

    REQUIRE(registry.get_commanders().size() == commander_count);
    REQUIRE(registry.command_count() == commander_count + 1);
    REQUIRE(registry.get_command("shared") != nullptr);
    REQUIRE_FALSE(registry.owner_of("shared").empty());
}
