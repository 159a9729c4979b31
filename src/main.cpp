/// @file main.cpp
/// @brief rhost_region entry point - brings one region scene up from region.toml
///
/// Loads the region config, configures logging, builds a scene with a flat
/// terrain channel and the built-in "region" commander, runs the commands
/// given on the command line and closes the scene.

#include <rhost/core/core.hpp>
#include <rhost/scene/region.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace rhost_scene;

namespace {

// =============================================================================
// Built-in modules
// =============================================================================

/// Flat heightmap at a fixed water-level offset
class FlatTerrainModule : public IRegionModule,
                          public ITerrainChannel,
                          public std::enable_shared_from_this<FlatTerrainModule> {
public:
    static constexpr int k_size = static_cast<int>(k_region_size);
    static constexpr float k_height = 21.0f;

    std::string name() const override { return "FlatTerrain"; }
    bool is_shared_module() const override { return false; }

    void initialise(SceneBuilder& builder) override {
        builder.register_module_interface<ITerrainChannel>(shared_from_this());
    }

    rhost_core::Result<void> close() override {
        return rhost_core::Ok();
    }

    int width() const override { return k_size; }
    int height() const override { return k_size; }

    std::vector<float> get_floats_serialised() const override {
        return std::vector<float>(static_cast<std::size_t>(k_size) * k_size, k_height);
    }
};

/// Console that only logs what modules register
class LoggingConsole : public ICommandConsole {
public:
    void add_command(const std::string& module_name, bool shared,
                     const std::string& command, const std::string& short_help,
                     const std::string& /*long_help*/, CommandCallback /*callback*/) override {
        rhost_core::commands_logger()->debug("Console command '{}' from {}{}: {}",
            command, module_name.empty() ? "<none>" : module_name, shared ? " (shared)" : "", short_help);
    }
};

// =============================================================================
// Region commander
// =============================================================================

int parse_count(const std::vector<std::string>& args, int fallback) {
    if (args.empty()) {
        return fallback;
    }
    try {
        return std::stoi(args.front());
    } catch (const std::exception&) {
        rhost_core::commands_logger()->warn("Ignoring non-numeric argument '{}'", args.front());
        return fallback;
    }
}

std::shared_ptr<Commander> make_region_commander(Scene& scene) {
    auto commander = std::make_shared<Commander>("region", "Region host commands");

    commander->add_command("show-modules", "List loaded region modules", "show-modules",
        [&scene](const std::string&, const std::vector<std::string>&) {
            for (const auto& line : scene.show({"modules"})) {
                std::cout << line << "\n";
            }
        });

    commander->add_command("report", "Print a JSON diagnostics report", "report",
        [&scene](const std::string&, const std::vector<std::string>&) {
            std::cout << scene_report(scene).dump(2) << "\n";
        });

    commander->add_command("alloc-id", "Allocate local ids", "alloc-id [count]",
        [&scene](const std::string&, const std::vector<std::string>& args) {
            int count = parse_count(args, 1);
            for (int i = 0; i < count; ++i) {
                auto id = scene.allocate_local_id();
                if (!id) {
                    std::cerr << rhost_core::build_error_chain(id.error()) << "\n";
                    return;
                }
                std::cout << rhost_core::format_local_id(id.value()) << "\n";
            }
        });

    commander->add_command("restart", "Request a region restart", "restart [seconds]",
        [&scene](const std::string&, const std::vector<std::string>& args) {
            auto notified = scene.restart(parse_count(args, 30));
            std::cout << "Restart passed to " << notified << " observer(s)\n";
        });

    return commander;
}

/// Split "name arg arg" into words
std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] REGION_TOML [COMMAND ...]\n"
              << "\n"
              << "Arguments:\n"
              << "  REGION_TOML     Path to region.toml\n"
              << "  COMMAND         Command line to run, e.g. \"alloc-id 3\"\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n"
              << "\n"
              << "Commands:\n"
              << "  show-modules, report, alloc-id [count], restart [seconds]\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " examples/sandbox/region.toml show-modules \"alloc-id 3\"\n";
}

void print_version() {
    std::cout << rhost_core::rhost_version_string() << "\n"
              << "rhost region host\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path config_path;
    std::vector<std::string> command_lines;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (config_path.empty()) {
            config_path = arg;
        } else {
            command_lines.push_back(arg);
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: No region config specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    RegionConfigParser parser;
    auto config = parser.parse(config_path);
    if (!config) {
        std::cerr << rhost_core::build_error_chain(config.error()) << "\n";
        return 1;
    }

    rhost_core::configure_logging(config->logging);
    auto logger = rhost_core::scene_logger();
    logger->info("Loading region '{}' from {}", config->region.region_name, config_path.string());

    SceneBuilder builder(config->region, config->local_id_seed);
    builder.with_console(std::make_shared<LoggingConsole>());
    builder.add_module("FlatTerrain", std::make_shared<FlatTerrainModule>());
    auto scene = std::move(builder).build();

    auto restart_sub = scene->events().on_restart([](const RegionInfo& info) {
        rhost_core::scene_logger()->info("Host would now restart region '{}'", info.region_name);
    });

    auto commander = make_region_commander(*scene);
    scene->register_module_commander(commander);
    for (const auto& [name, command] : commander->commands()) {
        auto registered = scene->add_command(nullptr, name, command->short_help(),
                                             command->long_help(), command->callback());
        if (!registered) {
            logger->warn("{}", registered.error().message());
        }
    }

    int exit_code = 0;
    for (const auto& line : command_lines) {
        auto words = split_words(line);
        if (words.empty()) {
            continue;
        }

        auto command = scene->get_command(words.front());
        if (!command) {
            rhost_core::Error err = rhost_core::CommandError::not_found(words.front());
            std::cerr << rhost_core::build_error_chain(err) << "\n";
            exit_code = 1;
            continue;
        }

        std::vector<std::string> args(words.begin() + 1, words.end());
        command->run(scene->commands().owner_of(words.front()), args);
    }

    scene->events().unsubscribe(restart_sub);
    auto report = scene->close();
    logger->info("Region '{}' down: {} closed, {} failed",
        scene->region_info().region_name, report.closed, report.failed);

    rhost_core::shutdown_logging();
    return exit_code;
}
