/// @file main.cpp
/// @brief Headless fast travel simulator.
///
/// Loads a YAML configuration, builds a small multi-scene world, and runs one
/// travel request through the full transition state machine on a fixed-step
/// frame loop.
///
/// Usage: ftr_travel_sim [--config <path>] [--to <destination>]

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "console_logger.hpp"
#include "ftr/foundation/config_manager.hpp"
#include "ftr/foundation/travel_logger.hpp"
#include "ftr/travel/destination_discovery.hpp"
#include "ftr/travel/destination_registry.hpp"
#include "ftr/travel/fade_overlay.hpp"
#include "ftr/travel/timed_scene_loader.hpp"
#include "ftr/travel/transition_orchestrator.hpp"
#include "ftr/version.hpp"
#include "ftr/world/scene_graph.hpp"

namespace {

using ftr::foundation::ConfigManager;
using ftr::foundation::LogCategory;
using ftr::foundation::kLogCategoryCount;
using ftr::world::Vector3;

std::string findArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path resolveConfigPath(int argc, char* argv[]) {
    if (auto arg = findArg(argc, argv, "--config"); !arg.empty()) {
        return arg;
    }
    if (const char* env = std::getenv("FTR_CONFIG_PATH"); env != nullptr) {
        return env;
    }
    return "config/fast_travel.yaml";
}

/// Apply logging.level.<category> overrides.
void applyLogLevels(const ConfigManager& config) {
    auto& logger = ftr::foundation::TravelLogger::instance();
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        std::string name(ftr::foundation::logCategoryName(cat));
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        auto value = config.get<std::string>("logging.level." + name);
        if (!value) {
            continue;
        }
        if (auto level = ftr::foundation::parseLogLevel(value.value())) {
            logger.setCategoryLevel(cat, *level);
        } else {
            FTR_LOG_WARN(LogCategory::Config, "unknown log level: " + value.value());
        }
    }
}

/// Persistent player with a silver purse and a camera rig that follows it.
ftr::world::NodeId spawnPlayer(ftr::world::SceneGraph& graph, int64_t silver) {
    auto root = graph.createNode("PlayerChar_Local", {}, Vector3{0.0f, 1.0f, 0.0f});
    graph.setTag(root, "Player");
    graph.addComponent(root, "Character");
    graph.addRigidbody(root);
    auto inventory = std::make_unique<ftr::world::ReflectedInventory>("CharacterInventory");
    inventory->withField("Silver", silver);
    graph.attachInventory(root, std::move(inventory));
    graph.markPersistent(root);

    auto cameraRig = graph.createNode("CameraRig", {}, Vector3{0.0f, 3.0f, -4.0f});
    auto camera = graph.createNode("Main Camera", cameraRig, Vector3{0.0f, 3.0f, -4.0f});
    graph.setMainCamera(camera);
    graph.markPersistent(cameraRig);
    return root;
}

/// Scene content: a ground slab under the arrival point.
ftr::travel::SceneBuilder groundAt(std::optional<Vector3> point) {
    return [point](ftr::world::SceneGraph& graph) {
        if (!point) {
            graph.createNode("Terrain");
            return;
        }
        auto ground = graph.createNode("Terrain", {}, *point);
        ftr::world::Collider collider;
        collider.bounds.center = {point->x, point->y - 1.5f, point->z};
        collider.bounds.halfExtents = {200.0f, 1.0f, 200.0f};
        graph.setCollider(ground, collider);
    };
}

} // namespace

int main(int argc, char* argv[]) {
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<ftr::app::ConsoleLogger>());

    std::cout << "fast travel simulator " << ftr::Version::string << "\n";

    auto configPath = resolveConfigPath(argc, argv);
    ConfigManager config;
    auto loaded = config.load(configPath);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevels(config);

    auto travelConfig = ftr::travel::TravelConfig::fromConfig(config);
    if (!travelConfig) {
        std::cerr << "Invalid travel config: " << travelConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = travelConfig.value();

    ftr::travel::DestinationRegistry registry;
    if (auto seeded = registry.loadSeed(configPath); !seeded) {
        std::cerr << "Failed to load destinations: " << seeded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (auto statePath = config.get<std::string>("travel.state_file")) {
        registry.setStatePath(statePath.value());
        if (auto state = registry.loadState(); !state) {
            FTR_LOG_WARN(LogCategory::Registry,
                         "ignoring state file: " + std::string(state.error().message()));
        }
    }

    ftr::world::SceneGraph graph(config.getOr<std::string>("sim.start_scene", "Start"));
    spawnPlayer(graph, config.getOr<int64_t>("sim.starting_silver", 500));

    ftr::travel::TimedSceneLoader loader(graph);
    loader.registerScene(cfg.intermediateScene, 0.5f);
    for (const auto& dest : registry.all()) {
        if (dest.sceneId) {
            loader.registerScene(*dest.sceneId, 2.0f, groundAt(dest.coordinates));
        }
    }
    // The start scene has content too.
    for (const auto& dest : registry.all()) {
        if (dest.sceneId && *dest.sceneId == graph.activeScene()) {
            groundAt(dest.coordinates)(graph);
        }
    }

    ftr::travel::FadeOverlay overlay;
    ftr::travel::TransitionOrchestrator travel(
        cfg, ftr::travel::TransitionServices{graph, graph, loader, registry, &overlay});
    ftr::travel::DestinationDiscovery discovery(graph, registry, cfg.resolver,
                                                cfg.discoveryRadius);

    std::cout << "Destinations:\n";
    for (const auto& dest : registry.listTravelable()) {
        std::cout << "  " << dest.name << " (" << dest.effectivePrice(cfg.defaultPrice)
                  << (dest.isActionable() ? ")" : ", no coordinates)") << "\n";
    }

    auto target = findArg(argc, argv, "--to");
    if (target.empty()) {
        target = config.getOr<std::string>("sim.destination", "Cierzo");
    }

    auto accepted = travel.attemptTravel(target);
    if (!accepted) {
        std::cerr << "Travel rejected: " << accepted.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const float frameRate = config.getOr<float>("sim.frame_rate", 30.0f);
    const float dt = 1.0f / (frameRate > 0.0f ? frameRate : 30.0f);
    const float maxSeconds = config.getOr<float>("sim.max_seconds", 120.0f);
    for (float elapsed = 0.0f; travel.isBusy() && elapsed < maxSeconds; elapsed += dt) {
        loader.update(dt);
        travel.update(dt);
        overlay.update(dt);
    }
    if (travel.isBusy() && !travel.cancel()) {
        FTR_LOG_WARN(LogCategory::Core, "travel still busy after simulation time limit");
    }
    discovery.update(1.0f);

    const auto& report = travel.lastReport();
    if (!report) {
        std::cerr << "Travel produced no report\n";
        return EXIT_FAILURE;
    }
    std::cout << "Outcome: " << ftr::travel::toString(report->outcome);
    if (report->arrival) {
        std::cout << " at (" << report->arrival->x << ", " << report->arrival->y << ", "
                  << report->arrival->z << ")";
    }
    if (!report->detail.empty()) {
        std::cout << " - " << report->detail;
    }
    std::cout << "\n";
    for (const auto& timing : report->timings) {
        std::cout << "  " << timing.stage << ": " << timing.seconds << "s\n";
    }

    if (auto flushed = ftr::foundation::TravelLogger::instance().flush(); !flushed) {
        std::cerr << flushed.error().message() << "\n";
    }
    return report->outcome == ftr::travel::TransitionOutcome::Succeeded ? EXIT_SUCCESS
                                                                        : EXIT_FAILURE;
}
