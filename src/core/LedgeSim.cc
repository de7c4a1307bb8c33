#include "ledge/core/JoltCharacterBody.hh"
#include "ledge/core/Log.hh"
#include "ledge/core/MovementConfigLoader.hh"
#include "ledge/core/PhysicsWorld.hh"
#include "ledge/core/PlatformerController.hh"
#include "ledge/core/TickScheduler.hh"

#include <array>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

#ifndef LEDGE_VERSION
#define LEDGE_VERSION "0.0.0"
#endif

namespace {

constexpr std::string_view kAppName = "ledge-sim";

// Level: floor along y = 0, a tall wall to the right of the spawn point
constexpr float kFloorHalfWidth = 20.0f;
constexpr float kWallX = 4.0f;
constexpr float kWallHalfHeight = 12.0f;
constexpr float kGravity = -30.0f;
constexpr float kFrameDt = 1.0f / 60.0f;
constexpr float kDuration = 4.0f;

// Scripted input: from `start` seconds on, hold `horizontal`; press jump on
// the first frame of the segment if `jump`.
struct InputSegment {
    float start;
    float horizontal;
    bool jump;
};

constexpr std::array<InputSegment, 5> kScript{{
    {0.0f, 0.0f, false},  // settle on the floor
    {0.5f, 1.0f, true},   // run right and jump towards the wall
    {1.3f, 0.0f, false},  // let go and slide
    {1.8f, 0.0f, true},   // plain wall jump
    {2.4f, -1.0f, false}, // drift left and land
}};

class LoggingAnimationSink final : public ledge::AnimationSink {
  public:
    void setBool(std::string_view name, bool value) override {
        auto [it, inserted] = values_.try_emplace(std::string(name), value);
        if (!inserted && it->second == value)
            return;
        it->second = value;
        LEDGE_LOG_DEBUG("anim {} = {}", name, value);
    }

    void setTrigger(std::string_view name) override { LEDGE_LOG_INFO("anim trigger {}", name); }

  private:
    std::map<std::string, bool, std::less<>> values_;
};

ledge::FrameInput scriptedInput(float t, size_t& segment) {
    ledge::FrameInput input;
    size_t next = segment;
    while (next + 1 < kScript.size() && t >= kScript[next + 1].start) {
        ++next;
    }
    input.horizontal = kScript[next].horizontal;
    input.jumpPressed = next != segment && kScript[next].jump;
    segment = next;
    return input;
}

void printUsage() {
    std::cout << "Usage: " << kAppName << " [options] [movement.toml]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --version    Display version information" << std::endl;
    std::cout << "  --help       Display this help message" << std::endl;
}

int runSimulation(const ledge::MovementConfig& config) {
    ledge::PhysicsWorld world;
    world.init();
    world.setGravity(kGravity);

    world.createStaticBox(0.0f, -0.5f, kFloorHalfWidth, 0.5f, ledge::physics::kLayerGround);
    world.createStaticBox(kWallX + 0.5f, kWallHalfHeight, 0.5f, kWallHalfHeight, ledge::physics::kLayerWall);

    ledge::CharacterBodySettings bodySettings;
    auto handle = world.createCharacterBody(0.0f, bodySettings.halfHeight + 0.05f, bodySettings);

    ledge::JoltCharacterBody body(world, handle);
    LoggingAnimationSink animation;
    ledge::PlatformerController controller(config, body, body, &animation);
    body.attach(controller);

    ledge::TickScheduler scheduler;
    std::map<ledge::JumpKind, int> jumps;
    size_t segment = 0;
    float t = 0.0f;

    while (t < kDuration) {
        scheduler.advance(
            kFrameDt,
            [&](float dt) {
                controller.onDecisionTick(scriptedInput(t, segment), dt);
                if (controller.lastJump() != ledge::JumpKind::None)
                    ++jumps[controller.lastJump()];
            },
            [&](float fixedDt) {
                controller.onPhysicsTick();
                world.step(fixedDt);
            });
        t += kFrameDt;
    }

    auto pos = body.position();
    LEDGE_LOG_INFO("Finished at ({:.2f}, {:.2f}) phase {} after {} decision / {} physics ticks", pos.x, pos.y,
                   ledge::phaseToString(controller.phase()), scheduler.decisionTicks(), scheduler.physicsTicks());
    for (const auto& [kind, count] : jumps) {
        LEDGE_LOG_INFO("  {} jumps: {}", ledge::JumpDispatcher::kindToString(kind), count);
    }

    body.detach();
    world.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ledge::log::init();
    LEDGE_LOG_INFO("Starting {} {}", kAppName, LEDGE_VERSION);

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--version") {
            std::cout << kAppName << " version " << LEDGE_VERSION << std::endl;
            ledge::log::shutdown();
            return 0;
        }
        if (arg == "--help") {
            printUsage();
            ledge::log::shutdown();
            return 0;
        }
        configPath = std::string(arg);
    }

    ledge::MovementConfig config;
    if (!configPath.empty()) {
        auto loaded = ledge::loadMovementConfig(configPath);
        if (loaded.isError()) {
            LEDGE_LOG_ERROR("Config error ({}): {}", ledge::errorCodeToString(loaded.code()), loaded.message());
            ledge::log::shutdown();
            return 1;
        }
        config = loaded.value();
    }

    int rc = 0;
    try {
        rc = runSimulation(config);
    } catch (const std::exception& e) {
        LEDGE_LOG_CRITICAL("Simulation failed: {}", e.what());
        rc = 1;
    }

    ledge::log::shutdown();
    return rc;
}
