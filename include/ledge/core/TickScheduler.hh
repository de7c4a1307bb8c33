#pragma once

#include <cstdint>
#include <functional>

namespace ledge {

// Host-side helper interleaving a variable-rate decision tick with a
// fixed-rate physics tick (accumulator pattern). The controller itself never
// schedules anything.
class TickScheduler {
  public:
    using DecisionFn = std::function<void(float dt)>;
    using PhysicsFn = std::function<void(float fixedDt)>;

    explicit TickScheduler(float fixedDt = 1.0f / 60.0f, float maxFrameDt = 0.25f);

    // One decision tick with the (clamped) frame time, then as many fixed
    // physics ticks as the accumulated time allows. Returns the number of
    // physics ticks run.
    int advance(float frameDt, const DecisionFn& onDecision, const PhysicsFn& onPhysics);

    float fixedDt() const;
    float maxFrameDt() const;

    // Leftover time carried into the next frame, in [0, fixedDt)
    float accumulator() const;

    // Fraction of a physics step carried over, for render interpolation
    float alpha() const;

    uint64_t decisionTicks() const;
    uint64_t physicsTicks() const;

    void reset();

  private:
    float fixedDt_;
    float maxFrameDt_;
    float accumulator_ = 0.0f;
    uint64_t decisionTicks_ = 0;
    uint64_t physicsTicks_ = 0;
};

} // namespace ledge
