#include "ledge/core/TickScheduler.hh"
#include "ledge/utils/ErrorHandling.hh"

#include <algorithm>
#include <string>

namespace ledge {

TickScheduler::TickScheduler(float fixedDt, float maxFrameDt) : fixedDt_(fixedDt), maxFrameDt_(maxFrameDt) {
    if (fixedDt_ <= 0.0f) {
        throwError("TickScheduler fixed step must be positive, got " + std::to_string(fixedDt_));
    }
    if (maxFrameDt_ < fixedDt_) {
        throwError("TickScheduler max frame time must be at least one fixed step");
    }
}

int TickScheduler::advance(float frameDt, const DecisionFn& onDecision, const PhysicsFn& onPhysics) {
    // Clamp long stalls (debugger, window drag) to avoid a spiral of death
    float dt = std::clamp(frameDt, 0.0f, maxFrameDt_);

    if (onDecision) {
        onDecision(dt);
    }
    ++decisionTicks_;

    accumulator_ += dt;
    int steps = 0;
    while (accumulator_ >= fixedDt_) {
        if (onPhysics) {
            onPhysics(fixedDt_);
        }
        accumulator_ -= fixedDt_;
        ++physicsTicks_;
        ++steps;
    }
    return steps;
}

float TickScheduler::fixedDt() const {
    return fixedDt_;
}

float TickScheduler::maxFrameDt() const {
    return maxFrameDt_;
}

float TickScheduler::accumulator() const {
    return accumulator_;
}

float TickScheduler::alpha() const {
    return accumulator_ / fixedDt_;
}

uint64_t TickScheduler::decisionTicks() const {
    return decisionTicks_;
}

uint64_t TickScheduler::physicsTicks() const {
    return physicsTicks_;
}

void TickScheduler::reset() {
    accumulator_ = 0.0f;
    decisionTicks_ = 0;
    physicsTicks_ = 0;
}

} // namespace ledge
