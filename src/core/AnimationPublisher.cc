#include "ledge/core/AnimationPublisher.hh"

namespace ledge {

AnimationPublisher::AnimationPublisher(AnimationSink* sink) : sink_(sink) {}

void AnimationPublisher::setSink(AnimationSink* sink) {
    sink_ = sink;
}

bool AnimationPublisher::hasSink() const {
    return sink_ != nullptr;
}

void AnimationPublisher::publish(const ControllerState& state) {
    if (!sink_)
        return;

    sink_->setBool(anim::kRun, state.isRunning);
    sink_->setBool(anim::kGrounded, state.grounded);
    sink_->setBool(anim::kWallSlide, state.isWallSliding);
}

void AnimationPublisher::triggerJump() {
    if (sink_)
        sink_->setTrigger(anim::kJump);
}

void AnimationPublisher::assertRunning() {
    if (sink_)
        sink_->setBool(anim::kRun, true);
}

} // namespace ledge
