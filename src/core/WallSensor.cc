#include "ledge/core/WallSensor.hh"

namespace ledge {

namespace {
const Vec2f kRight(1.0f, 0.0f);
const Vec2f kLeft(-1.0f, 0.0f);
} // namespace

WallSensor::WallSensor(const EnvironmentQuery& environment) : environment_(&environment) {}

WallSensor::WallContact WallSensor::sense(const Vec2f& position, float distance, LayerMask wallLayer) const {
    WallContact contact;

    if (environment_->probe(position, kRight, distance, wallLayer).hit) {
        contact.touching = true;
        contact.dirX = 1;
    } else if (environment_->probe(position, kLeft, distance, wallLayer).hit) {
        contact.touching = true;
        contact.dirX = -1;
    }

    return contact;
}

void WallSensor::update(ControllerState& state, const Vec2f& position, const MovementConfig& config) const {
    auto contact = sense(position, config.wallCheckDistance, config.wallLayer);
    state.isTouchingWall = contact.touching;
    state.wallDirX = contact.dirX;
}

} // namespace ledge
