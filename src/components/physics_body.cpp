#include "core2d/components/physics_body.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace Components {

PhysicsBody::PhysicsBody(int id, double mass, Shape shape)
    : shape(std::move(shape))
    , m_id(id)
{
    setMass(mass);
}

void PhysicsBody::setMass(double mass) {
    m_mass = mass;
    m_invMass = 1.0 / mass;
}

bool PhysicsBody::validateMass(double mass, const Diagnostics::Sink &sink) {
    if (std::isfinite(mass) && mass > 0.0) {
        return true;
    }
    std::ostringstream msg;
    msg << "mass " << mass << " is not a finite positive value; inverse mass would be "
        << (1.0 / mass);
    Diagnostics::emit(sink, Diagnostics::Level::Warning, msg.str());
    return false;
}

void PhysicsBody::applyForce(const Vector2 &force) {
    if (isStatic) {
        return;
    }
    velocity += force * m_invMass;
}

void PhysicsBody::integrate(double dt, const Vector2 &gravity, const SleepConfig &config) {
    if (isStatic) {
        return;
    }

    sleepTick(dt, config);
    if (m_sleeping) {
        return;
    }

    // Linear drag
    velocity.x *= 1 - linearDrag * dt;
    velocity.y *= 1 - linearDrag * dt;

    velocity += gravity * dt;
    position += velocity * dt;
}

void PhysicsBody::sleepTick(double dt, const SleepConfig &config) {
    if (velocity.x * velocity.x + velocity.y * velocity.y < config.velocityThreshold) {
        m_idleTime += dt;
    } else {
        m_idleTime = 0.0;
    }

    if (m_idleTime > config.timeThreshold) {
        m_sleeping = true;
    }
}

void PhysicsBody::wakeUp() {
    m_sleeping = false;
}

void PhysicsBody::putToSleep() {
    m_sleeping = true;
}

} // namespace Components
