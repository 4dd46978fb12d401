/**
 * @file physics_body.hpp
 * @brief Per-object physical state and the sleep state machine
 *
 * A body carries its kinematic state, material coefficients, the AABB the
 * broad phase refreshes each frame, and two pieces of bookkeeping owned by
 * the spatial grid (grid membership and the last pair partner).
 *
 * Sleep states are Awake and Sleeping. Every integrate() on a dynamic body
 * runs sleepTick() first; a body that has been slow for longer than the
 * configured time falls asleep and only wakeUp() brings it back.
 */

#ifndef CORE2D_PHYSICS_BODY_HPP
#define CORE2D_PHYSICS_BODY_HPP

#include "core2d/components/shape.hpp"
#include "core2d/core/constants.hpp"
#include "core2d/core/debug.hpp"
#include "core2d/math/vector2.hpp"
#include "core2d/systems/rigid_body_collision/collision_data.hpp"

namespace Components {

/**
 * @struct SleepConfig
 * @brief Thresholds for putting idle bodies to sleep
 */
struct SleepConfig {
    // Squared speed below which the body accumulates idle time
    double velocityThreshold = SimulatorConstants::SleepVelocityThreshold;

    // Idle time that must be exceeded before the body sleeps
    double timeThreshold = SimulatorConstants::SleepTimeThreshold;
};

class PhysicsBody {
public:
    // Value of lastPairPartnerId when no pair has been produced this frame
    static constexpr int NoPartner = -1;

    // Bodies live in entt storage while the spatial grid holds raw pointers to
    // them, so removing one body must not relocate the others.
    static constexpr auto in_place_delete = true;

    /**
     * @param id Unique identifier, used as tie-breaker during pair generation
     * @param mass Mass, not validated (see validateMass)
     * @param shape Geometry, owned by the body
     */
    PhysicsBody(int id, double mass, Shape shape);

    int id() const { return m_id; }

    double mass() const { return m_mass; }
    double invMass() const { return m_invMass; }

    /**
     * @brief Sets mass and inverse mass together
     *
     * Zero or negative masses are stored as given and produce an infinite or
     * negative inverse mass.
     */
    void setMass(double mass);

    /**
     * @brief Opt-in check for masses the solver cannot handle
     * @return false for non-finite or non-positive mass, after reporting it
     */
    static bool validateMass(double mass, const Diagnostics::Sink &sink = {});

    /**
     * @brief Instantaneous velocity change scaled by inverse mass
     *
     * Static bodies ignore it.
     */
    void applyForce(const Vector2 &force);

    /**
     * @brief Advances a dynamic body by dt
     *
     * Runs the sleep check, then (if still awake) linear drag, gravity and
     * the explicit Euler position update. Static bodies are untouched.
     */
    void integrate(double dt, const Vector2 &gravity, const SleepConfig &config = {});

    /**
     * @brief Accumulates or resets idle time and falls asleep past the threshold
     */
    void sleepTick(double dt, const SleepConfig &config = {});

    void wakeUp();
    void putToSleep();

    bool isSleeping() const { return m_sleeping; }
    double idleTime() const { return m_idleTime; }

    Vector2 position;
    Vector2 velocity;

    Shape shape;

    double friction = SimulatorConstants::DefaultFriction;
    double restitution = SimulatorConstants::DefaultRestitution;
    double linearDrag = SimulatorConstants::DefaultLinearDrag;

    bool isStatic = false;
    bool isSensor = false;

    RigidBodyCollision::AABB aabb;

    // Maintained by SpatialGrid::addBody / removeBody only
    bool isInGrid = false;

    // Scratch value for SpatialGrid::generatePairs, reset every broad phase
    int lastPairPartnerId = NoPartner;

private:
    int m_id;
    double m_mass = 0.0;
    double m_invMass = 0.0;

    bool m_sleeping = false;
    double m_idleTime = 0.0;
};

} // namespace Components

#endif // CORE2D_PHYSICS_BODY_HPP
