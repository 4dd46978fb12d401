/**
 * @file world.hpp
 * @brief Owns the bodies and runs the per-frame collision pipeline
 *
 * Each step(dt) runs, in this order:
 * 1. Broad phase: AABB refresh and grid pair generation
 * 2. Narrow phase: exact tests, contacts, wake-ups, contact signal
 * 3. Static collision resolution (reserved hook, currently empty)
 * 4. Dynamic collision resolution: impulses, then positional correction
 * 5. Integration: drag, gravity, position, sleep bookkeeping
 * 6. Post-step: transient buffers cleared
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "core2d/components/physics_body.hpp"
#include "core2d/core/system_config.hpp"
#include "core2d/math/vector2.hpp"
#include "core2d/systems/rigid_body_collision/collision_data.hpp"
#include "core2d/systems/rigid_body_collision/spatial_grid.hpp"

namespace Simulation {

/**
 * @class World
 * @brief Body arena plus the grid it is simulated on.
 *
 * Bodies are moved into an entt::registry owned by the world and handed back
 * by reference; references stay valid until the body is removed. Iteration
 * always follows insertion order, which pair generation and the friction
 * asymmetry depend on.
 *
 * Not copyable: the grid holds pointers into the world's storage.
 */
class World {
public:
    using ContactSignal = entt::sigh<void(const RigidBodyCollision::Contact &)>;

    explicit World(RigidBodyCollision::SpatialGrid grid, WorldConfig config = {});

    World(const World &) = delete;
    World &operator=(const World &) = delete;

    /**
     * @brief Moves the body into the world
     * @return Reference to the stored body
     * @throws std::invalid_argument if a body with the same id is present
     * @throws std::logic_error if called from inside step()
     */
    Components::PhysicsBody &addBody(Components::PhysicsBody body);

    /**
     * @brief Removes the body from the grid and destroys it
     * @return false if no body has this id
     * @throws std::logic_error if called from inside step()
     */
    bool removeBody(int id);
    bool removeBody(const Components::PhysicsBody &body);

    Components::PhysicsBody *findBody(int id);
    const Components::PhysicsBody *findBody(int id) const;
    bool contains(int id) const;
    std::size_t bodyCount() const { return m_bodies.size(); }

    /** @brief Bodies in insertion order */
    const std::vector<Components::PhysicsBody *> &bodies() const { return m_bodies; }

    template<typename Func>
    void forEachBody(Func func) {
        for (auto *body : m_bodies) {
            func(*body);
        }
    }

    /**
     * @brief Advances the simulation by dt through all six phases
     */
    void step(double dt);

    /**
     * @brief Fires once per contact after the narrow phase, before resolution
     *
     * Listeners must not add or remove bodies.
     */
    entt::sink<ContactSignal> onContact();

    // Transient per-frame buffers; empty outside of step()
    const RigidBodyCollision::PairList &collisionPairs() const { return m_collisionPairs; }
    const RigidBodyCollision::ContactList &contacts() const { return m_contacts; }

    RigidBodyCollision::SpatialGrid &grid() { return m_grid; }
    const RigidBodyCollision::SpatialGrid &grid() const { return m_grid; }

    const WorldConfig &config() const { return m_config; }
    void setConfig(const WorldConfig &config);

    uint64_t stepCount() const { return m_stepCount; }

    // Uniform acceleration applied to every awake dynamic body
    Vector2 gravity;

private:
    void stepBroadPhase(double dt);
    void stepNarrowPhase(double dt);
    void stepResolveStaticCollisions(double dt);
    void stepResolveCollisions(double dt);
    void stepIntegrate(double dt);
    void postStep();

    void ensureNotStepping(const char *operation) const;

    entt::registry m_registry;
    std::unordered_map<int, entt::entity> m_index;
    std::vector<Components::PhysicsBody *> m_bodies;

    RigidBodyCollision::SpatialGrid m_grid;

    RigidBodyCollision::PairList m_collisionPairs;
    RigidBodyCollision::ContactList m_contacts;

    ContactSignal m_contactSignal;
    WorldConfig m_config;

    uint64_t m_stepCount = 0;
    bool m_stepping = false;
};

} // namespace Simulation
