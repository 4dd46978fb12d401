/**
 * @file world.cpp
 * @brief Implementation of World and its step pipeline.
 */

#include "core2d/core/world.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "core2d/core/debug.hpp"
#include "core2d/core/profile.hpp"
#include "core2d/systems/rigid_body_collision/broadphase.hpp"
#include "core2d/systems/rigid_body_collision/contact_solver.hpp"
#include "core2d/systems/rigid_body_collision/narrowphase.hpp"
#include "core2d/systems/rigid_body_collision/position_solver.hpp"

namespace Simulation {

namespace {

// Clears the stepping flag even if a contact listener throws
class SteppingGuard {
public:
    explicit SteppingGuard(bool &flag) : m_flag(flag) { m_flag = true; }
    ~SteppingGuard() { m_flag = false; }

    SteppingGuard(const SteppingGuard &) = delete;
    SteppingGuard &operator=(const SteppingGuard &) = delete;

private:
    bool &m_flag;
};

} // namespace

World::World(RigidBodyCollision::SpatialGrid grid, WorldConfig config)
    : m_grid(std::move(grid))
    , m_config(config)
{
}

Components::PhysicsBody &World::addBody(Components::PhysicsBody body) {
    ensureNotStepping("addBody");

    int const id = body.id();
    if (m_index.count(id) != 0) {
        throw std::invalid_argument("World::addBody: duplicate body id " + std::to_string(id));
    }

    auto const entity = m_registry.create();
    auto &stored = m_registry.emplace<Components::PhysicsBody>(entity, std::move(body));
    m_index.emplace(id, entity);
    m_bodies.push_back(&stored);
    return stored;
}

bool World::removeBody(int id) {
    ensureNotStepping("removeBody");

    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }

    auto &body = m_registry.get<Components::PhysicsBody>(it->second);
    m_grid.evictBody(body);
    m_bodies.erase(std::find(m_bodies.begin(), m_bodies.end(), &body));

    m_registry.destroy(it->second);
    m_index.erase(it);
    return true;
}

bool World::removeBody(const Components::PhysicsBody &body) {
    // Only remove the exact object we own, not another body sharing its id
    const auto *stored = findBody(body.id());
    if (stored != &body) {
        return false;
    }
    return removeBody(body.id());
}

Components::PhysicsBody *World::findBody(int id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_registry.get<Components::PhysicsBody>(it->second);
}

const Components::PhysicsBody *World::findBody(int id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_registry.get<Components::PhysicsBody>(it->second);
}

bool World::contains(int id) const {
    return m_index.count(id) != 0;
}

entt::sink<World::ContactSignal> World::onContact() {
    return entt::sink<ContactSignal>{m_contactSignal};
}

void World::setConfig(const WorldConfig &config) {
    m_config = config;
}

void World::step(double dt) {
    PROFILE_SCOPE("World::step");
    SteppingGuard guard(m_stepping);

    try {
        stepBroadPhase(dt);
        stepNarrowPhase(dt);
        stepResolveStaticCollisions(dt);
        stepResolveCollisions(dt);
        stepIntegrate(dt);
    } catch (...) {
        // A throwing listener must not leave stale contacts behind
        postStep();
        throw;
    }
    postStep();

    ++m_stepCount;
}

void World::stepBroadPhase(double /*dt*/) {
    m_collisionPairs = RigidBodyCollision::broadPhase(m_grid, m_bodies);

    CORE2D_DEBUG(CORE2D_DEBUG_LEVEL_VERBOSE,
                 "[World] step " << m_stepCount << ": " << m_collisionPairs.size()
                                 << " candidate pairs\n");
}

void World::stepNarrowPhase(double /*dt*/) {
    m_contacts = RigidBodyCollision::narrowPhase(m_collisionPairs);

    CORE2D_DEBUG(CORE2D_DEBUG_LEVEL_VERBOSE,
                 "[World] step " << m_stepCount << ": " << m_contacts.size() << " contacts\n");

    for (const auto &contact : m_contacts) {
        m_contactSignal.publish(contact);
    }
}

// Reserved for shape-specific handling of static geometry
void World::stepResolveStaticCollisions(double /*dt*/) {}

void World::stepResolveCollisions(double /*dt*/) {
    PROFILE_SCOPE("World::resolveCollisions");
    RigidBodyCollision::ContactSolver::solveContactConstraints(m_contacts, m_config.solver);
    RigidBodyCollision::PositionSolver::positionalSolver(m_contacts, m_config.solver);
}

void World::stepIntegrate(double dt) {
    PROFILE_SCOPE("World::integrate");
    for (auto *body : m_bodies) {
        body->integrate(dt, gravity, m_config.sleep);
    }
}

void World::postStep() {
    m_collisionPairs.clear();
    m_contacts.clear();
}

void World::ensureNotStepping(const char *operation) const {
    if (m_stepping) {
        throw std::logic_error(std::string("World::") + operation + " called during step()");
    }
}

} // namespace Simulation
