#ifndef CORE2D_COLLISION_DATA_HPP
#define CORE2D_COLLISION_DATA_HPP

#include <vector>

#include "core2d/math/vector2.hpp"

namespace Components {
class PhysicsBody;
}

namespace RigidBodyCollision {

// Axis-aligned bounding box, recomputed every broad phase from a body's shape
struct AABB {
    Vector2 min;
    Vector2 max;
};

// Candidate produced by the broad phase, may never become a Contact
struct Pair {
    Components::PhysicsBody *bodyA;
    Components::PhysicsBody *bodyB;
};

// Produced by the narrow phase, consumed by the solvers, dropped at post-step
struct Contact {
    Components::PhysicsBody *bodyA;
    Components::PhysicsBody *bodyB;
    Vector2 normal;      ///< Unit vector from A to B
    double penetration;  ///< Overlap depth, >= 0
    Vector2 point;       ///< On A's surface along the normal
};

using PairList = std::vector<Pair>;
using ContactList = std::vector<Contact>;

} // namespace RigidBodyCollision

#endif
