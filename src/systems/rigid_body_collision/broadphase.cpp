/**
 * @file broadphase.cpp
 * @brief AABB refresh and grid-backed pair generation
 */

#include <variant>

#include "core2d/systems/rigid_body_collision/broadphase.hpp"
#include "core2d/core/profile.hpp"

namespace RigidBodyCollision
{

namespace {

AABB shapeAABB(const Components::Circle &circle, const Vector2 &pos) {
    return {
        {pos.x - circle.radius, pos.y - circle.radius},
        {pos.x + circle.radius, pos.y + circle.radius}
    };
}

} // namespace

AABB computeAABB(const Components::Shape &shape, const Vector2 &position) {
    return std::visit([&](const auto &s) { return shapeAABB(s, position); }, shape);
}

void updateAABB(Components::PhysicsBody &body) {
    body.aabb = computeAABB(body.shape, body.position);
}

PairList broadPhase(SpatialGrid &grid, const std::vector<Components::PhysicsBody *> &bodies)
{
    PROFILE_SCOPE("Broadphase");

    for (auto *body : bodies) {
        updateAABB(*body);
    }

    return grid.generatePairs(bodies);
}

} // namespace RigidBodyCollision
