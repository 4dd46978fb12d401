/**
 * @file broadphase.hpp
 * @brief Broad-phase collision detection on top of the uniform grid
 *
 * Refreshes every body's AABB from its shape and position, then asks the
 * spatial grid for candidate pairs.
 */

#ifndef CORE2D_COLLISION_BROADPHASE_HPP
#define CORE2D_COLLISION_BROADPHASE_HPP

#include <vector>

#include "core2d/components/physics_body.hpp"
#include "core2d/systems/rigid_body_collision/collision_data.hpp"
#include "core2d/systems/rigid_body_collision/spatial_grid.hpp"

namespace RigidBodyCollision {

/**
 * @brief World-space bounding box of a shape placed at position
 */
AABB computeAABB(const Components::Shape &shape, const Vector2 &position);

/**
 * @brief Overwrites body.aabb from its shape and current position
 */
void updateAABB(Components::PhysicsBody &body);

/**
 * @brief Refreshes all AABBs and generates this frame's candidate pairs
 *
 * @param grid Grid that owns the partitions, mutated by pair generation
 * @param bodies Bodies in insertion order
 * @return Candidate pairs, possibly with duplicates
 */
PairList broadPhase(SpatialGrid &grid, const std::vector<Components::PhysicsBody *> &bodies);

} // namespace RigidBodyCollision

#endif // CORE2D_COLLISION_BROADPHASE_HPP
