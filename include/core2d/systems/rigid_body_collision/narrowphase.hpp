/**
 * @file narrowphase.hpp
 * @brief Exact intersection tests on broad-phase candidates
 *
 * Dispatches on the concrete shape pair. Circle against circle is the only
 * supported combination; a new shape variant needs an overload here before
 * the project compiles again.
 */

#ifndef CORE2D_COLLISION_NARROWPHASE_HPP
#define CORE2D_COLLISION_NARROWPHASE_HPP

#include <optional>

#include "core2d/components/shape.hpp"
#include "core2d/systems/rigid_body_collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief True if two circles overlap (touching does not count)
 */
bool circleToCircle(double radiusA, const Vector2 &posA, double radiusB, const Vector2 &posB);

/**
 * @brief Contact between the two bodies of a pair, if their shapes intersect
 *
 * The normal points from A to B. Does not touch the bodies' sleep state.
 */
std::optional<Contact> collide(const Pair &pair);

/**
 * @brief Tests every pair and wakes both bodies of each detected contact
 *
 * @param pairs Candidate pairs from the broad phase
 * @return Contacts in pair order
 */
ContactList narrowPhase(const PairList &pairs);

} // namespace RigidBodyCollision

#endif // CORE2D_COLLISION_NARROWPHASE_HPP
