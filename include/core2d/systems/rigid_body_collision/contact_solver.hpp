/**
 * @file contact_solver.hpp
 * @brief Single-pass sequential impulse solver
 *
 * For every approaching contact: a restitution impulse along the normal,
 * then a Coulomb-clamped friction impulse along the tangent. Static bodies
 * take part with zero inverse mass and are never written to.
 */

#ifndef CORE2D_CONTACT_SOLVER_HPP
#define CORE2D_CONTACT_SOLVER_HPP

#include "core2d/systems/rigid_body_collision/collision_data.hpp"
#include "core2d/systems/rigid_body_collision/solver_config.hpp"

namespace RigidBodyCollision {

class ContactSolver {
public:
    /**
     * @brief Applies normal and friction impulses for each contact in order
     *
     * Contacts whose bodies are separating (or at rest) along the normal are
     * skipped, as are contacts between two static bodies. The friction
     * clamp uses body A's coefficient only.
     */
    static void solveContactConstraints(const ContactList &contacts,
                                        const SolverConfig &config = {});
};

} // namespace RigidBodyCollision

#endif
