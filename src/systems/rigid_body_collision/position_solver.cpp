/**
 * @file position_solver.cpp
 * @brief Positional correction for residual penetration
 */

#include <algorithm>

#include "core2d/systems/rigid_body_collision/position_solver.hpp"
#include "core2d/components/physics_body.hpp"
#include "core2d/core/profile.hpp"

namespace RigidBodyCollision {

void PositionSolver::positionalSolver(const ContactList &contacts, const SolverConfig &config)
{
    PROFILE_SCOPE("PositionSolver");

    for (const auto &c : contacts) {
        Components::PhysicsBody &A = *c.bodyA;
        Components::PhysicsBody &B = *c.bodyB;

        if (A.isStatic && B.isStatic) {
            continue;
        }

        double const invMassA = A.isStatic ? 0.0 : A.invMass();
        double const invMassB = B.isStatic ? 0.0 : B.invMass();

        double const correction =
            std::max(c.penetration - config.slop, 0.0) / (invMassA + invMassB) * config.baumgarte;
        Vector2 const correctionVector = c.normal * correction;

        // Move A against the normal, B along it
        if (!A.isStatic) {
            A.position -= correctionVector * invMassA;
        }
        if (!B.isStatic) {
            B.position += correctionVector * invMassB;
        }
    }
}

} // namespace RigidBodyCollision
