/**
 * @file contact_solver.cpp
 * @brief Normal and friction impulses, one sequential pass over the contacts
 */

#include <algorithm>
#include <cmath>

#include "core2d/systems/rigid_body_collision/contact_solver.hpp"
#include "core2d/components/physics_body.hpp"
#include "core2d/core/profile.hpp"

namespace RigidBodyCollision
{

namespace {

void snapRestingComponents(Vector2 &v, double threshold) {
    if (std::fabs(v.x) < threshold) {
        v.x = 0.0;
    }
    if (std::fabs(v.y) < threshold) {
        v.y = 0.0;
    }
}

} // namespace

void ContactSolver::solveContactConstraints(const ContactList &contacts,
                                            const SolverConfig &config)
{
    PROFILE_SCOPE("ContactSolver");

    for (const auto &c : contacts) {
        Components::PhysicsBody &A = *c.bodyA;
        Components::PhysicsBody &B = *c.bodyB;

        if (A.isStatic && B.isStatic) {
            continue;
        }

        double const invMassA = A.isStatic ? 0.0 : A.invMass();
        double const invMassB = B.isStatic ? 0.0 : B.invMass();

        Vector2 const rv = B.velocity - A.velocity;
        double const velAlongNormal = rv.dot(c.normal);

        // Separating or at rest along the normal
        if (velAlongNormal >= 0) {
            continue;
        }

        double const e = std::min(A.restitution, B.restitution);

        double j = -(1 + e) * velAlongNormal;
        j /= invMassA + invMassB;

        Vector2 const impulse = c.normal * j;
        if (!A.isStatic) {
            A.velocity -= impulse * invMassA;
        }
        if (!B.isStatic) {
            B.velocity += impulse * invMassB;
        }

        // Friction, from the pre-impulse relative velocity
        Vector2 tangent = rv - c.normal * velAlongNormal;
        tangent.normalize();

        double jt = -rv.dot(tangent);
        jt /= invMassA + invMassB;

        // NaN (head-on hit, zero tangent) fails this test too
        if (!(std::fabs(jt) > config.restingSpeedThreshold)) {
            continue;
        }

        // Coulomb clamp against A's coefficient
        Vector2 tangentImpulse;
        if (std::fabs(jt) < j * A.friction) {
            tangentImpulse = tangent * jt;
        } else {
            tangentImpulse = tangent * (-j * A.friction);
        }

        if (!A.isStatic) {
            A.velocity -= tangentImpulse * invMassA;
            snapRestingComponents(A.velocity, config.restingSpeedThreshold);
        }
        if (!B.isStatic) {
            B.velocity += tangentImpulse * invMassB;
            snapRestingComponents(B.velocity, config.restingSpeedThreshold);
        }
    }
}

} // namespace RigidBodyCollision
