/**
 * @file narrowphase.cpp
 * @brief Shape-pair dispatch and the circle-circle test
 */

#include <cmath>
#include <variant>

#include "core2d/systems/rigid_body_collision/narrowphase.hpp"
#include "core2d/components/physics_body.hpp"
#include "core2d/core/profile.hpp"

namespace RigidBodyCollision {

namespace {

/**
 * @brief One overload per supported shape pair.
 *
 * No catch-all: std::visit fails to compile for an unhandled combination.
 */
struct ShapePairTest {
    const Pair &pair;

    std::optional<Contact> operator()(const Components::Circle &circleA,
                                      const Components::Circle &circleB) const
    {
        const Vector2 &posA = pair.bodyA->position;
        const Vector2 &posB = pair.bodyB->position;

        double const distance = posA.dist(posB);
        double const radii = circleA.radius + circleB.radius;
        if (!(distance < radii)) {
            return std::nullopt;
        }

        Vector2 normal = posB - posA;
        normal.normalize();

        Contact contact;
        contact.bodyA = pair.bodyA;
        contact.bodyB = pair.bodyB;
        contact.normal = normal;
        contact.penetration = radii - distance;
        contact.point = posA + normal * circleA.radius;
        return contact;
    }
};

} // namespace

bool circleToCircle(double radiusA, const Vector2 &posA, double radiusB, const Vector2 &posB) {
    return posA.dist(posB) < radiusA + radiusB;
}

std::optional<Contact> collide(const Pair &pair) {
    return std::visit(ShapePairTest{pair}, pair.bodyA->shape, pair.bodyB->shape);
}

ContactList narrowPhase(const PairList &pairs) {
    PROFILE_SCOPE("Narrowphase");

    ContactList contacts;
    for (const auto &pair : pairs) {
        auto contact = collide(pair);
        if (!contact) {
            continue;
        }
        contacts.push_back(*contact);

        pair.bodyA->wakeUp();
        pair.bodyB->wakeUp();
    }
    return contacts;
}

} // namespace RigidBodyCollision
