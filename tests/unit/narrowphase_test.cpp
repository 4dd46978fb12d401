#include <gtest/gtest.h>
#include <cmath>

#include "core2d/components/physics_body.hpp"
#include "core2d/systems/rigid_body_collision/narrowphase.hpp"

using Components::Circle;
using Components::PhysicsBody;
using namespace RigidBodyCollision;

namespace {

PhysicsBody circleAt(int id, double x, double y, double radius = 1.0) {
    PhysicsBody body(id, 1.0, Circle(radius));
    body.position = Vector2(x, y);
    return body;
}

} // namespace

TEST(NarrowPhaseTest, ShapeNames) {
    Components::Shape shape = Circle(2.0);
    EXPECT_STREQ(Components::shapeName(shape), "Circle");
}

TEST(NarrowPhaseTest, CircleToCircleOverlap) {
    EXPECT_TRUE(circleToCircle(1.0, Vector2(0.0, 0.0), 1.0, Vector2(1.5, 0.0)));
    EXPECT_FALSE(circleToCircle(1.0, Vector2(0.0, 0.0), 1.0, Vector2(3.0, 0.0)));
    // Touching is not overlapping
    EXPECT_FALSE(circleToCircle(1.0, Vector2(0.0, 0.0), 1.0, Vector2(2.0, 0.0)));
}

TEST(NarrowPhaseTest, OverlappingCirclesProduceContact) {
    PhysicsBody a = circleAt(1, 0.0, 0.0);
    PhysicsBody b = circleAt(2, 1.5, 0.0);

    auto contact = collide({&a, &b});

    ASSERT_TRUE(contact.has_value());
    EXPECT_EQ(contact->bodyA, &a);
    EXPECT_EQ(contact->bodyB, &b);
    EXPECT_DOUBLE_EQ(contact->penetration, 0.5);
    EXPECT_DOUBLE_EQ(contact->normal.x, 1.0);
    EXPECT_DOUBLE_EQ(contact->normal.y, 0.0);
    EXPECT_DOUBLE_EQ(contact->point.x, 1.0);
    EXPECT_DOUBLE_EQ(contact->point.y, 0.0);
}

TEST(NarrowPhaseTest, NormalPointsFromAToB) {
    PhysicsBody a = circleAt(1, 4.0, 4.0, 2.0);
    PhysicsBody b = circleAt(2, 4.0, 1.0, 2.0);

    auto contact = collide({&a, &b});

    ASSERT_TRUE(contact.has_value());
    EXPECT_DOUBLE_EQ(contact->normal.x, 0.0);
    EXPECT_DOUBLE_EQ(contact->normal.y, -1.0);
    EXPECT_DOUBLE_EQ(contact->penetration, 1.0);
    // On A's surface along the normal
    EXPECT_DOUBLE_EQ(contact->point.x, 4.0);
    EXPECT_DOUBLE_EQ(contact->point.y, 2.0);
}

TEST(NarrowPhaseTest, SeparatedCirclesProduceNothing) {
    PhysicsBody a = circleAt(1, 0.0, 0.0);
    PhysicsBody b = circleAt(2, 3.0, 0.0);

    EXPECT_FALSE(collide({&a, &b}).has_value());
    EXPECT_TRUE(narrowPhase({{&a, &b}}).empty());
}

TEST(NarrowPhaseTest, CoincidentCentresGiveNonFiniteNormal) {
    PhysicsBody a = circleAt(1, 2.0, 2.0);
    PhysicsBody b = circleAt(2, 2.0, 2.0);

    auto contact = collide({&a, &b});

    ASSERT_TRUE(contact.has_value());
    EXPECT_DOUBLE_EQ(contact->penetration, 2.0);
    EXPECT_TRUE(std::isnan(contact->normal.x));
    EXPECT_TRUE(std::isnan(contact->normal.y));
}

TEST(NarrowPhaseTest, ContactWakesBothBodies) {
    PhysicsBody a = circleAt(1, 0.0, 0.0);
    PhysicsBody b = circleAt(2, 1.5, 0.0);
    PhysicsBody far = circleAt(3, 10.0, 0.0);
    a.putToSleep();
    b.putToSleep();
    far.putToSleep();

    auto contacts = narrowPhase({{&a, &b}, {&a, &far}});

    ASSERT_EQ(contacts.size(), 1u);
    EXPECT_FALSE(a.isSleeping());
    EXPECT_FALSE(b.isSleeping());
    // A failed test leaves the body alone
    EXPECT_TRUE(far.isSleeping());
}

TEST(NarrowPhaseTest, DuplicatePairsYieldDuplicateContacts) {
    PhysicsBody a = circleAt(1, 0.0, 0.0);
    PhysicsBody b = circleAt(2, 1.5, 0.0);

    auto contacts = narrowPhase({{&a, &b}, {&a, &b}});
    EXPECT_EQ(contacts.size(), 2u);
}
