#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "core2d/core/world.hpp"

using Components::Circle;
using Components::PhysicsBody;
using RigidBodyCollision::Contact;
using RigidBodyCollision::SpatialGrid;
using Simulation::World;

namespace {

struct ContactRecorder {
    std::vector<Contact> contacts;
    std::vector<bool> bodyBSleeping;

    void record(const Contact &contact) {
        contacts.push_back(contact);
        bodyBSleeping.push_back(contact.bodyB->isSleeping());
    }
};

struct BodyRemover {
    World *world;
    int id;

    void remove(const Contact &) { world->removeBody(id); }
};

} // namespace

class WorldTest : public ::testing::Test {
protected:
    // 8x8 cells of size 10, quiet
    World world{SpatialGrid(10.0, 8, 8, Diagnostics::nullSink())};

    static PhysicsBody makeCircle(int id, double x, double y, double radius = 1.0) {
        PhysicsBody body(id, 1.0, Circle(radius));
        body.position = Vector2(x, y);
        return body;
    }
};

TEST_F(WorldTest, AddBodyStoresAndIndexes) {
    PhysicsBody &stored = world.addBody(makeCircle(7, 10.0, 10.0));

    EXPECT_EQ(world.bodyCount(), 1u);
    EXPECT_TRUE(world.contains(7));
    EXPECT_EQ(world.findBody(7), &stored);
    EXPECT_EQ(world.findBody(8), nullptr);
}

TEST_F(WorldTest, DuplicateIdThrows) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    EXPECT_THROW(world.addBody(makeCircle(1, 30.0, 30.0)), std::invalid_argument);
    EXPECT_EQ(world.bodyCount(), 1u);
}

TEST_F(WorldTest, BodiesKeepInsertionOrder) {
    world.addBody(makeCircle(3, 10.0, 10.0));
    world.addBody(makeCircle(1, 20.0, 10.0));
    world.addBody(makeCircle(2, 30.0, 10.0));
    world.removeBody(1);
    world.addBody(makeCircle(4, 40.0, 10.0));

    std::vector<int> ids;
    world.forEachBody([&ids](PhysicsBody &body) { ids.push_back(body.id()); });
    EXPECT_EQ(ids, (std::vector<int>{3, 2, 4}));
}

TEST_F(WorldTest, RemoveBodyEvictsFromGrid) {
    // A sleeper is never traversed, so it stays resident after the step
    world.addBody(makeCircle(1, 10.0, 10.0)).putToSleep();
    world.step(0.016);
    const PhysicsBody *body = world.findBody(1);
    ASSERT_NE(body, nullptr);
    EXPECT_TRUE(world.grid().contains(*body));

    EXPECT_FALSE(world.removeBody(99));
    EXPECT_TRUE(world.removeBody(1));
    EXPECT_FALSE(world.contains(1));
    EXPECT_EQ(world.bodyCount(), 0u);
    for (std::size_t cell = 0; cell < world.grid().cellCount(); ++cell) {
        EXPECT_TRUE(world.grid().partition(cell).empty());
    }
}

TEST_F(WorldTest, RemoveByReferenceOnlyMatchesStoredObject) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    PhysicsBody lookalike = makeCircle(1, 10.0, 10.0);

    EXPECT_FALSE(world.removeBody(lookalike));
    EXPECT_TRUE(world.removeBody(*world.findBody(1)));
}

TEST_F(WorldTest, StaticBodyIsUntouchedByTheSimulation) {
    PhysicsBody ground = makeCircle(1, 20.0, 20.0, 2.0);
    ground.isStatic = true;
    PhysicsBody &staticBody = world.addBody(ground);
    world.addBody(makeCircle(2, 20.0, 25.0));
    world.gravity = Vector2(0.0, -9.8);

    for (int i = 0; i < 200; ++i) {
        world.step(0.016);
    }

    EXPECT_EQ(staticBody.position.x, 20.0);
    EXPECT_EQ(staticBody.position.y, 20.0);
    EXPECT_EQ(staticBody.velocity.x, 0.0);
    EXPECT_EQ(staticBody.velocity.y, 0.0);
    EXPECT_FALSE(staticBody.isSleeping());
    // The falling body did reach it
    EXPECT_LT(world.findBody(2)->position.y, 23.5);
}

TEST_F(WorldTest, ContactSignalReportsGeometry) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    world.addBody(makeCircle(2, 11.5, 10.0));
    ContactRecorder recorder;
    world.onContact().connect<&ContactRecorder::record>(recorder);

    world.step(0.016);

    ASSERT_EQ(recorder.contacts.size(), 1u);
    EXPECT_EQ(recorder.contacts[0].bodyA->id(), 1);
    EXPECT_EQ(recorder.contacts[0].bodyB->id(), 2);
    EXPECT_DOUBLE_EQ(recorder.contacts[0].penetration, 0.5);
    EXPECT_DOUBLE_EQ(recorder.contacts[0].normal.x, 1.0);
    EXPECT_DOUBLE_EQ(recorder.contacts[0].normal.y, 0.0);
}

TEST_F(WorldTest, SleepingBodyIsWokenBeforeListenersRun) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    PhysicsBody &sleeper = world.addBody(makeCircle(2, 11.5, 10.0));
    sleeper.putToSleep();
    ContactRecorder recorder;
    world.onContact().connect<&ContactRecorder::record>(recorder);

    world.step(0.016);

    ASSERT_EQ(recorder.bodyBSleeping.size(), 1u);
    EXPECT_FALSE(recorder.bodyBSleeping[0]);
}

TEST_F(WorldTest, DisconnectedListenerIsNotCalled) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    world.addBody(makeCircle(2, 11.5, 10.0));
    ContactRecorder recorder;
    world.onContact().connect<&ContactRecorder::record>(recorder);
    world.onContact().disconnect<&ContactRecorder::record>(recorder);

    world.step(0.016);

    EXPECT_TRUE(recorder.contacts.empty());
}

TEST_F(WorldTest, TransientBuffersAreClearedAfterStep) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    world.addBody(makeCircle(2, 11.5, 10.0));

    world.step(0.016);
    world.step(0.016);

    EXPECT_TRUE(world.collisionPairs().empty());
    EXPECT_TRUE(world.contacts().empty());
    EXPECT_EQ(world.stepCount(), 2u);
}

TEST_F(WorldTest, MutationFromListenerThrows) {
    world.addBody(makeCircle(1, 10.0, 10.0));
    world.addBody(makeCircle(2, 11.5, 10.0));
    BodyRemover remover{&world, 2};
    world.onContact().connect<&BodyRemover::remove>(remover);

    EXPECT_THROW(world.step(0.016), std::logic_error);
    EXPECT_TRUE(world.contacts().empty());
    EXPECT_EQ(world.stepCount(), 0u);

    world.onContact().disconnect<&BodyRemover::remove>(remover);
    EXPECT_TRUE(world.removeBody(2));
    world.step(0.016);
    EXPECT_EQ(world.stepCount(), 1u);
}

TEST_F(WorldTest, ConfigIsForwardedToBodies) {
    Simulation::WorldConfig config;
    config.sleep.timeThreshold = 0.05;
    world.setConfig(config);
    PhysicsBody &body = world.addBody(makeCircle(1, 10.0, 10.0));

    for (int i = 0; i < 5; ++i) {
        world.step(0.016);
    }

    EXPECT_TRUE(body.isSleeping());
    EXPECT_DOUBLE_EQ(world.config().sleep.timeThreshold, 0.05);
}

TEST(WorldScenarioTest, BallComesToRestOnStaticGround) {
    World world{SpatialGrid(4.0, 8, 8, Diagnostics::nullSink())};
    world.gravity = Vector2(0.0, -9.8);

    PhysicsBody ground(1, 1.0, Circle(1.0));
    ground.isStatic = true;
    world.addBody(ground);

    PhysicsBody ball(2, 1.0, Circle(1.0));
    ball.position = Vector2(0.0, 10.0);
    PhysicsBody &stored = world.addBody(ball);

    for (int i = 0; i < 650; ++i) {
        world.step(0.016);
    }
    Vector2 const settled = stored.position;
    for (int i = 0; i < 50; ++i) {
        world.step(0.016);
    }

    double const penetration = 2.0 - stored.position.y;
    EXPECT_GE(penetration, -1e-9);
    EXPECT_LE(penetration, 0.011);
    EXPECT_NEAR(stored.position.x, 0.0, 1e-12);
    EXPECT_TRUE(stored.isSleeping());
    EXPECT_DOUBLE_EQ(stored.position.y, settled.y);
}
