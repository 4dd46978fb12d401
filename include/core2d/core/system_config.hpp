#pragma once

#include "core2d/components/physics_body.hpp"
#include "core2d/systems/rigid_body_collision/solver_config.hpp"

namespace Simulation {

/**
 * @struct WorldConfig
 * @brief Tuning shared by every phase of World::step.
 *
 * Defaults reproduce the built-in constants. No field reorders or disables
 * a phase.
 */
struct WorldConfig {
    Components::SleepConfig sleep;
    RigidBodyCollision::SolverConfig solver;
};

} // namespace Simulation
