#ifndef CORE2D_POSITION_SOLVER_HPP
#define CORE2D_POSITION_SOLVER_HPP

#include "core2d/systems/rigid_body_collision/collision_data.hpp"
#include "core2d/systems/rigid_body_collision/solver_config.hpp"

namespace RigidBodyCollision {

/**
 * @brief Pushes overlapping bodies apart (Baumgarte style), one pass per frame.
 */
class PositionSolver {
public:
    /**
     * @brief Moves each contact's dynamic bodies along the normal by
     *        max(penetration - slop, 0) * baumgarte, split by inverse mass.
     *
     * Runs for every contact regardless of relative velocity.
     */
    static void positionalSolver(const ContactList &contacts,
                                 const SolverConfig &config = {});
};

} // namespace RigidBodyCollision

#endif // CORE2D_POSITION_SOLVER_HPP
