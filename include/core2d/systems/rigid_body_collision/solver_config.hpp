#ifndef CORE2D_SOLVER_CONFIG_HPP
#define CORE2D_SOLVER_CONFIG_HPP

#include "core2d/core/constants.hpp"

namespace RigidBodyCollision {

/**
 * @struct SolverConfig
 * @brief Tuning of the contact and position solvers
 */
struct SolverConfig {
    // Friction impulses at or below this magnitude are skipped; after a
    // friction impulse, velocity components below it are snapped to zero
    double restingSpeedThreshold = SimulatorConstants::RestingSpeedThreshold;

    // Fraction of the penetration (beyond slop) removed per frame
    double baumgarte = SimulatorConstants::BaumgarteFactor;

    // Penetration left alone by the position solver
    double slop = SimulatorConstants::PenetrationSlop;
};

} // namespace RigidBodyCollision

#endif
