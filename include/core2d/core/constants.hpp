#ifndef CORE2D_CONSTANTS_HPP
#define CORE2D_CONSTANTS_HPP

namespace SimulatorConstants {

    // Squared speed below which a body counts as idle
    constexpr double SleepVelocityThreshold = 0.01;
    // Idle time (simulation time units) after which a body falls asleep
    constexpr double SleepTimeThreshold = 1.0;

    // Penetration tolerated before positional correction kicks in
    constexpr double PenetrationSlop = 0.01;
    // Fraction of the remaining penetration corrected per frame
    constexpr double BaumgarteFactor = 0.2;
    // Friction impulses and velocity components below this are dropped
    constexpr double RestingSpeedThreshold = 0.01;

    // Material defaults for new bodies
    constexpr double DefaultFriction = 0.1;
    constexpr double DefaultRestitution = 0.5;
    constexpr double DefaultLinearDrag = 0.1;

}

#endif // CORE2D_CONSTANTS_HPP
