/**
 * @file settings.hpp
 * @brief Tunables read by every collision stage during a step
 */

#pragma once

#include <cmath>

enum class ContinuousDetectionMode {
    None,         ///< no time-of-impact tests
    BulletsOnly,  ///< bodies tagged Components::Bullet against every other body
    All           ///< bullets against all, other dynamic bodies against static bodies
};

enum class NarrowphaseAlgorithm {
    Sat,
    Gjk  ///< GJK intersection followed by EPA for the penetration
};

/**
 * @struct Settings
 * @brief Holds all collision pipeline parameters.
 *
 * Lengths are in metres, angles in radians, times in seconds.
 */
struct Settings {
    double StepFrequency = 1.0 / 60.0;   ///< step length dt

    double AABBExpansion = 0.2;          ///< broadphase fat AABB margin

    int VelocityIterations = 10;
    int PositionIterations = 10;

    bool WarmStartingEnabled = true;
    double WarmStartDistance = 1.0e-2;   ///< proximity match for distance-id points
    bool BlockSolverEnabled = true;

    double RestitutionVelocity = 1.0;    ///< approach speed required for bounce
    double LinearTolerance = 0.005;      ///< allowed penetration, also the translation a body may make without being swept
    double AngularTolerance = 2.0 * M_PI / 180.0;  ///< rotation a body may make without being swept
    double MaxLinearCorrection = 0.2;
    double MaxAngularCorrection = 8.0 * M_PI / 180.0;  ///< per-contact rotation clamp in the position pass
    double Baumgarte = 0.2;

    double MaxTranslation = 2.0;         ///< per-step position integration clamp
    double MaxRotation = 0.5 * M_PI;

    ContinuousDetectionMode ContinuousMode = ContinuousDetectionMode::BulletsOnly;
    NarrowphaseAlgorithm Narrowphase = NarrowphaseAlgorithm::Sat;

    double getWarmStartDistanceSquared() const { return WarmStartDistance * WarmStartDistance; }

    /**
     * @brief Rejects out-of-range values
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;
};
