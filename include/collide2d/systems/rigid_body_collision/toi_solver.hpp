#ifndef COLLIDE2D_TOI_SOLVER_HPP
#define COLLIDE2D_TOI_SOLVER_HPP

#include <entt/entt.hpp>

#include "collide2d/core/settings.hpp"
#include "collide2d/systems/rigid_body_collision/conservative_advancement.hpp"

namespace RigidBodyCollision {

/**
 * @brief Positional correction for a pair stopped at its time of impact
 *
 * Pushes the two bodies along the separation normal until their gap is the
 * linear tolerance, split by inverse mass and inertia. Velocities are left
 * to the next step's contact solver.
 */
class TimeOfImpactSolver {
public:
    /**
     * @brief Corrects body positions in the registry
     *
     * @param body1 Body owning separation.point1
     * @param body2 Body owning separation.point2
     */
    static void solve(entt::registry &registry,
                      entt::entity body1,
                      entt::entity body2,
                      const TimeOfImpact &toi,
                      const Settings &settings);
};

} // namespace RigidBodyCollision

#endif // COLLIDE2D_TOI_SOLVER_HPP
