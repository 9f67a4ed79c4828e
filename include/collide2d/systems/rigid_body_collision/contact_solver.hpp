/**
 * @file contact_solver.hpp
 * @brief Sequential impulse solver for the contacts of one island
 *
 * Resolves contact constraints in two phases. The velocity phase applies
 * normal and friction impulses (warm started from the previous step) so that
 * touching bodies stop approaching. After positions are integrated, the
 * position phase pushes remaining overlap apart with Baumgarte-scaled
 * pseudo impulses.
 *
 * Body state is copied from the registry into flat arrays once per island,
 * solved in place and written back at the end.
 */

#ifndef COLLIDE2D_CONTACT_SOLVER_HPP
#define COLLIDE2D_CONTACT_SOLVER_HPP

#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "collide2d/core/settings.hpp"
#include "collide2d/math/transform.hpp"
#include "collide2d/systems/rigid_body_collision/contact_constraint.hpp"
#include "collide2d/systems/rigid_body_collision/island.hpp"

namespace RigidBodyCollision {

/**
 * @brief Solver copy of one body's state
 */
struct SolverBody {
    entt::entity entity = entt::null;
    Transform transform;
    Vector velocity;
    double angularVelocity = 0.0;
    double invMass = 0.0;
    double invInertia = 0.0;
    bool dynamic = false;
};

class ContactSolver {
public:
    /**
     * @brief Loads the island's bodies and prepares every constraint
     *
     * Computes contact offsets, effective masses, restitution bias and, for
     * two-point manifolds, the block matrix. Constraints are referenced, not
     * copied: solved impulses land in the caller's list.
     */
    void initialize(const entt::registry& registry, const Island& island,
                    std::vector<ContactConstraint>& constraints, const Settings& settings);

    /** @brief Applies last step's impulses, or zeroes them when warm starting is off */
    void warmStart();

    /** @brief One Gauss-Seidel pass over all velocity constraints */
    void solveVelocityConstraints();

    /** @brief Advances dynamic bodies by one step of their velocity */
    void integratePositions();

    /**
     * @brief One pass of positional correction
     * @return true when every contact is within three linear tolerances
     */
    bool solvePositionConstraints();

    /** @brief Writes positions, angles and velocities back to the registry */
    void store(entt::registry& registry) const;

    /**
     * @brief Runs the full island solve with the configured iteration counts
     */
    void solve(entt::registry& registry, const Island& island,
               std::vector<ContactConstraint>& constraints, const Settings& settings);

    const std::vector<SolverBody>& getBodies() const { return m_bodies; }

private:
    void solveNormal(ContactConstraint& cc, SolverBody& b1, SolverBody& b2);
    void solveNormalBlock(ContactConstraint& cc, SolverBody& b1, SolverBody& b2);
    void solveTangent(ContactConstraint& cc, SolverBody& b1, SolverBody& b2);

    Settings m_settings;
    std::vector<SolverBody> m_bodies;
    std::vector<ContactConstraint*> m_constraints;
    std::vector<std::pair<int, int>> m_bodyIndices;  ///< per constraint
};

} // namespace RigidBodyCollision

#endif
