#ifndef COLLIDE2D_EPA_HPP
#define COLLIDE2D_EPA_HPP

#include <optional>
#include "collide2d/algo/collision_results.hpp"
#include "collide2d/algo/gjk.hpp"

constexpr int EPA_DEFAULT_MAX_ITERATIONS = 100;

/**
 * @brief Expanding Polytope Algorithm
 *
 * Grows the GJK terminating triangle toward the boundary of A - B until the
 * closest edge stops moving; that edge gives the penetration normal (A toward
 * B) and depth.
 *
 * If the iterations run out first, the closest edge of the last expansion is
 * returned, with the support distance along its normal as depth.
 *
 * @return std::nullopt for a degenerate simplex or when no iteration ran
 *         (a warning is printed)
 * @throws std::invalid_argument if either shape is null
 */
std::optional<Penetration> EPA(const Geometry::Shape* a, const Transform& ta,
                               const Geometry::Shape* b, const Transform& tb,
                               const Simplex& simplex,
                               int maxIterations = EPA_DEFAULT_MAX_ITERATIONS);

#endif
