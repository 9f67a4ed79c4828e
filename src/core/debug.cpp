#include "collide2d/core/debug.hpp"

// Initialize static members
std::size_t CollisionStats::candidate_pairs = 0;
std::size_t CollisionStats::manifolds = 0;
std::size_t CollisionStats::contact_points = 0;
std::size_t CollisionStats::islands = 0;
std::size_t CollisionStats::toi_events = 0;
double CollisionStats::max_penetration = 0.0;
