#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable (CMake: COLLIDE2D_ENABLE_DEBUG)
#ifndef ENABLE_DEBUG
#define ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-step counters for the collision pipeline
class CollisionStats {
public:
    static void reset() {
        candidate_pairs = 0;
        manifolds = 0;
        contact_points = 0;
        islands = 0;
        toi_events = 0;
        max_penetration = 0.0;
    }

    static void countPairs(std::size_t n) { candidate_pairs += n; }

    static void countManifold(std::size_t points, double depth) {
        manifolds++;
        contact_points += points;
        max_penetration = std::max(max_penetration, depth);
    }

    static void countIslands(std::size_t n) { islands += n; }
    static void countTimeOfImpact() { toi_events++; }

    static std::size_t getCandidatePairs() { return candidate_pairs; }
    static std::size_t getManifolds() { return manifolds; }
    static std::size_t getContactPoints() { return contact_points; }
    static std::size_t getIslands() { return islands; }
    static std::size_t getTimeOfImpactEvents() { return toi_events; }
    static double getMaxPenetration() { return max_penetration; }

    static void print() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Collision stats:\n"
            "  Candidate pairs: " << candidate_pairs << "\n"
            "  Manifolds: " << manifolds << " (" << contact_points << " points)\n"
            "  Islands: " << islands << "\n"
            "  TOI events: " << toi_events << "\n"
            "  Max penetration: " << max_penetration << " m\n"
        );
    }

private:
    static std::size_t candidate_pairs;
    static std::size_t manifolds;
    static std::size_t contact_points;
    static std::size_t islands;
    static std::size_t toi_events;
    static double max_penetration;
};
