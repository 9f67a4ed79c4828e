/**
 * @file interval.hpp
 * @brief Closed 1D interval, the projection of a shape onto an axis
 */

#ifndef COLLIDE2D_INTERVAL_HPP
#define COLLIDE2D_INTERVAL_HPP

#include <algorithm>

struct Interval {
    double min;
    double max;

    Interval() : min(0.0), max(0.0) {}
    Interval(double min, double max) : min(min), max(max) {}

    bool overlaps(const Interval& other) const {
        return !(min > other.max || other.min > max);
    }

    /** @brief Length of the shared range, 0 when disjoint */
    double getOverlap(const Interval& other) const {
        if (!overlaps(other)) {
            return 0.0;
        }
        return std::min(max, other.max) - std::max(min, other.min);
    }

    /** @brief Strict containment of other inside this */
    bool containsExclusive(const Interval& other) const {
        return other.min > min && other.max < max;
    }

    double getLength() const { return max - min; }
};

#endif
