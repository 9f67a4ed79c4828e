#ifndef COLLIDE2D_COMPONENTS_BASIC_HPP
#define COLLIDE2D_COMPONENTS_BASIC_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "collide2d/geometry/shape.hpp"
#include "collide2d/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Masses above this are treated as immovable
    constexpr double INFINITE_MASS_THRESHOLD = 1e29;

    struct Mass {
        double value;
    };

    // Angular components
    struct AngularPosition {
        double angle; // radians
    };

    struct AngularVelocity {
        double omega; // radians per second
    };

    struct Inertia {
        double I; // moment of inertia about the body origin
    };

    // Tag: body never moves regardless of mass
    struct Boundary {};

    // Tag: fast body tested with continuous collision against every other body
    struct Bullet {};

    // One convex piece of a body's collision geometry
    struct Fixture {
        std::shared_ptr<const Geometry::Shape> shape;
        double friction = 0.2;
        double restitution = 0.0;
        bool sensor = false;
        uint32_t category = 0x0001;
        uint32_t mask = 0xFFFFFFFF;
    };

    struct Collider {
        std::vector<Fixture> fixtures;
    };

} // namespace Components

#endif
