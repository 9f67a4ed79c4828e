#include "collide2d/systems/rigid_body_collision/contact_constraint.hpp"

#include <algorithm>

namespace RigidBodyCollision {

ContactConstraint::ContactConstraint(const Collision& collision, const Transform& t1, const Transform& t2,
                                     double friction, double restitution, bool sensor)
    : fixture1(collision.a),
      fixture2(collision.b),
      normal(collision.manifold.normal),
      tangent(collision.manifold.normal.rightPerp()),
      friction(friction),
      restitution(restitution),
      sensor(sensor)
{
  contacts.reserve(collision.manifold.points.size());
  for (const auto& mp : collision.manifold.points) {
    Contact c;
    c.id = mp.id;
    c.p = mp.point;
    c.depth = mp.depth;
    c.p1 = t1.inverse(mp.point);
    c.p2 = t2.inverse(mp.point);
    contacts.push_back(c);
  }
}

bool ContactConstraint::hasEnabledContact() const {
  return std::any_of(contacts.begin(), contacts.end(), [](const Contact& c) { return c.enabled; });
}

} // namespace RigidBodyCollision
