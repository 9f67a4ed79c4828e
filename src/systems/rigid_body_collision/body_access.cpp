#include "collide2d/systems/rigid_body_collision/body_access.hpp"

#include <algorithm>

namespace RigidBodyCollision {

Transform getTransform(const entt::registry& registry, entt::entity body) {
  Vector translation;
  if (const auto* pos = registry.try_get<Components::Position>(body)) {
    translation = Vector(*pos);
  }
  double angle = 0.0;
  if (const auto* ang = registry.try_get<Components::AngularPosition>(body)) {
    angle = ang->angle;
  }
  return {translation, angle};
}

void setTransform(entt::registry& registry, entt::entity body, const Transform& transform) {
  registry.emplace_or_replace<Components::Position>(body, Position(transform.getTranslation()));
  registry.emplace_or_replace<Components::AngularPosition>(body, Components::AngularPosition{transform.getAngle()});
}

bool isStatic(const entt::registry& registry, entt::entity body) {
  if (registry.all_of<Components::Boundary>(body)) {
    return true;
  }
  const auto* mass = registry.try_get<Components::Mass>(body);
  return mass == nullptr || mass->value <= 0.0 || mass->value > Components::INFINITE_MASS_THRESHOLD;
}

double getInverseMass(const entt::registry& registry, entt::entity body) {
  if (isStatic(registry, body)) {
    return 0.0;
  }
  return 1.0 / registry.get<Components::Mass>(body).value;
}

double getInverseInertia(const entt::registry& registry, entt::entity body) {
  if (isStatic(registry, body)) {
    return 0.0;
  }
  const auto* inertia = registry.try_get<Components::Inertia>(body);
  if (inertia == nullptr || inertia->I <= 0.0 || inertia->I > Components::INFINITE_MASS_THRESHOLD) {
    return 0.0;
  }
  return 1.0 / inertia->I;
}

const Components::Fixture* getFixture(const entt::registry& registry, const FixtureKey& key) {
  if (!registry.valid(key.body)) {
    return nullptr;
  }
  const auto* collider = registry.try_get<Components::Collider>(key.body);
  if (collider == nullptr || key.fixture >= collider->fixtures.size()) {
    return nullptr;
  }
  return &collider->fixtures[key.fixture];
}

} // namespace RigidBodyCollision
