/**
 * @file broadphase.cpp
 * @brief Fixture bookkeeping on top of the dynamic AABB tree
 */

#include <stdexcept>
#include <vector>

#include "collide2d/systems/rigid_body_collision/broadphase.hpp"
#include "collide2d/components/basic.hpp"
#include "collide2d/systems/rigid_body_collision/body_access.hpp"

namespace RigidBodyCollision
{

namespace {

const Components::Collider& requireCollider(const entt::registry& registry, entt::entity body) {
    if (!registry.valid(body)) {
        throw std::invalid_argument("Broadphase: invalid body entity");
    }
    const auto* collider = registry.try_get<Components::Collider>(body);
    if (collider == nullptr) {
        throw std::invalid_argument("Broadphase: body has no Collider component");
    }
    return *collider;
}

} // namespace

Broadphase::Broadphase(double expansion) : tree(expansion) {}

void Broadphase::add(const FixtureKey& key, const Geometry::Shape* shape, const Transform& transform) {
    if (shape == nullptr) {
        return;
    }
    AABB const aabb = shape->createAABB(transform);
    int const id = tree.createProxy(aabb, key);
    proxies[key] = Proxy{id, aabb.getCenter()};
}

void Broadphase::add(const entt::registry& registry, entt::entity body) {
    const auto& collider = requireCollider(registry, body);
    Transform const transform = getTransform(registry, body);
    for (std::size_t i = 0; i < collider.fixtures.size(); ++i) {
        add(FixtureKey{body, i}, collider.fixtures[i].shape.get(), transform);
    }
}

void Broadphase::update(const FixtureKey& key, const Geometry::Shape* shape, const Transform& transform) {
    if (shape == nullptr) {
        remove(key);
        return;
    }
    auto it = proxies.find(key);
    if (it == proxies.end()) {
        add(key, shape, transform);
        return;
    }

    AABB const aabb = shape->createAABB(transform);
    Vector const center = aabb.getCenter();
    tree.moveProxy(it->second.id, aabb, center - it->second.lastCenter);
    it->second.lastCenter = center;
}

void Broadphase::update(const entt::registry& registry, entt::entity body) {
    const auto& collider = requireCollider(registry, body);
    Transform const transform = getTransform(registry, body);
    for (std::size_t i = 0; i < collider.fixtures.size(); ++i) {
        update(FixtureKey{body, i}, collider.fixtures[i].shape.get(), transform);
    }
}

bool Broadphase::remove(const FixtureKey& key) {
    auto it = proxies.find(key);
    if (it == proxies.end()) {
        return false;
    }
    tree.destroyProxy(it->second.id);
    proxies.erase(it);
    return true;
}

void Broadphase::remove(entt::entity body) {
    std::vector<FixtureKey> keys;
    for (const auto& entry : proxies) {
        if (entry.first.body == body) {
            keys.push_back(entry.first);
        }
    }
    for (const auto& k : keys) {
        remove(k);
    }
}

bool Broadphase::contains(const FixtureKey& key) const {
    return proxies.find(key) != proxies.end();
}

const AABB& Broadphase::getAABB(const FixtureKey& key) const {
    auto it = proxies.find(key);
    if (it == proxies.end()) {
        throw std::invalid_argument("Broadphase: fixture is not registered");
    }
    return tree.getFatAABB(it->second.id);
}

std::vector<BroadphasePair> Broadphase::detect(const BroadphasePairFilter& filter) const {
    std::vector<BroadphasePair> pairs;
    tree.detectPairs([&](int idA, int idB) {
        const FixtureKey& a = tree.getUserData(idA);
        const FixtureKey& b = tree.getUserData(idB);
        if (a.body == b.body) {
            return;
        }
        if (filter && !filter(a, b)) {
            return;
        }
        pairs.push_back(BroadphasePair{a, b});
    });
    return pairs;
}

std::vector<FixtureKey> Broadphase::detect(const AABB& aabb, const BroadphaseItemFilter& filter) const {
    std::vector<FixtureKey> results;
    tree.query(aabb, [&](int id) {
        const FixtureKey& key = tree.getUserData(id);
        if (!filter || filter(key)) {
            results.push_back(key);
        }
        return true;
    });
    return results;
}

std::vector<FixtureKey> Broadphase::raycast(const Geometry::Ray& ray, double maxLength,
                                            const BroadphaseItemFilter& filter) const {
    std::vector<FixtureKey> results;
    tree.raycast(ray, maxLength, [&](int id) {
        const FixtureKey& key = tree.getUserData(id);
        if (!filter || filter(key)) {
            results.push_back(key);
        }
        return true;
    });
    return results;
}

bool Broadphase::detect(const FixtureKey& a, const FixtureKey& b) const {
    auto ia = proxies.find(a);
    auto ib = proxies.find(b);
    if (ia == proxies.end() || ib == proxies.end()) {
        return false;
    }
    return tree.getFatAABB(ia->second.id).overlaps(tree.getFatAABB(ib->second.id));
}

void Broadphase::clear() {
    tree.clear();
    proxies.clear();
}

} // namespace RigidBodyCollision
