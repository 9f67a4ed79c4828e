#include "collide2d/systems/rigid_body_collision/island.hpp"

#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "collide2d/systems/rigid_body_collision/body_access.hpp"

#define ENABLE_ISLAND_DEBUG 0
#define DEBUG(x) do { if (ENABLE_ISLAND_DEBUG) { std::cout << x; } } while(0)

namespace RigidBodyCollision {

namespace {

struct Edge {
    std::size_t constraint;
    int other;  ///< node index of the body on the far side
};

struct Node {
    entt::entity body = entt::null;
    bool dynamic = false;
    bool visited = false;
    std::vector<Edge> edges;
};

} // namespace

std::vector<Island> buildIslands(const entt::registry& registry,
                                 const std::vector<entt::entity>& seeds,
                                 const std::vector<ContactConstraint>& constraints)
{
    std::vector<Node> nodes;
    std::unordered_map<entt::entity, int> indexOf;

    auto nodeFor = [&](entt::entity e) -> int {
        auto it = indexOf.find(e);
        if (it != indexOf.end()) {
            return it->second;
        }
        int const idx = static_cast<int>(nodes.size());
        Node n;
        n.body = e;
        n.dynamic = registry.valid(e) && !isStatic(registry, e);
        nodes.push_back(std::move(n));
        indexOf.emplace(e, idx);
        return idx;
    };

    for (entt::entity e : seeds) {
        nodeFor(e);
    }

    for (std::size_t i = 0; i < constraints.size(); ++i) {
        const auto& cc = constraints[i];
        if (cc.sensor || !cc.hasEnabledContact()) {
            continue;
        }
        int const a = nodeFor(cc.getBody1());
        int const b = nodeFor(cc.getBody2());
        nodes[a].edges.push_back({i, b});
        nodes[b].edges.push_back({i, a});
    }

    std::vector<Island> islands;
    std::vector<int> stack;
    std::unordered_set<std::size_t> constraintAdded;
    std::unordered_set<int> staticAdded;

    for (std::size_t seed = 0; seed < nodes.size(); ++seed) {
        if (nodes[seed].visited || !nodes[seed].dynamic) {
            continue;
        }

        Island island;
        staticAdded.clear();
        stack.clear();
        stack.push_back(static_cast<int>(seed));
        nodes[seed].visited = true;

        while (!stack.empty()) {
            int const current = stack.back();
            stack.pop_back();
            island.bodies.push_back(nodes[current].body);

            for (const Edge& edge : nodes[current].edges) {
                if (constraintAdded.insert(edge.constraint).second) {
                    island.constraints.push_back(edge.constraint);
                }

                Node& other = nodes[edge.other];
                if (!other.dynamic) {
                    // static bodies are shared between islands, so never mark them visited
                    if (staticAdded.insert(edge.other).second) {
                        island.bodies.push_back(other.body);
                    }
                    continue;
                }
                if (!other.visited) {
                    other.visited = true;
                    stack.push_back(edge.other);
                }
            }
        }

        DEBUG("[Island] " << islands.size() << ": " << island.bodies.size() << " bodies, "
              << island.constraints.size() << " constraints\n");
        islands.push_back(std::move(island));
    }

    return islands;
}

} // namespace RigidBodyCollision
