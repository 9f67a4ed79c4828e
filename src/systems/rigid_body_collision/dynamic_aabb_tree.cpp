#include "collide2d/systems/rigid_body_collision/dynamic_aabb_tree.hpp"
#include "collide2d/core/debug.hpp"

#include <algorithm>
#include <cstdlib>

#define ENABLE_TREE_DEBUG 0
#define TREE_DEBUG(x) do { if (ENABLE_TREE_DEBUG) { std::cout << "[AABBTree] " << x << std::endl; } } while (0)

namespace RigidBodyCollision {

DynamicAABBTree::DynamicAABBTree(double expansion) : expansion(expansion) {}

int DynamicAABBTree::allocateNode() {
  if (freeList == NULL_NODE) {
    nodes.emplace_back();
    int const id = static_cast<int>(nodes.size()) - 1;
    nodes[id].height = 0;
    return id;
  }
  int const id = freeList;
  freeList = nodes[id].parent;
  nodes[id] = TreeNode();
  nodes[id].height = 0;
  return id;
}

void DynamicAABBTree::freeNode(int id) {
  nodes[id] = TreeNode();
  nodes[id].parent = freeList;
  nodes[id].height = -1;
  freeList = id;
}

int DynamicAABBTree::createProxy(const AABB& aabb, const FixtureKey& key) {
  int const id = allocateNode();
  nodes[id].aabb = aabb.expand(expansion);
  nodes[id].key = key;
  nodes[id].height = 0;
  insertLeaf(id);
  leafCount++;
  return id;
}

void DynamicAABBTree::destroyProxy(int proxyId) {
  removeLeaf(proxyId);
  freeNode(proxyId);
  leafCount--;
}

bool DynamicAABBTree::moveProxy(int proxyId, const AABB& aabb, const Vector& displacement) {
  if (nodes[proxyId].aabb.contains(aabb)) {
    return false;
  }

  removeLeaf(proxyId);
  nodes[proxyId].aabb = aabb.expand(expansion).sweep(displacement * DISPLACEMENT_MULTIPLIER);
  insertLeaf(proxyId);
  TREE_DEBUG("reinserted proxy " << proxyId);
  return true;
}

void DynamicAABBTree::insertLeaf(int leaf) {
  if (root == NULL_NODE) {
    root = leaf;
    nodes[root].parent = NULL_NODE;
    return;
  }

  // find the sibling with the cheapest perimeter growth
  AABB const leafAABB = nodes[leaf].aabb;
  int index = root;
  while (!nodes[index].isLeaf()) {
    const TreeNode& node = nodes[index];
    int const child1 = node.child1;
    int const child2 = node.child2;

    double const area = node.aabb.perimeter();
    double const combinedArea = AABB::combine(node.aabb, leafAABB).perimeter();

    // cost of making a new parent for this node and the leaf
    double const cost = 2.0 * combinedArea;
    // minimum cost of pushing the leaf further down
    double const inheritanceCost = 2.0 * (combinedArea - area);

    auto descendCost = [&](int child) {
      const TreeNode& c = nodes[child];
      double const grown = AABB::combine(leafAABB, c.aabb).perimeter();
      if (c.isLeaf()) {
        return grown + inheritanceCost;
      }
      return (grown - c.aabb.perimeter()) + inheritanceCost;
    };

    double const cost1 = descendCost(child1);
    double const cost2 = descendCost(child2);

    if (cost < cost1 && cost < cost2) {
      break;
    }
    index = cost1 < cost2 ? child1 : child2;
  }

  int const sibling = index;
  int const oldParent = nodes[sibling].parent;
  int const newParent = allocateNode();

  nodes[newParent].parent = oldParent;
  nodes[newParent].aabb = AABB::combine(leafAABB, nodes[sibling].aabb);
  nodes[newParent].height = nodes[sibling].height + 1;
  nodes[newParent].child1 = sibling;
  nodes[newParent].child2 = leaf;
  nodes[sibling].parent = newParent;
  nodes[leaf].parent = newParent;

  if (oldParent != NULL_NODE) {
    if (nodes[oldParent].child1 == sibling) {
      nodes[oldParent].child1 = newParent;
    } else {
      nodes[oldParent].child2 = newParent;
    }
  } else {
    root = newParent;
  }

  refitUpwards(nodes[leaf].parent);
}

void DynamicAABBTree::removeLeaf(int leaf) {
  if (leaf == root) {
    root = NULL_NODE;
    return;
  }

  int const parent = nodes[leaf].parent;
  int const grandParent = nodes[parent].parent;
  int const sibling = nodes[parent].child1 == leaf ? nodes[parent].child2 : nodes[parent].child1;

  if (grandParent != NULL_NODE) {
    if (nodes[grandParent].child1 == parent) {
      nodes[grandParent].child1 = sibling;
    } else {
      nodes[grandParent].child2 = sibling;
    }
    nodes[sibling].parent = grandParent;
    freeNode(parent);
    refitUpwards(grandParent);
  } else {
    root = sibling;
    nodes[sibling].parent = NULL_NODE;
    freeNode(parent);
  }
  nodes[leaf].parent = NULL_NODE;
}

void DynamicAABBTree::refitUpwards(int id) {
  int index = id;
  while (index != NULL_NODE) {
    index = balance(index);

    TreeNode& node = nodes[index];
    const TreeNode& c1 = nodes[node.child1];
    const TreeNode& c2 = nodes[node.child2];
    node.height = 1 + std::max(c1.height, c2.height);
    node.aabb = AABB::combine(c1.aabb, c2.aabb);

    index = node.parent;
  }
}

// Rotates the taller child of A up when the children's heights differ by
// more than one. Returns the root of the rotated subtree.
int DynamicAABBTree::balance(int iA) {
  TreeNode& A = nodes[iA];
  if (A.isLeaf() || A.height < 2) {
    return iA;
  }

  int const iB = A.child1;
  int const iC = A.child2;
  TreeNode& B = nodes[iB];
  TreeNode& C = nodes[iC];

  int const diff = C.height - B.height;

  // rotate C up
  if (diff > 1) {
    int const iF = C.child1;
    int const iG = C.child2;
    TreeNode& F = nodes[iF];
    TreeNode& G = nodes[iG];

    C.child1 = iA;
    C.parent = A.parent;
    A.parent = iC;

    if (C.parent != NULL_NODE) {
      if (nodes[C.parent].child1 == iA) {
        nodes[C.parent].child1 = iC;
      } else {
        nodes[C.parent].child2 = iC;
      }
    } else {
      root = iC;
    }

    // the taller grandchild stays under C
    if (F.height > G.height) {
      C.child2 = iF;
      A.child2 = iG;
      G.parent = iA;
      A.aabb = AABB::combine(B.aabb, G.aabb);
      C.aabb = AABB::combine(A.aabb, F.aabb);
      A.height = 1 + std::max(B.height, G.height);
      C.height = 1 + std::max(A.height, F.height);
    } else {
      C.child2 = iG;
      A.child2 = iF;
      F.parent = iA;
      A.aabb = AABB::combine(B.aabb, F.aabb);
      C.aabb = AABB::combine(A.aabb, G.aabb);
      A.height = 1 + std::max(B.height, F.height);
      C.height = 1 + std::max(A.height, G.height);
    }
    return iC;
  }

  // rotate B up
  if (diff < -1) {
    int const iD = B.child1;
    int const iE = B.child2;
    TreeNode& D = nodes[iD];
    TreeNode& E = nodes[iE];

    B.child1 = iA;
    B.parent = A.parent;
    A.parent = iB;

    if (B.parent != NULL_NODE) {
      if (nodes[B.parent].child1 == iA) {
        nodes[B.parent].child1 = iB;
      } else {
        nodes[B.parent].child2 = iB;
      }
    } else {
      root = iB;
    }

    if (D.height > E.height) {
      B.child2 = iD;
      A.child1 = iE;
      E.parent = iA;
      A.aabb = AABB::combine(C.aabb, E.aabb);
      B.aabb = AABB::combine(A.aabb, D.aabb);
      A.height = 1 + std::max(C.height, E.height);
      B.height = 1 + std::max(A.height, D.height);
    } else {
      B.child2 = iE;
      A.child1 = iD;
      D.parent = iA;
      A.aabb = AABB::combine(C.aabb, D.aabb);
      B.aabb = AABB::combine(A.aabb, E.aabb);
      A.height = 1 + std::max(C.height, D.height);
      B.height = 1 + std::max(A.height, E.height);
    }
    return iB;
  }

  return iA;
}

void DynamicAABBTree::clear() {
  nodes.clear();
  root = NULL_NODE;
  freeList = NULL_NODE;
  leafCount = 0;
}

int DynamicAABBTree::getHeight() const {
  return root == NULL_NODE ? -1 : nodes[root].height;
}

int DynamicAABBTree::getMaxBalance() const {
  int maxBalance = 0;
  for (const auto& node : nodes) {
    if (node.height <= 1) {
      continue;
    }
    int const b = std::abs(nodes[node.child2].height - nodes[node.child1].height);
    maxBalance = std::max(maxBalance, b);
  }
  return maxBalance;
}

bool DynamicAABBTree::validateNode(int id, std::size_t& leaves) const {
  const TreeNode& node = nodes[id];
  if (node.isLeaf()) {
    leaves++;
    return node.height == 0 && node.child2 == NULL_NODE;
  }

  int const c1 = node.child1;
  int const c2 = node.child2;
  if (c2 == NULL_NODE) {
    return false;
  }
  if (nodes[c1].parent != id || nodes[c2].parent != id) {
    return false;
  }
  if (node.height != 1 + std::max(nodes[c1].height, nodes[c2].height)) {
    return false;
  }
  if (!node.aabb.contains(nodes[c1].aabb) || !node.aabb.contains(nodes[c2].aabb)) {
    return false;
  }
  return validateNode(c1, leaves) && validateNode(c2, leaves);
}

bool DynamicAABBTree::validate() const {
  if (root == NULL_NODE) {
    return leafCount == 0;
  }
  if (nodes[root].parent != NULL_NODE) {
    return false;
  }
  std::size_t leaves = 0;
  if (!validateNode(root, leaves)) {
    return false;
  }
  return leaves == leafCount;
}

} // namespace RigidBodyCollision
