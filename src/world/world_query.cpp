#include "ftr/world/world_query.hpp"

namespace ftr::world {

NodeId rootOf(const IWorldQuery& world, NodeId node) {
    NodeId current = node;
    while (current.isValid()) {
        NodeId parent = world.parentOf(current);
        if (!parent.isValid()) {
            break;
        }
        current = parent;
    }
    return current;
}

std::vector<NodeId> selfAndDescendants(const IWorldQuery& world, NodeId node) {
    std::vector<NodeId> result;
    std::vector<NodeId> stack{node};
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        result.push_back(current);
        auto children = world.childrenOf(current);
        // Reverse so the first child is visited first.
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return result;
}

bool isInHierarchy(const IWorldQuery& world, NodeId node, NodeId ancestor) {
    for (NodeId current = node; current.isValid(); current = world.parentOf(current)) {
        if (current == ancestor) {
            return true;
        }
    }
    return false;
}

}  // namespace ftr::world
