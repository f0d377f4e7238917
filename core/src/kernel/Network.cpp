#include "kernel/Network.h"
#include <algorithm>
#include <stdexcept>
#include <string>

Network::Network(std::uint32_t nodeCount) { reset(nodeCount); }

void Network::reset(std::uint32_t nodeCount) {
    adj_.assign(nodeCount, {});
    cave_.assign(nodeCount, 0);
    caveCount_ = nodeCount > 0 ? 1 : 0;
    edges_.clear();
    edgeKeys_.clear();
}

void Network::assignCave(std::uint32_t node, std::uint32_t cave) {
    if (node >= size()) {
        throw std::out_of_range("assignCave: node " + std::to_string(node) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    cave_[node] = cave;
    caveCount_ = std::max(caveCount_, cave + 1);
}

bool Network::hasEdge(std::uint32_t a, std::uint32_t b) const {
    if (a == b) return false;
    return edgeKeys_.count(edgeKey(a, b)) != 0;
}

bool Network::addEdge(std::uint32_t a, std::uint32_t b) {
    if (a >= size() || b >= size()) {
        throw std::out_of_range("addEdge: (" + std::to_string(a) + ", " + std::to_string(b) +
                                ") out of range (size " + std::to_string(size()) + ")");
    }
    if (a == b) {
        throw std::invalid_argument("addEdge: self-loop on node " + std::to_string(a));
    }
    if (!edgeKeys_.insert(edgeKey(a, b)).second) {
        return false;
    }
    adj_[a].push_back(b);
    adj_[b].push_back(a);
    edges_.push_back(makeEdge(a, b));
    return true;
}
