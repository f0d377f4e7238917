#ifndef CAVESIM_NETWORK_H
#define CAVESIM_NETWORK_H

#include <cstdint>
#include <cstddef>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * Undirected simple graph over agent indices.
 *
 * Nodes are 0..size()-1 and carry the cave they were built in. Edges carry no
 * weight; influence weights are derived from opinions at interaction time.
 * There is no edge removal: during a run the edge set only grows.
 */
class Network {
public:
    using Edge = std::pair<std::uint32_t, std::uint32_t>;  // (lo, hi), lo < hi

    Network() = default;
    explicit Network(std::uint32_t nodeCount);

    void reset(std::uint32_t nodeCount);

    // Nodes
    std::uint32_t size() const { return static_cast<std::uint32_t>(adj_.size()); }
    std::uint32_t caveOf(std::uint32_t node) const { return cave_[node]; }
    void assignCave(std::uint32_t node, std::uint32_t cave);
    std::uint32_t caveCount() const { return caveCount_; }

    // Edges
    const std::vector<std::uint32_t>& neighbors(std::uint32_t node) const { return adj_[node]; }
    std::size_t degree(std::uint32_t node) const { return adj_[node].size(); }
    bool hasEdge(std::uint32_t a, std::uint32_t b) const;
    // Returns false if the edge already exists. Throws on self-loops and bad indices.
    bool addEdge(std::uint32_t a, std::uint32_t b);
    std::size_t edgeCount() const { return edges_.size(); }
    const std::vector<Edge>& edges() const { return edges_; }  // insertion order

    static Edge makeEdge(std::uint32_t a, std::uint32_t b) {
        return a < b ? Edge{a, b} : Edge{b, a};
    }
    static std::uint64_t edgeKey(std::uint32_t a, std::uint32_t b) {
        const Edge e = makeEdge(a, b);
        return (static_cast<std::uint64_t>(e.first) << 32) | e.second;
    }

private:
    std::vector<std::vector<std::uint32_t>> adj_;
    std::vector<std::uint32_t> cave_;
    std::uint32_t caveCount_ = 0;
    std::vector<Edge> edges_;
    std::unordered_set<std::uint64_t> edgeKeys_;
};

#endif // CAVESIM_NETWORK_H
