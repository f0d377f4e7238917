#ifndef CAVESIM_REWIRING_H
#define CAVESIM_REWIRING_H

#include <cstdint>
#include <cstddef>
#include <random>
#include <unordered_map>
#include <vector>
#include "kernel/Network.h"

/**
 * Complement edge set of a Network: every unordered pair of distinct nodes
 * that is not yet connected.
 *
 * Stored as a dense vector for O(1) uniform sampling plus a key -> slot map
 * for O(1) swap-removal. Together with the network's edge set it always
 * partitions the set of all unordered pairs.
 */
class NonNeighborPool {
public:
    NonNeighborPool() = default;
    explicit NonNeighborPool(const Network& network) { rebuild(network); }

    void rebuild(const Network& network);

    std::size_t size() const { return pairs_.size(); }
    bool empty() const { return pairs_.empty(); }
    bool contains(std::uint32_t a, std::uint32_t b) const;
    const Network::Edge& at(std::size_t i) const { return pairs_[i]; }
    const std::vector<Network::Edge>& pairs() const { return pairs_; }

    // Returns false if the pair was not in the pool
    bool remove(std::uint32_t a, std::uint32_t b);

private:
    std::vector<Network::Edge> pairs_;
    std::unordered_map<std::uint64_t, std::size_t> slot_;
};

/**
 * Adds random long-range ties to a network, drawing candidates from its
 * non-neighbor pool. Holds non-owning references to both; the caller keeps
 * them alive and in sync. All randomness comes from the generator passed in.
 */
class RewiringEngine {
public:
    RewiringEngine(Network& network, NonNeighborPool& pool);

    // One pair drawn uniformly from the pool. Throws EdgeExhaustedError if empty.
    Network::Edge addRandomConnection(std::mt19937_64& rng);

    // One Bernoulli(targetProbability) trial per pair still in the pool.
    // Returns the number of edges added.
    std::size_t addRandomConnections(double targetProbability, std::mt19937_64& rng);

    // Exactly `count` uniform draws; throws EdgeExhaustedError if the pool runs out.
    std::size_t addRandomConnectionCount(std::size_t count, std::mt19937_64& rng);

    // One pair drawn uniformly among pool pairs whose caves are ring neighbors.
    Network::Edge addShortRangeConnection(std::mt19937_64& rng);

    bool areAdjacentCaves(std::uint32_t caveA, std::uint32_t caveB) const;

    // pool + edges == all pairs, and the two are disjoint
    bool checkPartition() const;

    const NonNeighborPool& pool() const { return pool_; }

private:
    void connect(const Network::Edge& e);

    Network& network_;
    NonNeighborPool& pool_;
};

#endif // CAVESIM_REWIRING_H
