#ifndef CAVESIM_TOPOLOGY_H
#define CAVESIM_TOPOLOGY_H

#include <cstdint>
#include <string>
#include "kernel/Network.h"

enum class Topology : std::uint8_t {
    Caveman = 0,           // disjoint cliques
    ConnectedCaveman = 1   // ring of cliques, one rewired edge per cave
};

const char* topologyName(Topology topology);
Topology parseTopology(const std::string& name);

// nCaves fully connected cliques of nPerCave nodes each. Node c*nPerCave + j
// belongs to cave c. Throws ConfigurationError if either count is < 1.
Network buildCaveman(std::uint32_t nCaves, std::uint32_t nPerCave);

// Connected caveman graph: in every cave the edge between its first two
// members is dropped and the first member is joined to the last member of the
// previous cave. Requires nCaves >= 2 and nPerCave >= 2.
Network buildConnectedCaveman(std::uint32_t nCaves, std::uint32_t nPerCave);

Network buildTopology(Topology topology, std::uint32_t nCaves, std::uint32_t nPerCave);

#endif // CAVESIM_TOPOLOGY_H
