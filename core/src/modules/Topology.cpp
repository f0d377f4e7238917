#include "modules/Topology.h"
#include "kernel/Errors.h"
#include <limits>

namespace {

void checkCaveCounts(std::uint32_t nCaves, std::uint32_t nPerCave,
                     std::uint32_t minCaves, std::uint32_t minPerCave, const char* what) {
    if (nCaves < minCaves) {
        throw ConfigurationError(std::string(what) + ": n_caves must be >= " +
                                 std::to_string(minCaves) + " (got " + std::to_string(nCaves) + ")");
    }
    if (nPerCave < minPerCave) {
        throw ConfigurationError(std::string(what) + ": n_per_cave must be >= " +
                                 std::to_string(minPerCave) + " (got " + std::to_string(nPerCave) + ")");
    }
    const std::uint64_t total = static_cast<std::uint64_t>(nCaves) * nPerCave;
    if (total > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigurationError(std::string(what) + ": agent count overflows node index");
    }
}

Network emptyCaves(std::uint32_t nCaves, std::uint32_t nPerCave) {
    Network net(nCaves * nPerCave);
    for (std::uint32_t c = 0; c < nCaves; ++c) {
        for (std::uint32_t j = 0; j < nPerCave; ++j) {
            net.assignCave(c * nPerCave + j, c);
        }
    }
    return net;
}

}

const char* topologyName(Topology topology) {
    switch (topology) {
        case Topology::Caveman: return "caveman";
        case Topology::ConnectedCaveman: return "connected caveman";
    }
    return "unknown";
}

Topology parseTopology(const std::string& name) {
    if (name == "caveman") return Topology::Caveman;
    if (name == "connected" || name == "connected caveman" || name == "connected_caveman") {
        return Topology::ConnectedCaveman;
    }
    throw ConfigurationError("unknown topology '" + name + "'");
}

Network buildCaveman(std::uint32_t nCaves, std::uint32_t nPerCave) {
    checkCaveCounts(nCaves, nPerCave, 1, 1, "buildCaveman");
    Network net = emptyCaves(nCaves, nPerCave);

    for (std::uint32_t c = 0; c < nCaves; ++c) {
        const std::uint32_t base = c * nPerCave;
        for (std::uint32_t i = 0; i < nPerCave; ++i) {
            for (std::uint32_t j = i + 1; j < nPerCave; ++j) {
                net.addEdge(base + i, base + j);
            }
        }
    }
    return net;
}

Network buildConnectedCaveman(std::uint32_t nCaves, std::uint32_t nPerCave) {
    checkCaveCounts(nCaves, nPerCave, 2, 2, "buildConnectedCaveman");
    Network net = emptyCaves(nCaves, nPerCave);
    const std::uint32_t N = nCaves * nPerCave;

    for (std::uint32_t c = 0; c < nCaves; ++c) {
        const std::uint32_t base = c * nPerCave;
        for (std::uint32_t i = 0; i < nPerCave; ++i) {
            for (std::uint32_t j = i + 1; j < nPerCave; ++j) {
                if (i == 0 && j == 1) continue;  // this edge becomes the inter-cave link
                net.addEdge(base + i, base + j);
            }
        }
        net.addEdge(base, (base + N - 1) % N);
    }
    return net;
}

Network buildTopology(Topology topology, std::uint32_t nCaves, std::uint32_t nPerCave) {
    switch (topology) {
        case Topology::Caveman: return buildCaveman(nCaves, nPerCave);
        case Topology::ConnectedCaveman: return buildConnectedCaveman(nCaves, nPerCave);
    }
    throw ConfigurationError("buildTopology: unknown topology");
}
