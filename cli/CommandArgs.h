#ifndef CAVESIM_COMMAND_ARGS_H
#define CAVESIM_COMMAND_ARGS_H

#include <cctype>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include "kernel/Errors.h"
#include "kernel/Simulation.h"

// Arguments of the shell's `run T [log] [mode]` command
struct RunArgs {
    std::uint64_t sweeps = 0;
    std::uint64_t logFreq = 0;               // 0: no periodic polarization line
    std::optional<UpdateOrdering> ordering;  // unset: configured ordering
};

inline bool isCount(const std::string& token) {
    if (token.empty()) return false;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Reads the remaining tokens of a `run` line. The log interval and the mode
// may appear in either order; anything else throws ConfigurationError.
inline RunArgs parseRunArgs(std::istream& in) {
    RunArgs args;
    std::string token;
    if (!(in >> token) || !isCount(token)) {
        throw ConfigurationError("usage: run T [log] [async|sync]");
    }
    args.sweeps = std::stoull(token);

    bool haveLog = false;
    while (in >> token) {
        if (isCount(token) && !haveLog) {
            args.logFreq = std::stoull(token);
            haveLog = true;
        } else if (!isCount(token) && !args.ordering) {
            args.ordering = parseOrdering(token);
        } else {
            throw ConfigurationError("run: unexpected argument '" + token + "'");
        }
    }
    return args;
}

#endif // CAVESIM_COMMAND_ARGS_H
