#include "modules/Polarization.h"
#include "kernel/Errors.h"
#include "utils/EventLog.h"
#include "utils/Validation.h"
#include <cmath>
#include <sstream>

double opinionDistance(const OpinionVec& a, const OpinionVec& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError("opinionDistance: opinion vectors have different lengths (" +
                                     std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
    }
    if (a.empty()) {
        throw DimensionMismatchError("opinionDistance: opinion vectors are empty");
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        sum += std::abs(a[i] - b[i]);
    }
    return sum / static_cast<double>(a.size());
}

double polarization(const std::vector<OpinionVec>& opinions, EventLog* trace, std::uint64_t iteration) {
    const std::size_t L = opinions.size();
    if (L < 2) {
        throw EmptyNetworkError("polarization: need at least 2 agents (got " + std::to_string(L) + ")");
    }
    const bool tracing = trace != nullptr && trace->enabled();

    // Distance is symmetric: walk i < j and count each unordered pair twice
    const double pairs = static_cast<double>(L) * static_cast<double>(L - 1);
    double sum = 0.0;
    for (std::size_t i = 0; i < L; ++i) {
        for (std::size_t j = i + 1; j < L; ++j) {
            const double d = opinionDistance(opinions[i], opinions[j]);
            sum += 2.0 * d;
            if (tracing) {
                std::ostringstream os;
                os << "i=" << i << ", j=" << j << ", distance=" << d;
                trace->log(EventCategory::Metric, iteration, os.str());
            }
        }
    }
    const double dExpected = sum / pairs;
    if (tracing) {
        std::ostringstream os;
        os << "d_expected=" << dExpected;
        trace->log(EventCategory::Metric, iteration, os.str());
    }

    double sq = 0.0;
    for (std::size_t i = 0; i < L; ++i) {
        for (std::size_t j = i + 1; j < L; ++j) {
            const double diff = opinionDistance(opinions[i], opinions[j]) - dExpected;
            sq += 2.0 * diff * diff;
        }
    }
    const double p = sq / pairs;
    validation::checkNonNegative(p, "polarization");
    return p;
}

double polarization(const std::vector<Agent>& agents, EventLog* trace, std::uint64_t iteration) {
    std::vector<OpinionVec> opinions;
    opinions.reserve(agents.size());
    for (const auto& a : agents) opinions.push_back(a.opinions);
    return polarization(opinions, trace, iteration);
}
