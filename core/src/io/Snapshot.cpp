#include "io/Snapshot.h"
#include <iomanip>
#include <ostream>
#include <sstream>

namespace {

std::string escape(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

void writeOpinions(std::ostream& os, const std::vector<OpinionVec>& opinions) {
    os << "[";
    for (std::size_t i = 0; i < opinions.size(); ++i) {
        os << "[";
        for (std::size_t k = 0; k < opinions[i].size(); ++k) {
            os << opinions[i][k];
            if (k + 1 < opinions[i].size()) os << ",";
        }
        os << "]";
        if (i + 1 < opinions.size()) os << ",";
    }
    os << "]";
}

void writeSeries(std::ostream& os, const std::vector<double>& values) {
    os << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        os << values[i];
        if (i + 1 < values.size()) os << ",";
    }
    os << "]";
}

}

std::string attributesToJson(const std::map<std::string, std::string>& attrs) {
    std::ostringstream os;
    os << "{";
    std::size_t i = 0;
    for (const auto& [key, value] : attrs) {
        os << "\"" << escape(key) << "\":\"" << escape(value) << "\"";
        if (++i < attrs.size()) os << ",";
    }
    os << "}";
    return os.str();
}

std::string simulationToJson(const Simulation& sim, bool includeHistory) {
    std::ostringstream os;
    os << std::setprecision(6);

    os << "{";
    os << "\"iteration\":" << sim.iteration() << ",";
    os << "\"metadata\":" << attributesToJson(sim.metadata()) << ",";
    if (sim.agents().size() >= 2) {
        os << "\"polarization\":" << sim.polarization() << ",";
    } else {
        os << "\"polarization\":null,";
    }
    os << "\"edges\":" << sim.network().edgeCount() << ",";

    os << "\"agents\":[";
    const auto& agents = sim.agents();
    for (std::size_t i = 0; i < agents.size(); ++i) {
        const auto& a = agents[i];
        os << "{";
        os << "\"id\":" << a.id << ",";
        os << "\"cave\":" << a.cave << ",";
        os << "\"degree\":" << sim.network().degree(a.id) << ",";
        os << "\"opinions\":[";
        for (std::size_t k = 0; k < a.opinions.size(); ++k) {
            os << a.opinions[k];
            if (k + 1 < a.opinions.size()) os << ",";
        }
        os << "]}";
        if (i + 1 < agents.size()) os << ",";
    }
    os << "]";

    if (includeHistory) {
        os << ",\"history\":[";
        const auto& snaps = sim.history().snapshots();
        for (std::size_t s = 0; s < snaps.size(); ++s) {
            os << "{\"iteration\":" << snaps[s].iteration << ",\"opinions\":";
            writeOpinions(os, snaps[s].opinions);
            os << "}";
            if (s + 1 < snaps.size()) os << ",";
        }
        os << "]";
    }
    os << "}";
    return os.str();
}

std::string experimentToJson(const ExperimentResult& result, bool includeFinalOpinions) {
    std::ostringstream os;
    os << std::setprecision(6);

    os << "{";
    os << "\"attrs\":" << attributesToJson(result.attrs) << ",";
    os << "\"conditions\":{";
    std::size_t c = 0;
    for (const auto& [key, cond] : result.conditions) {
        os << "\"" << escape(key) << "\":{";
        os << "\"trials\":[";
        for (std::size_t t = 0; t < cond.trials.size(); ++t) {
            os << cond.trials[t];
            if (t + 1 < cond.trials.size()) os << ",";
        }
        os << "],\"polarization\":[";
        for (std::size_t t = 0; t < cond.polarization.size(); ++t) {
            writeSeries(os, cond.polarization[t]);
            if (t + 1 < cond.polarization.size()) os << ",";
        }
        os << "]";
        if (includeFinalOpinions && !cond.histories.empty()) {
            os << ",\"final_opinions\":[";
            for (std::size_t t = 0; t < cond.histories.size(); ++t) {
                writeOpinions(os, cond.histories[t].back().opinions);
                if (t + 1 < cond.histories.size()) os << ",";
            }
            os << "]";
        }
        os << "}";
        if (++c < result.conditions.size()) os << ",";
    }
    os << "},";

    os << "\"failures\":[";
    for (std::size_t f = 0; f < result.failures.size(); ++f) {
        os << "{\"trial\":" << result.failures[f].first
           << ",\"error\":\"" << escape(result.failures[f].second) << "\"}";
        if (f + 1 < result.failures.size()) os << ",";
    }
    os << "]";
    os << ",\"cancelled\":[";
    for (std::size_t c = 0; c < result.cancelled.size(); ++c) {
        os << result.cancelled[c];
        if (c + 1 < result.cancelled.size()) os << ",";
    }
    os << "]";
    os << "}";
    return os.str();
}

void logPolarization(const Simulation& sim, std::ostream& out) {
    for (const auto& snap : sim.history().snapshots()) {
        out << snap.iteration << "," << sim.polarizationOf(snap) << "\n";
    }
}

void logFinalPolarizations(const ExperimentResult& result, std::ostream& out) {
    for (const auto& [key, cond] : result.conditions) {
        for (std::size_t t = 0; t < cond.size(); ++t) {
            out << key << "," << cond.trials[t] << "," << cond.finalPolarization(t) << "\n";
        }
    }
}
