#ifndef CAVESIM_SNAPSHOT_IO_H
#define CAVESIM_SNAPSHOT_IO_H

#include "kernel/Simulation.h"
#include "modules/Experiment.h"
#include <iosfwd>
#include <map>
#include <string>

// JSON export of one run: metadata, current polarization and opinions,
// optionally every recorded snapshot
std::string simulationToJson(const Simulation& sim, bool includeHistory = false);

// JSON export of an experiment: attributes plus polarization[trial][snapshot]
// per condition, optionally with final-iteration opinions per trial
std::string experimentToJson(const ExperimentResult& result, bool includeFinalOpinions = false);

// CSV: iteration,polarization for every snapshot of the run
void logPolarization(const Simulation& sim, std::ostream& out);

// CSV: condition,trial,polarization for the last snapshot of every trial
void logFinalPolarizations(const ExperimentResult& result, std::ostream& out);

std::string attributesToJson(const std::map<std::string, std::string>& attrs);

#endif // CAVESIM_SNAPSHOT_IO_H
