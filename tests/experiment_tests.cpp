#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "modules/Experiment.h"
#include <atomic>
#include <cmath>
#include <chrono>
#include <set>
#include <thread>

namespace {

ExperimentConfig smallExperiment() {
    ExperimentConfig cfg;
    cfg.sim.nCaves = 4;
    cfg.sim.nPerCave = 3;
    cfg.sim.K = 2;
    cfg.sim.seed = 1234;
    cfg.nTrials = 3;
    cfg.nIterations = 20;
    cfg.nIterSync = 10;
    cfg.nRandomEdges = 2;
    cfg.threads = 2;
    return cfg;
}

}

TEST(ExperimentTest, ProducesThreeConditions) {
    Experiment experiment(smallExperiment());
    const ExperimentResult result = experiment.run();

    ASSERT_EQ(result.conditions.size(), 3u);
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(result.attrs.at("n_trials_completed"), "3");
    EXPECT_EQ(result.attrs.at("n_trials_cancelled"), "0");

    for (const char* key : {kConditionConnected, kConditionShortRange, kConditionAnyRange}) {
        const ConditionResult& cond = result.condition(key);
        ASSERT_EQ(cond.size(), 3u) << key;
        ASSERT_EQ(cond.polarization.size(), 3u);
        ASSERT_EQ(cond.histories.size(), 3u);
        for (std::size_t t = 0; t < cond.size(); ++t) {
            EXPECT_EQ(cond.trials[t], t);
            // snapshot 0, 10 sync sweeps, 10 more per condition
            ASSERT_EQ(cond.polarization[t].size(), 21u);
            ASSERT_EQ(cond.iterations[t].size(), 21u);
            EXPECT_EQ(cond.iterations[t].front(), 0u);
            EXPECT_EQ(cond.iterations[t].back(), 20u);
            for (double p : cond.polarization[t]) {
                EXPECT_TRUE(std::isfinite(p));
                EXPECT_GE(p, 0.0);
            }
            EXPECT_EQ(cond.opinionsAt(t, 20).size(), 12u);
        }
        EXPECT_EQ(cond.finalPolarizations().size(), 3u);
    }
    EXPECT_THROW(result.condition("small world"), std::out_of_range);
}

TEST(ExperimentTest, ConditionsShareTheSyncPhase) {
    Experiment experiment(smallExperiment());
    const ExperimentResult result = experiment.run();

    const auto& connected = result.condition(kConditionConnected);
    const auto& shortRange = result.condition(kConditionShortRange);
    const auto& anyRange = result.condition(kConditionAnyRange);
    for (std::size_t t = 0; t < connected.size(); ++t) {
        for (std::size_t s = 0; s <= 10; ++s) {
            EXPECT_EQ(connected.polarization[t][s], shortRange.polarization[t][s]);
            EXPECT_EQ(connected.polarization[t][s], anyRange.polarization[t][s]);
        }
    }
}

TEST(ExperimentTest, DeterministicAcrossRunsAndThreadCounts) {
    ExperimentConfig cfg = smallExperiment();
    const ExperimentResult a = Experiment(cfg).run();
    cfg.threads = 1;
    const ExperimentResult b = Experiment(cfg).run();

    for (const auto& [key, cond] : a.conditions) {
        EXPECT_EQ(cond.polarization, b.condition(key).polarization) << key;
    }
}

TEST(ExperimentTest, TrialsUseDistinctSeeds) {
    std::set<std::uint64_t> seeds;
    for (std::uint32_t t = 0; t < 100; ++t) {
        seeds.insert(trialSeed(42, t));
    }
    EXPECT_EQ(seeds.size(), 100u);
    EXPECT_EQ(trialSeed(42, 3), trialSeed(42, 3));
    EXPECT_NE(trialSeed(42, 3), trialSeed(43, 3));
}

TEST(ExperimentTest, AttributesDescribeParameters) {
    ExperimentConfig cfg = smallExperiment();
    cfg.sim.noiseLevel = 0.1;
    Experiment experiment(cfg);
    const auto attrs = experiment.attributes();

    EXPECT_EQ(attrs.at("K"), "2");
    EXPECT_EQ(attrs.at("S"), "1");
    EXPECT_EQ(attrs.at("noise_level"), "0.1");
    EXPECT_EQ(attrs.at("n_trials"), "3");
    EXPECT_EQ(attrs.at("n_iter_sync"), "10");
    EXPECT_EQ(attrs.at("n_random_edges"), "2");
    EXPECT_EQ(experiment.config().sim.topology, Topology::ConnectedCaveman);
}

TEST(ExperimentTest, InvalidConfiguration) {
    ExperimentConfig cfg = smallExperiment();
    cfg.nIterSync = 30;
    EXPECT_THROW(Experiment{cfg}, ConfigurationError);

    cfg = smallExperiment();
    cfg.sim.nCaves = 1;
    EXPECT_THROW(Experiment{cfg}, ConfigurationError);

    cfg = smallExperiment();
    cfg.nTrials = 0;
    EXPECT_THROW(Experiment{cfg}, ConfigurationError);

    cfg = smallExperiment();
    cfg.sim.initialScale = 2.0;
    EXPECT_THROW(Experiment{cfg}, ConfigurationError);
}

// 4 caves of 3 on a ring leave 32 short-range candidates; 1000 cannot fit
TEST(ExperimentTest, TrialFailurePropagatesByDefault) {
    ExperimentConfig cfg = smallExperiment();
    cfg.nRandomEdges = 1000;
    Experiment experiment(cfg);
    EXPECT_THROW(experiment.run(), EdgeExhaustedError);
}

TEST(ExperimentTest, FailedTrialsCanBeSkipped) {
    ExperimentConfig cfg = smallExperiment();
    cfg.nRandomEdges = 1000;
    cfg.skipFailedTrials = true;
    const ExperimentResult result = Experiment(cfg).run();

    EXPECT_EQ(result.failures.size(), 3u);
    EXPECT_EQ(result.attrs.at("n_trials_completed"), "0");
    EXPECT_EQ(result.condition(kConditionConnected).size(), 0u);
}

TEST(ExperimentTest, HistoriesCanBeDropped) {
    ExperimentConfig cfg = smallExperiment();
    cfg.keepHistories = false;
    const ExperimentResult result = Experiment(cfg).run();

    const auto& cond = result.condition(kConditionAnyRange);
    EXPECT_TRUE(cond.histories.empty());
    EXPECT_EQ(cond.polarization.size(), 3u);
}

TEST(ExperimentTest, CancelledBeforeStartRunsNothing) {
    std::atomic<bool> cancel{true};
    const ExperimentResult result = Experiment(smallExperiment()).run(&cancel);

    EXPECT_EQ(result.attrs.at("n_trials_completed"), "0");
    EXPECT_EQ(result.attrs.at("n_trials_cancelled"), "3");
    EXPECT_EQ(result.cancelled.size(), 3u);
    EXPECT_TRUE(result.failures.empty());
}

// Trials far too long to finish are interrupted partway; none may be reported as complete
TEST(ExperimentTest, CancelledTrialsAreNotReportedComplete) {
    ExperimentConfig cfg = smallExperiment();
    cfg.sim.nCaves = 2;
    cfg.sim.nPerCave = 2;
    cfg.nTrials = 2;
    cfg.nIterations = 2000000000ULL;
    cfg.nIterSync = 1000;
    cfg.sim.sampleInterval = 1000;
    cfg.keepHistories = false;

    std::atomic<bool> cancel{false};
    std::thread stopper([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.store(true);
    });
    const ExperimentResult result = Experiment(cfg).run(&cancel);
    stopper.join();

    EXPECT_EQ(result.attrs.at("n_trials_completed"), "0");
    EXPECT_EQ(result.attrs.at("n_trials_cancelled"), "2");
    EXPECT_EQ(result.cancelled, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_TRUE(result.failures.empty());
    for (const auto& [key, cond] : result.conditions) {
        EXPECT_EQ(cond.size(), 0u) << key;
        EXPECT_TRUE(cond.polarization.empty()) << key;
    }
}
