// Simulator_test.cpp
#include "gtest/gtest.h"
#include "Simulator.h"
#include <cmath>
#include <string>
#include <type_traits>

using namespace trailsim;

static Course hillCourse() {
    // 5 km out over a 200 m hill
    std::vector<CourseSample> samples;
    for (int i = 0; i <= 500; ++i) {
        const double d = 10.0 * i;
        samples.push_back({d, 1000.0 + 200.0 * std::sin(M_PI * d / 5000.0)});
    }
    return Course(samples);
}

static SimulationConfig smallRace(const uint64_t seed) {
    SimulationConfig config;
    config.runners = 150;
    config.avgPaceMinPerKm = 9.0;
    config.stdDevPaceMinPerKm = 2.0;
    config.timeLimitHours = 2.0;
    config.waves = WaveStart{3, 3.0};
    config.cutoffs = {Cutoff::fromKmHours(2.5, 0.6)};
    config.sections = {SectionSpec::explicitRange(1.0, 1.2, 2), SectionSpec::random(10.0, 1)};
    config.seed = seed;
    return config;
}

TEST(SimulationConfig, Validate) {
    SimulationConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(config.seed.has_value());

    config.runners = -5;
    try {
        config.validate();
        FAIL() << "expected std::invalid_argument";
    }
    catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("runners"), std::string::npos);
    }

    SimulationConfig badPace;
    badPace.avgPaceMinPerKm = 0.0;
    EXPECT_THROW(badPace.validate(), std::invalid_argument);

    SimulationConfig badWaves;
    badWaves.waves.groups = 0;
    EXPECT_THROW(badWaves.validate(), std::invalid_argument);

    SimulationConfig shortLimit;
    shortLimit.timeLimitHours = 1.0 / 3600.0;
    EXPECT_THROW(shortLimit.validate(), std::invalid_argument);
}

TEST(Simulator, SameSeedSameRace) {
    const auto course = hillCourse();
    Simulator first(course, smallRace(42));
    Simulator second(course, smallRace(42));

    TrajectoryRecorder a, b;
    first.run(a);
    second.run(b);
    EXPECT_EQ(first.population().paces(), second.population().paces());
    ASSERT_EQ(first.sections().size(), second.sections().size());
    EXPECT_EQ(a.table().positions, b.table().positions);
    EXPECT_EQ(a.table().numRows(), 720u);
}

TEST(Simulator, CannotBeCopiedOrMoved) {
    // a relocated Simulator would leave its engine pointing into the old one
    EXPECT_FALSE(std::is_copy_constructible<Simulator>::value);
    EXPECT_FALSE(std::is_move_constructible<Simulator>::value);
    EXPECT_FALSE(std::is_copy_assignable<Simulator>::value);
    EXPECT_FALSE(std::is_move_assignable<Simulator>::value);
}

TEST(Simulator, DifferentSeedDifferentField) {
    const auto course = hillCourse();
    Simulator first(course, smallRace(1));
    Simulator second(course, smallRace(2));
    EXPECT_NE(first.population().paces(), second.population().paces());
}

TEST(Simulator, AssemblesTheRaceFromConfig) {
    const auto course = hillCourse();
    auto config = smallRace(9);
    config.cellWidthM = 20.0;
    config.sections = {SectionSpec::explicitRange(1.0, 1.2, 2)};
    Simulator sim(course, config);

    EXPECT_EQ(sim.population().size(), 150u);
    EXPECT_EQ(sim.population().startOffsets().back(), 360.0);
    EXPECT_EQ(sim.engine().cells().size(), 250u);
    EXPECT_EQ(sim.courseModel().capacityAt(1100.0), 2);
    EXPECT_EQ(sim.engine().totalSteps(), 720u);
    ASSERT_EQ(sim.sections().size(), 1u);
    EXPECT_DOUBLE_EQ(sim.sections()[0].startM, 1000.0);
}

TEST(Simulator, RaceOutcomeIsConsistent) {
    const auto course = hillCourse();
    Simulator sim(course, smallRace(5));
    RaceStatusCollector status;
    sim.run(status);

    const auto& last = status.counts().back();
    EXPECT_EQ(last.notStarted + last.active + last.finished + last.dnf, 150u);
    EXPECT_GT(last.finished, 0u);
    for (size_t r = 0; r < 150; ++r) {
        if (status.finalStatuses()[r] == RunnerStatus::FINISHED) {
            EXPECT_FALSE(std::isnan(status.finishTimes()[r]));
        }
        if (status.finalStatuses()[r] == RunnerStatus::DNF) {
            EXPECT_GE(status.dnfTimes()[r], 0.6 * 3600.0);
        }
    }
}

TEST(Simulator, InvalidConfigIsRejected) {
    auto config = smallRace(1);
    config.stepSec = -1.0;
    EXPECT_THROW(Simulator(hillCourse(), config), std::invalid_argument);

    auto badSection = smallRace(1);
    badSection.sections = {SectionSpec::percentage(10.0, 5.0, 1)};
    EXPECT_THROW(Simulator(hillCourse(), badSection), std::invalid_argument);
}

TEST(RunSweep, MatchesSerialRuns) {
    const auto course = hillCourse();
    std::vector<SimulationConfig> jobs;
    for (uint64_t seed = 1; seed <= 6; ++seed) {
        auto config = smallRace(seed);
        config.runners = 50 + 10 * static_cast<int>(seed);
        jobs.push_back(config);
    }

    const auto parallel = runSweep(course, jobs, 3);
    const auto serial = runSweep(course, jobs, 1);
    ASSERT_EQ(parallel.size(), jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_EQ(parallel[i].finished, serial[i].finished);
        EXPECT_EQ(parallel[i].dnf, serial[i].dnf);
        EXPECT_EQ(parallel[i].finished + parallel[i].dnf + parallel[i].unfinished,
                  static_cast<size_t>(jobs[i].runners));
        if (parallel[i].finished > 0) {
            EXPECT_LE(parallel[i].medianFinishSec, parallel[i].lastFinishSec);
        }
    }
}

TEST(RunSweep, NoFinishersGivesNaN) {
    auto config = smallRace(3);
    config.timeLimitHours = 0.05;
    const auto results = runSweep(hillCourse(), {config}, 2);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].finished, 0u);
    EXPECT_TRUE(std::isnan(results[0].medianFinishSec));
    EXPECT_TRUE(std::isnan(results[0].lastFinishSec));
}

TEST(RunSweep, ErrorsReachTheCaller) {
    const auto course = hillCourse();
    EXPECT_THROW(runSweep(course, {smallRace(1)}, 0), std::invalid_argument);

    auto bad = smallRace(2);
    bad.sections = {SectionSpec::random(10.0, 0)};
    EXPECT_THROW(runSweep(course, {smallRace(1), bad, smallRace(3)}, 2), std::invalid_argument);

    EXPECT_TRUE(runSweep(course, {}, 4).empty());
}
