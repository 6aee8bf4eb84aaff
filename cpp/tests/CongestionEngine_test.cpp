// CongestionEngine_test.cpp
#include "gtest/gtest.h"
#include "CongestionEngine.h"
#include "Collector.h"
#include <cmath>
#include <vector>

using namespace trailsim;

static Course flatCourse(const double length, const double spacing) {
    std::vector<CourseSample> samples;
    for (double d = 0.0; d < length; d += spacing)
        samples.push_back({d, 100.0});
    samples.push_back({length, 100.0});
    return Course(samples);
}

static Course slopedCourse(const double length, const double spacing, const double gradientPct) {
    std::vector<CourseSample> samples;
    for (double d = 0.0; d <= length; d += spacing)
        samples.push_back({d, 500.0 + d * gradientPct / 100.0});
    return Course(samples);
}

static EngineSettings settingsFor(const double hours) {
    EngineSettings settings;
    settings.timeLimitHours = hours;
    return settings;
}

// Checks capacity and monotonic progress after every step.
class InvariantChecker final : public DataCollector {
public:
    explicit InvariantChecker(std::vector<Cell> cells, const double width): cells_(std::move(cells)), width_(width) {}

    void reset(const size_t numRunners, size_t) override {
        prevPos_.assign(numRunners, 0.0);
        prevStatus_.assign(numRunners, RunnerStatus::NOT_STARTED);
        steps = 0;
    }

    void recordStep(const size_t step, double, const SimulationState& state) override {
        std::vector<int> active(cells_.size(), 0);
        for (size_t r = 0; r < state.numRunners(); ++r) {
            if (state.status[r] == RunnerStatus::ACTIVE) {
                const auto c = static_cast<size_t>(state.position[r] / width_);
                if (c < active.size()) active[c]++;
            }
            EXPECT_GE(state.position[r], prevPos_[r]) << "runner " << r << " moved back at step " << step;
            if (isTerminal(prevStatus_[r])) {
                EXPECT_EQ(state.position[r], prevPos_[r]) << "terminal runner " << r << " moved at step " << step;
                EXPECT_EQ(state.status[r], prevStatus_[r]);
            }
            prevPos_[r] = state.position[r];
            prevStatus_[r] = state.status[r];
        }
        for (size_t c = 0; c < cells_.size(); ++c)
            EXPECT_LE(active[c], cells_[c].capacity) << "cell " << c << " over capacity at step " << step;
        steps++;
    }

    std::unique_ptr<DataCollector> clone() const override { return std::make_unique<InvariantChecker>(*this); }

    size_t steps = 0;

private:
    std::vector<Cell> cells_;
    double width_;
    std::vector<double> prevPos_;
    std::vector<RunnerStatus> prevStatus_;
};


TEST(CongestionEngine, SingleRunnerMovesAtBaselinePace) {
    const CourseModel course(flatCourse(1000.0, 10.0), {});
    const RunnerPopulation field({0.5}, {0.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));

    TrajectoryRecorder recorder;
    engine.run(recorder);
    const auto& table = recorder.table();

    ASSERT_EQ(table.numRows(), 90u);
    for (size_t t = 0; t < table.numRows(); ++t) {
        EXPECT_DOUBLE_EQ(table.timeSec[t], 10.0 * t);
        EXPECT_DOUBLE_EQ(table.positions[t][0], std::min(t * 10.0 / 0.5, 1000.0)) << "step " << t;
    }
    EXPECT_EQ(engine.state().status[0], RunnerStatus::FINISHED);
}

TEST(CongestionEngine, SingleRunnerWithInexactPace) {
    const CourseModel course(flatCourse(1000.0, 10.0), {});
    const RunnerPopulation field({0.6}, {0.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));

    TrajectoryRecorder recorder;
    engine.run(recorder);
    for (size_t t = 0; t < recorder.table().numRows(); ++t)
        EXPECT_NEAR(recorder.table().positions[t][0], std::min(t * 10.0 / 0.6, 1000.0), 1e-9) << "step " << t;
}

TEST(CongestionEngine, FinishClampsAndFreezes) {
    const CourseModel course(flatCourse(1000.0, 10.0), {});
    const RunnerPopulation field({0.45}, {0.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));

    TrajectoryRecorder recorder;
    RaceStatusCollector status;
    DataCollectorGroup group({
        std::shared_ptr<DataCollector>(&recorder, [](DataCollector*) {}),
        std::shared_ptr<DataCollector>(&status, [](DataCollector*) {})
    });
    engine.run(group);

    // 10 / 0.45 = 22.2 m per step, 1000 m is first reached on step 45
    const auto& rows = recorder.table().positions;
    EXPECT_LT(rows[44][0], 1000.0);
    for (size_t t = 45; t < rows.size(); ++t)
        EXPECT_EQ(rows[t][0], 1000.0) << "step " << t;
    EXPECT_DOUBLE_EQ(status.finishTimes()[0], 450.0);
}

TEST(CongestionEngine, BottleneckGoesToLeaderFirst) {
    // cell [500, 510) is the only one with capacity 1
    const CourseModel course(flatCourse(1000.0, 5.0), {{500.0, 509.0, 1}});
    // A: 10 m/step from t=0. B: 40 m/step from t=380 s; at step 50 A goes 490 -> 500 and B 480 -> 520
    const RunnerPopulation field({1.0, 0.25}, {0.0, 380.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));
    ASSERT_EQ(engine.cells()[49].capacity, CourseModel::DEFAULT_CAPACITY);
    ASSERT_EQ(engine.cells()[50].capacity, 1);
    ASSERT_EQ(engine.cells()[51].capacity, CourseModel::DEFAULT_CAPACITY);

    TrajectoryRecorder recorder;
    engine.run(recorder);
    const auto& rows = recorder.table().positions;

    EXPECT_DOUBLE_EQ(rows[49][0], 490.0);
    EXPECT_DOUBLE_EQ(rows[49][1], 480.0);

    EXPECT_DOUBLE_EQ(rows[50][0], 500.0);
    EXPECT_DOUBLE_EQ(rows[50][1], 500.0 - 0.01);

    // A is still inside the cell at the start of step 51
    EXPECT_DOUBLE_EQ(rows[51][0], 510.0);
    EXPECT_DOUBLE_EQ(rows[51][1], 500.0 - 0.01);

    EXPECT_DOUBLE_EQ(rows[52][0], 520.0);
    EXPECT_NEAR(rows[52][1], 540.0 - 0.01, 1e-9);
}

TEST(CongestionEngine, WithoutBottleneckFollowerIsNotHeld) {
    const CourseModel course(flatCourse(1000.0, 5.0), {});
    const RunnerPopulation field({1.0, 0.25}, {0.0, 380.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));
    TrajectoryRecorder recorder;
    engine.run(recorder);

    EXPECT_DOUBLE_EQ(recorder.table().positions[50][1], 520.0);
}

TEST(CongestionEngine, EqualPositionsFavourLowerRunnerIndex) {
    const CourseModel course(flatCourse(1000.0, 5.0), {{500.0, 509.0, 1}});
    const RunnerPopulation field({1.0, 1.0}, {0.0, 0.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.25));
    TrajectoryRecorder recorder;
    engine.run(recorder);
    const auto& rows = recorder.table().positions;

    EXPECT_DOUBLE_EQ(rows[49][0], 490.0);
    EXPECT_DOUBLE_EQ(rows[49][1], 490.0);
    EXPECT_DOUBLE_EQ(rows[50][0], 500.0);
    EXPECT_DOUBLE_EQ(rows[50][1], 499.99);
    EXPECT_DOUBLE_EQ(rows[51][1], 499.99);
    EXPECT_DOUBLE_EQ(rows[52][1], 509.99);
}

TEST(CongestionEngine, CapacityAndProgressInvariantsHold) {
    const CourseModel course(flatCourse(3000.0, 10.0), {{500.0, 800.0, 2}, {1500.0, 1520.0, 1}});
    RngEngine rng(7);
    const RunnerPopulation field(200, 10.0, 2.0, WaveStart{4, 2.0}, rng);
    const CutoffEvaluator cutoffs({Cutoff::fromKmHours(1.0, 0.15)});
    CongestionEngine engine(course, field, cutoffs, settingsFor(1.5));

    InvariantChecker checker(engine.cells(), CourseModel::DEFAULT_CELL_WIDTH);
    engine.run(checker);
    EXPECT_EQ(checker.steps, engine.totalSteps());

    size_t dnf = 0, finished = 0;
    for (const auto s : engine.state().status) {
        dnf += s == RunnerStatus::DNF;
        finished += s == RunnerStatus::FINISHED;
    }
    EXPECT_GT(dnf, 0u);
    EXPECT_GT(finished, 0u);
}

TEST(CongestionEngine, CutoffRetiresSlowRunners) {
    const CourseModel course(flatCourse(20000.0, 10.0), {});
    // 16.7 m/step and 5.6 m/step
    const RunnerPopulation field({0.6, 1.8}, {0.0, 0.0});
    const CutoffEvaluator cutoffs({Cutoff::fromKmHours(5.0, 2.0)});
    CongestionEngine engine(course, field, cutoffs, settingsFor(3.0));

    TrajectoryRecorder recorder;
    RaceStatusCollector status;
    DataCollectorGroup group({
        std::shared_ptr<DataCollector>(&recorder, [](DataCollector*) {}),
        std::shared_ptr<DataCollector>(&status, [](DataCollector*) {})
    });
    engine.run(group);
    const auto& rows = recorder.table().positions;

    EXPECT_LT(rows[720][1], 5000.0);
    EXPECT_DOUBLE_EQ(status.dnfTimes()[1], 7200.0);
    for (size_t t = 720; t < rows.size(); ++t)
        EXPECT_EQ(rows[t][1], rows[719][1]) << "step " << t;

    EXPECT_TRUE(std::isnan(status.dnfTimes()[0]));
    EXPECT_GT(rows.back()[0], rows[720][0]);
    EXPECT_EQ(engine.state().status[0], RunnerStatus::ACTIVE);
    EXPECT_EQ(engine.state().status[1], RunnerStatus::DNF);
}

TEST(CongestionEngine, CutoffDeadlineFollowsWaveOffset) {
    const CourseModel course(flatCourse(20000.0, 10.0), {});
    const RunnerPopulation field({1.8, 1.8}, {0.0, 1800.0});
    const CutoffEvaluator cutoffs({Cutoff::fromKmHours(5.0, 2.0)});
    CongestionEngine engine(course, field, cutoffs, settingsFor(3.0));

    RaceStatusCollector status;
    engine.run(status);

    EXPECT_DOUBLE_EQ(status.dnfTimes()[0], 7200.0);
    EXPECT_DOUBLE_EQ(status.dnfTimes()[1], 9000.0);
}

TEST(CongestionEngine, RunnersWaitForTheirWave) {
    const CourseModel course(flatCourse(2000.0, 10.0), {});
    const RunnerPopulation field({0.5, 0.5}, {0.0, 600.0});
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(0.5));

    TrajectoryRecorder recorder;
    engine.run(recorder);
    const auto& rows = recorder.table().positions;

    EXPECT_EQ(rows[59][1], 0.0);
    EXPECT_DOUBLE_EQ(rows[60][1], 20.0);
    EXPECT_DOUBLE_EQ(rows[61][1], 40.0);
}

TEST(CongestionEngine, UphillSlowsAndDownhillSpeedsUp) {
    const RunnerPopulation field({0.5}, {0.0});

    const CourseModel up(slopedCourse(1000.0, 5.0, 10.0), {});
    CongestionEngine climb(up, field, CutoffEvaluator(), settingsFor(0.1));
    EXPECT_NEAR(climb.cellPaceFactors()[0], 1.2, 1e-9);
    climb.step();
    EXPECT_NEAR(climb.state().position[0], 10.0 / (0.5 * 1.2), 1e-6);

    const CourseModel down(slopedCourse(1000.0, 5.0, -10.0), {});
    CongestionEngine descent(down, field, CutoffEvaluator(), settingsFor(0.1));
    EXPECT_NEAR(descent.cellPaceFactors()[10], 0.9, 1e-9);
    descent.step();
    EXPECT_NEAR(descent.state().position[0], 10.0 / (0.5 * 0.9), 1e-6);

    const CourseModel cliff(slopedCourse(1000.0, 5.0, -150.0), {});
    CongestionEngine drop(cliff, field, CutoffEvaluator(), settingsFor(0.1));
    EXPECT_DOUBLE_EQ(drop.cellPaceFactors()[3], GradientPaceModel::MIN_FACTOR);
}

TEST(CongestionEngine, StepStopsAtTimeLimit) {
    const CourseModel course(flatCourse(1000.0, 10.0), {});
    const RunnerPopulation field({0.5}, {0.0});
    EngineSettings settings;
    settings.timeLimitHours = 0.01; // 36 s -> 3 rows
    CongestionEngine engine(course, field, CutoffEvaluator(), settings);

    EXPECT_EQ(engine.totalSteps(), 3u);
    EXPECT_TRUE(engine.step());
    EXPECT_TRUE(engine.step());
    EXPECT_FALSE(engine.step());
    EXPECT_EQ(engine.currentStep(), 2u);
    EXPECT_DOUBLE_EQ(engine.currentTime(), 20.0);
    EXPECT_DOUBLE_EQ(engine.state().position[0], 40.0);

    engine.reset();
    EXPECT_EQ(engine.currentStep(), 0u);
    EXPECT_EQ(engine.state().position[0], 0.0);
}

TEST(CongestionEngine, RunsAreReproducible) {
    const CourseModel course(flatCourse(3000.0, 10.0), {{1000.0, 1200.0, 1}});
    RngEngine rng(11);
    const RunnerPopulation field(100, 9.0, 2.0, WaveStart{}, rng);
    CongestionEngine engine(course, field, CutoffEvaluator(), settingsFor(1.0));

    TrajectoryRecorder first, second;
    engine.run(first);
    engine.run(second);
    EXPECT_EQ(first.table().positions, second.table().positions);
}

TEST(CongestionEngine, RejectsBadSettings) {
    const CourseModel course(flatCourse(1000.0, 10.0), {});
    const RunnerPopulation field({0.5}, {0.0});

    EngineSettings noStep;
    noStep.stepSec = 0.0;
    EXPECT_THROW(CongestionEngine(course, field, CutoffEvaluator(), noStep), std::invalid_argument);

    EngineSettings noCell;
    noCell.cellWidthM = -1.0;
    EXPECT_THROW(CongestionEngine(course, field, CutoffEvaluator(), noCell), std::invalid_argument);

    EngineSettings tooShort;
    tooShort.timeLimitHours = 1.0 / 3600.0;
    EXPECT_THROW(CongestionEngine(course, field, CutoffEvaluator(), tooShort), std::invalid_argument);
}
