#include "Collector.h"
#include <cassert>
#include <fstream>
#include <stdexcept>

using namespace trailsim;

// TrajectoryRecorder
TrajectoryRecorder::TrajectoryRecorder(const size_t stride): stride_(stride) {
    if (stride_ == 0) throw std::invalid_argument("TrajectoryRecorder: stride must be >= 1");
}

void TrajectoryRecorder::reset(size_t, const size_t numSteps) {
    table_.timeSec.clear();
    table_.positions.clear();
    lastStep_ = numSteps == 0 ? 0 : numSteps - 1;

    const size_t rows = (numSteps + stride_ - 1) / stride_ + 1;
    table_.timeSec.reserve(rows);
    table_.positions.reserve(rows);
}

void TrajectoryRecorder::recordStep(const size_t step, const double timeSec, const SimulationState& state) {
    if (step % stride_ != 0 && step != lastStep_) return;
    table_.timeSec.push_back(timeSec);
    table_.positions.push_back(state.position);
}

void TrajectoryRecorder::writeCsv(const std::string& path) const {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("TrajectoryRecorder: cannot open '" + path + "' for writing");

    const size_t n = table_.numRunners();
    for (size_t r = 0; r < n; ++r)
        out << "runner_" << r + 1 << ',';
    out << "time_sec\n";

    out.precision(10);
    for (size_t row = 0; row < table_.numRows(); ++row) {
        for (const double p : table_.positions[row])
            out << p << ',';
        out << table_.timeSec[row] << '\n';
    }

    if (!out) throw std::runtime_error("TrajectoryRecorder: write to '" + path + "' failed");
}


// RaceStatusCollector
void RaceStatusCollector::reset(const size_t numRunners, const size_t numSteps) {
    counts_.clear();
    counts_.reserve(numSteps);
    finishTime_.assign(numRunners, NaN);
    dnfTime_.assign(numRunners, NaN);
    lastStatus_.assign(numRunners, RunnerStatus::NOT_STARTED);
}

void RaceStatusCollector::recordStep(size_t, const double timeSec, const SimulationState& state) {
    assert(state.numRunners() == lastStatus_.size());

    StatusCounts c;
    for (size_t r = 0; r < state.numRunners(); ++r) {
        const auto status = state.status[r];
        switch (status) {
        case RunnerStatus::NOT_STARTED: c.notStarted++;
            break;
        case RunnerStatus::ACTIVE: c.active++;
            break;
        case RunnerStatus::FINISHED: c.finished++;
            if (lastStatus_[r] != RunnerStatus::FINISHED) finishTime_[r] = timeSec;
            break;
        case RunnerStatus::DNF: c.dnf++;
            if (lastStatus_[r] != RunnerStatus::DNF) dnfTime_[r] = timeSec;
            break;
        }
        lastStatus_[r] = status;
    }
    counts_.push_back(c);
}


//DataCollectorGroup
DataCollectorGroup::DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors):
    collectors_(collectors) {}

DataCollectorGroup::DataCollectorGroup(const DataCollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}

void DataCollectorGroup::add(std::shared_ptr<DataCollector> collector) {
    collectors_.push_back(std::move(collector));
}

void DataCollectorGroup::reset(const size_t numRunners, const size_t numSteps) {
    for (const auto& collector : collectors_)
        collector->reset(numRunners, numSteps);
}

void DataCollectorGroup::recordStep(const size_t step, const double timeSec, const SimulationState& state) {
    for (const auto& collector : collectors_)
        collector->recordStep(step, timeSec, state);
}
