#include "CongestionEngine.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <stdexcept>

using namespace trailsim;


size_t EngineSettings::totalSteps() const {
    return static_cast<size_t>(std::floor(timeLimitHours * 3600.0 / stepSec));
}


CongestionEngine::CongestionEngine(const CourseModel& course,
                                   const RunnerPopulation& population,
                                   const CutoffEvaluator& cutoffs,
                                   const EngineSettings& settings,
                                   const PaceModel& paceModel)
    : course_(course),
      population_(population),
      cutoffs_(cutoffs),
      settings_(settings),
      cells_(course.cells(settings.cellWidthM)),
      totalSteps_(settings.totalSteps()) {
    if (!(settings_.stepSec > 0.0)) throw std::invalid_argument("CongestionEngine: step duration must be > 0");
    if (!(settings_.timeLimitHours > 0.0)) throw std::invalid_argument("CongestionEngine: time limit must be > 0");
    if (!(settings_.clampEpsilonM > 0.0 && settings_.clampEpsilonM < settings_.cellWidthM))
        throw std::invalid_argument("CongestionEngine: clamp epsilon must lie in (0, cell width)");
    if (totalSteps_ == 0) throw std::invalid_argument("CongestionEngine: time limit is shorter than one step");

    const auto model = paceModel.clone();
    cellFactor_.reserve(cells_.size());
    for (const auto& cell : cells_) {
        const double f = model->factor(cell);
        if (!(f > 0.0)) throw std::invalid_argument("CongestionEngine: pace model returned a non-positive factor");
        cellFactor_.push_back(f);
    }

    reset();
}


void CongestionEngine::reset() {
    state_ = SimulationState(population_.size(), cells_.size());
    step_ = 0;
    order_.resize(population_.size());
    std::iota(order_.begin(), order_.end(), 0);

    startRunners(0.0);
    snapshotOccupancy();
}


void CongestionEngine::run(DataCollector& collector) {
    reset();
    collector.reset(population_.size(), totalSteps_);
    collector.recordStep(0, 0.0, state_);
    while (step())
        collector.recordStep(step_, currentTime(), state_);
}


bool CongestionEngine::step() {
    if (step_ + 1 >= totalSteps_) return false;
    ++step_;
    const double now = currentTime();

    // positions carry over from the previous step; order matters from here on
    startRunners(now);
    snapshotOccupancy();
    cutoffs_.apply(now, population_, state_);

    const auto& pos = state_.position;
    std::sort(order_.begin(), order_.end(), [&pos](const size_t a, const size_t b) {
        return pos[a] > pos[b] || (pos[a] == pos[b] && a < b);
    });

    for (const size_t r : order_) {
        if (state_.status[r] != RunnerStatus::ACTIVE) continue;
        moveRunner(r);
    }
    return true;
}


void CongestionEngine::startRunners(const double timeSec) {
    const double length = course_.length();
    for (size_t r = 0; r < state_.numRunners(); ++r) {
        if (state_.status[r] != RunnerStatus::NOT_STARTED || timeSec < population_.startOffset(r)) continue;
        state_.status[r] = state_.position[r] >= length ? RunnerStatus::FINISHED : RunnerStatus::ACTIVE;
    }
}


void CongestionEngine::snapshotOccupancy() {
    std::fill(state_.occupancy.begin(), state_.occupancy.end(), 0);
    const size_t numCells = cells_.size();
    for (size_t r = 0; r < state_.numRunners(); ++r) {
        if (isTerminal(state_.status[r])) continue;
        const auto cell = static_cast<size_t>(state_.position[r] / settings_.cellWidthM);
        if (cell < numCells) state_.occupancy[cell]++;
    }
}


void CongestionEngine::moveRunner(const size_t r) {
    const double width = settings_.cellWidthM;
    const double length = course_.length();
    const double current = state_.position[r];
    assert(current < length);

    const size_t numCells = cells_.size();
    const size_t currentCell = std::min(static_cast<size_t>(current / width), numCells - 1);
    const double pace = population_.pace(r) * cellFactor_[currentCell];
    const double ideal = current + settings_.stepSec / pace;
    const auto idealCell = static_cast<size_t>(ideal / width);

    double allowed = ideal;
    for (size_t c = currentCell + 1; c <= idealCell && c < numCells; ++c) {
        if (state_.occupancy[c] >= cells_[c].capacity) {
            allowed = cells_[c].start - settings_.clampEpsilonM;
            break;
        }
        state_.occupancy[c]++;
    }

    // a runner already inside the epsilon band must not be pushed back
    const double next = std::min(std::max(allowed, current), length);
    state_.position[r] = next;
    if (next >= length) state_.status[r] = RunnerStatus::FINISHED;
}
