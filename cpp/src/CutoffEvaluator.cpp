#include "CutoffEvaluator.h"

#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace trailsim;

// Cutoff
Cutoff::Cutoff(const double distanceM_, const double timeSec_): distanceM(distanceM_), timeSec(timeSec_) {
    if (!(distanceM >= 0.0)) throw std::invalid_argument("Cutoff: distance must be >= 0");
    if (!(timeSec >= 0.0)) throw std::invalid_argument("Cutoff: time must be >= 0");
}

Cutoff Cutoff::fromKmHours(const double distanceKm, const double timeHours) {
    return {distanceKm * 1000.0, timeHours * 3600.0};
}


// CutoffEvaluator
CutoffEvaluator::CutoffEvaluator(std::vector<Cutoff> cutoffs): cutoffs_(std::move(cutoffs)) {
    std::stable_sort(cutoffs_.begin(), cutoffs_.end(), [](auto const& a, auto const& b) { return a.timeSec < b.timeSec; });
}

size_t CutoffEvaluator::apply(const double timeSec, const RunnerPopulation& population, SimulationState& state) const {
    assert(population.size() == state.numRunners());

    size_t retired = 0;
    for (const auto& cutoff : cutoffs_) {
        if (timeSec < cutoff.timeSec) break;

        for (size_t r = 0; r < state.numRunners(); ++r) {
            if (isTerminal(state.status[r])) continue;
            if (timeSec < cutoff.timeSec + population.startOffset(r)) continue;
            if (state.position[r] < cutoff.distanceM) {
                state.status[r] = RunnerStatus::DNF;
                ++retired;
            }
        }
    }
    return retired;
}
