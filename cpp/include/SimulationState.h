#pragma once
/**
 * @file SimulationState.h
 * @brief Mutable arrays of one simulation run.
 */
#include <cstddef>
#include <vector>

#include "RunnerStatus.h"

namespace trailsim {
    /**
     * @brief Positions, statuses and per-cell occupancy counters, indexed by runner and cell.
     *
     * Owned by a single CongestionEngine for the duration of a run; collectors only read it.
     */
    struct SimulationState {
        std::vector<double> position; /**< metres from the start */
        std::vector<RunnerStatus> status;
        std::vector<int> occupancy; /**< runners counted in each cell during the current step */

        SimulationState() = default;

        SimulationState(const size_t numRunners, const size_t numCells)
            : position(numRunners, 0.0), status(numRunners, RunnerStatus::NOT_STARTED), occupancy(numCells, 0) {}

        size_t numRunners() const noexcept { return position.size(); }
    };
}
