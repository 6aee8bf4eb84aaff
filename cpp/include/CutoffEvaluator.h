#pragma once
/**
 * @file CutoffEvaluator.h
 * @brief Checkpoint deadlines that retire runners who are too slow.
 */
#include <vector>

#include "RunnerPopulation.h"
#include "SimulationState.h"

namespace trailsim {
    /**
     * @brief Runners must pass `distanceM` within `timeSec` of their own start.
     */
    struct Cutoff {
        double distanceM; /**< checkpoint distance (m) */
        double timeSec; /**< deadline, measured from the runner's wave start (s) */

        /**
         * @throws std::invalid_argument if either value is negative
         */
        Cutoff(double distanceM_, double timeSec_);

        /** @brief Build from race-book units. */
        static Cutoff fromKmHours(double distanceKm, double timeHours);
    };

    /**
     * @brief Applies every cutoff at a given simulated time, turning late runners into DNF.
     */
    class CutoffEvaluator {
    public:
        CutoffEvaluator() = default;

        explicit CutoffEvaluator(std::vector<Cutoff> cutoffs);

        /**
         * @brief Retire every not-yet-terminal runner that missed a personal deadline by `timeSec`.
         *
         * A runner misses cutoff c when timeSec >= c.timeSec + its start offset while its position is still
         * below c.distanceM. Cutoffs whose base time lies in the future are not examined at all.
         * @return number of runners retired by this call
         */
        size_t apply(double timeSec, const RunnerPopulation& population, SimulationState& state) const;

        const std::vector<Cutoff>& cutoffs() const noexcept { return cutoffs_; }

        bool empty() const noexcept { return cutoffs_.empty(); }

    private:
        std::vector<Cutoff> cutoffs_; /**< sorted by time */
    };
}
