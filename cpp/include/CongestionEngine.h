#pragma once
#include "Collector.h"
#include "CourseModel.h"
#include "CutoffEvaluator.h"
#include "PaceModel.h"
#include "RunnerPopulation.h"
#include "SimulationState.h"

#include <memory>
#include <vector>

namespace trailsim {
    /**
     * @brief Clock and discretization of one run.
     */
    struct EngineSettings {
        double stepSec = 10.0; /**< simulated seconds per step */
        double cellWidthM = CourseModel::DEFAULT_CELL_WIDTH;
        double timeLimitHours = 24.0;
        double clampEpsilonM = 0.01; /**< a blocked runner stops this far before the full cell */

        /** @brief rows of the trajectory, step 0 included: timeLimit × 3600 / stepSec */
        size_t totalSteps() const;
    };

    /**
     * @brief Discrete-time, capacity-constrained stepper for one race.
     *
     * Each step takes a fresh occupancy snapshot, applies the cutoffs, then moves runners one at a time in
     * descending position order (ties: lower runner index first). A runner claims every cell it enters; a cell
     * already at capacity stops it just before that cell. The course model and the population are borrowed and
     * must outlive the engine.
     */
    class CongestionEngine {
    public:
        /**
         * @param course      course with capacities
         * @param population  the field
         * @param cutoffs     retirement rules
         * @param settings    clock and cell size
         * @param paceModel   terrain pace factor, evaluated once per cell here
         * @throws std::invalid_argument on non-positive step, cell width or time limit
         */
        CongestionEngine(const CourseModel& course,
                         const RunnerPopulation& population,
                         const CutoffEvaluator& cutoffs,
                         const EngineSettings& settings,
                         const PaceModel& paceModel = GradientPaceModel());

        /** @brief Back to step 0: everyone on the start line. */
        void reset();

        /**
         * @brief Advance one step.
         * @return false, without changing anything, once the last step has been reached
         */
        bool step();

        /** @brief Reset, then run every step, feeding step 0 and each following step to `collector`. */
        void run(DataCollector& collector);

        const SimulationState& state() const noexcept { return state_; }

        const std::vector<Cell>& cells() const noexcept { return cells_; }

        /** @brief pace factor used on each cell */
        const std::vector<double>& cellPaceFactors() const noexcept { return cellFactor_; }

        size_t totalSteps() const noexcept { return totalSteps_; }

        size_t currentStep() const noexcept { return step_; }

        double currentTime() const noexcept { return static_cast<double>(step_) * settings_.stepSec; }

    private:
        // Configuration
        const CourseModel& course_;
        const RunnerPopulation& population_;
        const CutoffEvaluator cutoffs_;
        const EngineSettings settings_;
        const std::vector<Cell> cells_;
        std::vector<double> cellFactor_;
        const size_t totalSteps_;

        // Run state
        SimulationState state_;
        size_t step_ = 0;
        std::vector<size_t> order_;

        void startRunners(double timeSec);

        void snapshotOccupancy();

        void moveRunner(size_t r);
    };
}
