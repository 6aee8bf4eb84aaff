#pragma once
#include "Collector.h"
#include "CongestionEngine.h"
#include "Course.h"
#include "CourseModel.h"
#include "PaceModel.h"
#include "RngEngine.h"
#include "RunnerPopulation.h"
#include "SimulationConfig.h"

#include <memory>
#include <vector>

namespace trailsim {
    /**
     * @brief Builds course capacities, the field and the engine from one SimulationConfig, then runs it.
     */
    class Simulator {
    public:
        /**
         * @param course     course profile, copied
         * @param config     run parameters, validated here
         * @param paceModel  terrain pace factor
         * @throws std::invalid_argument if the config or its sections are invalid; nothing is built in that case
         */
        Simulator(const Course& course, const SimulationConfig& config,
                  const PaceModel& paceModel = GradientPaceModel());

        // the engine refers to courseModel_ and population_
        Simulator(const Simulator&) = delete;
        Simulator& operator=(const Simulator&) = delete;

        /** @brief Run the whole race, feeding every step to `collector`. */
        void run(DataCollector& collector);

        const CourseModel& courseModel() const noexcept { return courseModel_; }

        const RunnerPopulation& population() const noexcept { return population_; }

        /** @brief the single-track ranges the sections resolved to */
        const std::vector<CapacityRange>& sections() const noexcept { return sections_; }

        const CongestionEngine& engine() const noexcept { return *engine_; }

    private:
        const SimulationConfig config_;
        RngEngine rng_;
        const std::vector<CapacityRange> sections_;
        const CourseModel courseModel_;
        const RunnerPopulation population_;
        std::unique_ptr<CongestionEngine> engine_;
    };


    /**
     * @brief Outcome of one sweep job.
     */
    struct RunSummary {
        size_t finished = 0;
        size_t dnf = 0;
        size_t unfinished = 0; /**< still on course (or never started) at the time limit */
        double medianFinishSec = 0.0; /**< NaN without finishers */
        double lastFinishSec = 0.0; /**< NaN without finishers */
    };

    /**
     * @brief Run independent simulations of `course` on up to `maxWorkers` threads.
     *
     * Each job gets its own CourseModel, field, engine and collectors; results come back in job order. The
     * first exception thrown by any job is rethrown after all workers have stopped.
     */
    std::vector<RunSummary> runSweep(const Course& course, const std::vector<SimulationConfig>& jobs, int maxWorkers,
                                     const PaceModel& paceModel = GradientPaceModel());
}
