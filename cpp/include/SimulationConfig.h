#pragma once
/**
 * @file SimulationConfig.h
 * @brief Every parameter of one simulated race, with the defaults of the race-planning tools.
 */
#include <cstdint>
#include <optional>
#include <vector>

#include "CongestionEngine.h"
#include "CutoffEvaluator.h"
#include "RunnerPopulation.h"
#include "SectionSpec.h"

namespace trailsim {
    /**
     * @brief Plain parameter set; validate() before use.
     */
    struct SimulationConfig {
        int runners = 500;
        double avgPaceMinPerKm = 10.0;
        double stdDevPaceMinPerKm = 1.5;
        double timeLimitHours = 24.0;
        double stepSec = 10.0;
        double cellWidthM = CourseModel::DEFAULT_CELL_WIDTH;
        WaveStart waves; /**< mass start by default */
        std::vector<Cutoff> cutoffs;
        std::vector<SectionSpec> sections; /**< applied in order on top of defaultCapacity */
        int defaultCapacity = CourseModel::DEFAULT_CAPACITY;
        std::optional<uint64_t> seed; /**< unset => RngEngine::defaultSeed(), i.e. not reproducible */

        /**
         * @brief Check every field.
         * @throws std::invalid_argument naming the first bad field
         */
        void validate() const;

        EngineSettings engineSettings() const;
    };
}
