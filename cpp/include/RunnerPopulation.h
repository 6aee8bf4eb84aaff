#pragma once
/**
 * @file RunnerPopulation.h
 * @brief Static per-runner attributes: baseline pace and wave-start offset.
 */
#include <cstddef>
#include <vector>

#include "RngEngine.h"

namespace trailsim {
    /**
     * @brief Wave-start layout: `groups` contiguous blocks of runners, `intervalMinutes` apart.
     */
    struct WaveStart {
        int groups = 1;
        double intervalMinutes = 0.0;

        /** @brief True when every runner starts at t = 0. */
        bool isMassStart() const noexcept { return groups <= 1 || intervalMinutes <= 0.0; }
    };

    /**
     * @brief The field of a race. Immutable once built.
     */
    class RunnerPopulation {
    public:
        /** Pace draws at or below this value (s/m) are drawn again. */
        static constexpr double MIN_PACE_SEC_PER_M = 0.01;

        /**
         * @brief Sample `numRunners` paces from Normal(avg, stdDev) given in min/km.
         * @param numRunners         field size
         * @param avgPaceMinPerKm    mean pace, must be > 0
         * @param stdDevPaceMinPerKm pace standard deviation, must be >= 0
         * @param waves              wave-start layout
         * @param rng                source of the pace draws
         * @throws std::invalid_argument on out-of-range arguments
         */
        RunnerPopulation(int numRunners, double avgPaceMinPerKm, double stdDevPaceMinPerKm, const WaveStart& waves,
                         RngEngine& rng);

        /**
         * @brief Use given paces (s/m) and start offsets (s), e.g. to replay a known field.
         * @throws std::invalid_argument if sizes differ, a pace is <= 0 or an offset is < 0
         */
        RunnerPopulation(std::vector<double> paceSecPerM, std::vector<double> startOffsetSec);

        size_t size() const noexcept { return pace_.size(); }

        double pace(const size_t r) const noexcept { return pace_[r]; }

        double startOffset(const size_t r) const noexcept { return startOffset_[r]; }

        const std::vector<double>& paces() const noexcept { return pace_; }

        const std::vector<double>& startOffsets() const noexcept { return startOffset_; }

        /**
         * @brief Start offsets (s) for `numRunners` runners split into ceil-divided contiguous waves.
         */
        static std::vector<double> waveOffsets(size_t numRunners, const WaveStart& waves);

    private:
        std::vector<double> pace_;
        std::vector<double> startOffset_;
    };
}
