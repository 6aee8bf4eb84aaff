#include "RunnerPopulation.h"

#include <stdexcept>
#include <string>

using namespace trailsim;


RunnerPopulation::RunnerPopulation(const int numRunners, const double avgPaceMinPerKm,
                                   const double stdDevPaceMinPerKm, const WaveStart& waves, RngEngine& rng) {
    if (numRunners < 0) throw std::invalid_argument("RunnerPopulation: number of runners must be >= 0");
    if (!(avgPaceMinPerKm > 0.0)) throw std::invalid_argument("RunnerPopulation: average pace must be > 0");
    if (!(stdDevPaceMinPerKm >= 0.0))
        throw std::invalid_argument("RunnerPopulation: pace standard deviation must be >= 0");

    const double mean = avgPaceMinPerKm * 60.0 / 1000.0;
    if (mean <= MIN_PACE_SEC_PER_M)
        throw std::invalid_argument("RunnerPopulation: average pace is faster than the minimum pace");
    const double stddev = stdDevPaceMinPerKm * 60.0 / 1000.0;

    pace_.reserve(numRunners);
    for (int i = 0; i < numRunners; ++i) {
        double p = rng.normal(mean, stddev);
        while (p <= MIN_PACE_SEC_PER_M) p = rng.normal(mean, stddev);
        pace_.push_back(p);
    }
    startOffset_ = waveOffsets(pace_.size(), waves);
}

RunnerPopulation::RunnerPopulation(std::vector<double> paceSecPerM, std::vector<double> startOffsetSec)
    : pace_(std::move(paceSecPerM)), startOffset_(std::move(startOffsetSec)) {
    if (pace_.size() != startOffset_.size())
        throw std::invalid_argument("RunnerPopulation: got " + std::to_string(pace_.size()) + " paces but " +
            std::to_string(startOffset_.size()) + " start offsets");
    for (size_t r = 0; r < pace_.size(); ++r) {
        if (!(pace_[r] > 0.0))
            throw std::invalid_argument("RunnerPopulation: pace of runner " + std::to_string(r) + " must be > 0");
        if (!(startOffset_[r] >= 0.0))
            throw std::invalid_argument(
                "RunnerPopulation: start offset of runner " + std::to_string(r) + " must be >= 0");
    }
}


std::vector<double> RunnerPopulation::waveOffsets(const size_t numRunners, const WaveStart& waves) {
    std::vector<double> offsets(numRunners, 0.0);
    if (waves.isMassStart() || numRunners == 0) return offsets;

    const auto groups = static_cast<size_t>(waves.groups);
    const size_t perWave = (numRunners + groups - 1) / groups;
    for (size_t i = 0; i < numRunners; ++i)
        offsets[i] = static_cast<double>(i / perWave) * waves.intervalMinutes * 60.0;
    return offsets;
}
