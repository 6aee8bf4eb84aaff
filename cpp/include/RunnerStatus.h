#pragma once
/**
 * @file RunnerStatus.h
 * @brief Lifecycle of a runner during one simulated race.
 */

/**
 * @brief Finished and DNF are terminal: the runner's position never changes again.
 */
namespace trailsim {
    enum class RunnerStatus: int { NOT_STARTED, ACTIVE, FINISHED, DNF };

    inline bool isTerminal(const RunnerStatus status) noexcept {
        return status == RunnerStatus::FINISHED || status == RunnerStatus::DNF;
    }
}
