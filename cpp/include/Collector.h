#pragma once
/**
 * @file Collector.h
 * @brief Interfaces and implementations for collecting per-step simulation data.
 */
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "SimulationState.h"

namespace trailsim {
    /**
     * @brief Base interface for streaming data collection, fed once per recorded step.
     */
    class DataCollector {
    public:
        virtual ~DataCollector() = default;

        /**
         * @brief prepare for a new run
         * @param numRunners  runners in the field
         * @param numSteps    rows the run will produce, step 0 included
         */
        virtual void reset(size_t numRunners, size_t numSteps) = 0;

        /**
         * @brief record the state at the end of a step
         * @param step     step index, 0 is the start line
         * @param timeSec  step × step duration
         * @param state    the engine's state after the step
         */
        virtual void recordStep(size_t step, double timeSec, const SimulationState& state) = 0;

        /** @brief clone an empty collector with the same settings */
        virtual std::unique_ptr<DataCollector> clone() const = 0;
    };


    /**
     * @brief Time column plus one position column per runner, one row per step.
     */
    struct TrajectoryTable {
        std::vector<double> timeSec;
        std::vector<std::vector<double>> positions; /**< positions[row][runner] (m) */

        size_t numRows() const noexcept { return timeSec.size(); }

        size_t numRunners() const noexcept { return positions.empty() ? 0 : positions.front().size(); }
    };


    /**
     * @brief Records every runner's position at every step (or every `stride`-th step).
     */
    class TrajectoryRecorder final : public DataCollector {
    public:
        /**
         * @param stride  keep one row out of `stride`; the last step is always kept
         */
        explicit TrajectoryRecorder(size_t stride = 1);

        void reset(size_t numRunners, size_t numSteps) override;
        void recordStep(size_t step, double timeSec, const SimulationState& state) override;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<TrajectoryRecorder>(stride_);
        }

        const TrajectoryTable& table() const noexcept { return table_; }

        /**
         * @brief Export as CSV with columns runner_1 … runner_N, time_sec.
         * @throws std::runtime_error naming the file when it cannot be written
         */
        void writeCsv(const std::string& path) const;

    private:
        size_t stride_;
        size_t lastStep_ = 0;
        TrajectoryTable table_;
    };


    /**
     * @brief Runner counts per status at one step.
     */
    struct StatusCounts {
        size_t notStarted = 0;
        size_t active = 0;
        size_t finished = 0;
        size_t dnf = 0;
    };

    /**
     * @brief Per-step status counts and the time each runner finished or dropped out.
     */
    class RaceStatusCollector final : public DataCollector {
    public:
        void reset(size_t numRunners, size_t numSteps) override;
        void recordStep(size_t step, double timeSec, const SimulationState& state) override;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<RaceStatusCollector>();
        }

        const std::vector<StatusCounts>& counts() const noexcept { return counts_; }

        /** @brief finish time per runner (s), NaN when the runner never finished */
        const std::vector<double>& finishTimes() const noexcept { return finishTime_; }

        /** @brief retirement time per runner (s), NaN unless the runner became DNF */
        const std::vector<double>& dnfTimes() const noexcept { return dnfTime_; }

        /** @brief statuses as of the last recorded step */
        const std::vector<RunnerStatus>& finalStatuses() const noexcept { return lastStatus_; }

    private:
        static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
        std::vector<StatusCounts> counts_;
        std::vector<double> finishTime_;
        std::vector<double> dnfTime_;
        std::vector<RunnerStatus> lastStatus_;
    };


    /**
     * @brief Forwards every call to a list of collectors.
     *
     * Collectors handed in are shared with the caller, who reads the results from them after the run; a copy of the
     * group clones its members instead.
     */
    class DataCollectorGroup final : public DataCollector {
    public:
        DataCollectorGroup() = default;
        explicit DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors);
        DataCollectorGroup(const DataCollectorGroup& other);

        void add(std::shared_ptr<DataCollector> collector);

        void reset(size_t numRunners, size_t numSteps) override;
        void recordStep(size_t step, double timeSec, const SimulationState& state) override;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<DataCollectorGroup>(*this);
        }

        size_t size() const noexcept { return collectors_.size(); }

        const DataCollector* at(const size_t i) const { return collectors_.at(i).get(); }

    private:
        std::vector<std::shared_ptr<DataCollector>> collectors_;
    };
}
