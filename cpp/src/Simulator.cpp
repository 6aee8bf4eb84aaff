#include "Simulator.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <thread>

using namespace trailsim;

namespace {
    const SimulationConfig& validated(const SimulationConfig& config) {
        config.validate();
        return config;
    }

    RunSummary summarize(const RaceStatusCollector& status) {
        RunSummary summary;
        if (!status.counts().empty()) {
            const auto& last = status.counts().back();
            summary.finished = last.finished;
            summary.dnf = last.dnf;
            summary.unfinished = last.active + last.notStarted;
        }

        std::vector<double> times;
        for (const double t : status.finishTimes())
            if (!std::isnan(t)) times.push_back(t);

        if (times.empty()) {
            summary.medianFinishSec = std::numeric_limits<double>::quiet_NaN();
            summary.lastFinishSec = std::numeric_limits<double>::quiet_NaN();
            return summary;
        }
        std::sort(times.begin(), times.end());
        const size_t mid = times.size() / 2;
        summary.medianFinishSec = times.size() % 2 ? times[mid] : (times[mid - 1] + times[mid]) / 2.0;
        summary.lastFinishSec = times.back();
        return summary;
    }
}


Simulator::Simulator(const Course& course, const SimulationConfig& config, const PaceModel& paceModel)
    : config_(validated(config)),
      rng_(config_.seed ? *config_.seed : RngEngine::defaultSeed()),
      sections_(resolveSections(config_.sections, course.length(), rng_)),
      courseModel_(course, sections_, config_.defaultCapacity),
      population_(config_.runners, config_.avgPaceMinPerKm, config_.stdDevPaceMinPerKm, config_.waves, rng_) {
    engine_ = std::make_unique<CongestionEngine>(courseModel_, population_, CutoffEvaluator(config_.cutoffs),
                                                 config_.engineSettings(), paceModel);
}


void Simulator::run(DataCollector& collector) {
    engine_->run(collector);
}


std::vector<RunSummary> trailsim::runSweep(const Course& course, const std::vector<SimulationConfig>& jobs,
                                           const int maxWorkers, const PaceModel& paceModel) {
    if (maxWorkers < 1) throw std::invalid_argument("runSweep: maxWorkers must be >= 1");
    for (const auto& job : jobs) job.validate();

    std::vector<RunSummary> results(jobs.size());
    std::vector<std::exception_ptr> errors(jobs.size());
    std::atomic<size_t> nextJob{0};

    const int nWorkers = std::min<int>(maxWorkers, static_cast<int>(std::max<size_t>(jobs.size(), 1)));
    std::vector<std::thread> workers;
    workers.reserve(nWorkers);
    for (int i = 0; i < nWorkers; ++i) {
        workers.emplace_back([&] {
            while (true) {
                const size_t jobIdx = nextJob.fetch_add(1, std::memory_order_relaxed);
                if (jobIdx >= jobs.size()) break;
                try {
                    Simulator simulator(course, jobs[jobIdx], paceModel);
                    RaceStatusCollector status;
                    simulator.run(status);
                    results[jobIdx] = summarize(status);
                }
                catch (...) {
                    errors[jobIdx] = std::current_exception();
                }
            }
        });
    }

    for (auto& worker : workers) worker.join();
    for (const auto& error : errors)
        if (error) std::rethrow_exception(error);
    return results;
}
