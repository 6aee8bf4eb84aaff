#include "SimulationConfig.h"

#include <stdexcept>
#include <string>

using namespace trailsim;

namespace {
    void require(const bool ok, const std::string& field, const std::string& rule) {
        if (!ok) throw std::invalid_argument("SimulationConfig: " + field + " " + rule);
    }
}


void SimulationConfig::validate() const {
    require(runners >= 0, "runners", "must be >= 0");
    require(avgPaceMinPerKm > 0.0, "avgPaceMinPerKm", "must be > 0");
    require(stdDevPaceMinPerKm >= 0.0, "stdDevPaceMinPerKm", "must be >= 0");
    require(timeLimitHours > 0.0, "timeLimitHours", "must be > 0");
    require(stepSec > 0.0, "stepSec", "must be > 0");
    require(cellWidthM > 0.0, "cellWidthM", "must be > 0");
    require(waves.groups >= 1, "waves.groups", "must be >= 1");
    require(waves.intervalMinutes >= 0.0, "waves.intervalMinutes", "must be >= 0");
    require(defaultCapacity >= 1, "defaultCapacity", "must be >= 1");
    require(engineSettings().totalSteps() >= 1, "timeLimitHours", "must cover at least one step");
}

EngineSettings SimulationConfig::engineSettings() const {
    EngineSettings settings;
    settings.stepSec = stepSec;
    settings.cellWidthM = cellWidthM;
    settings.timeLimitHours = timeLimitHours;
    return settings;
}
