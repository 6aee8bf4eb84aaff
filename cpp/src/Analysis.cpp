#include "Analysis.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace trailsim;

namespace {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    size_t nearestRow(const std::vector<double>& times, const double timeSec) {
        size_t best = 0;
        for (size_t i = 1; i < times.size(); ++i)
            if (std::abs(times[i] - timeSec) < std::abs(times[best] - timeSec)) best = i;
        return best;
    }
}


std::vector<double> trailsim::passageTimes(const TrajectoryTable& table, const double distanceM) {
    const size_t n = table.numRunners();
    std::vector<double> times(n, NaN);
    size_t remaining = n;
    for (size_t row = 0; row < table.numRows() && remaining > 0; ++row) {
        const auto& positions = table.positions[row];
        for (size_t r = 0; r < n; ++r) {
            if (std::isnan(times[r]) && positions[r] >= distanceM) {
                times[r] = table.timeSec[row];
                --remaining;
            }
        }
    }
    return times;
}


double trailsim::peakPassageTime(const std::vector<double>& times, const int bins) {
    if (bins < 1) throw std::invalid_argument("peakPassageTime: bins must be >= 1");

    std::vector<double> finite;
    for (const double t : times)
        if (std::isfinite(t)) finite.push_back(t);
    if (finite.empty()) return NaN;

    const auto [loIt, hiIt] = std::minmax_element(finite.begin(), finite.end());
    double lo = *loIt, hi = *hiIt;
    if (hi == lo) {
        // degenerate range, widened the way numpy.histogram does
        lo -= 0.5;
        hi += 0.5;
    }

    std::vector<long> hist(bins, 0);
    for (const double t : finite) {
        const int bin = std::min(static_cast<int>((t - lo) / (hi - lo) * bins), bins - 1);
        hist[bin] += 1;
    }

    const auto peak = std::max_element(hist.begin(), hist.end()) - hist.begin();
    const double width = (hi - lo) / bins;
    return lo + (static_cast<double>(peak) + 0.5) * width;
}


Snapshot trailsim::snapshot(const TrajectoryTable& table, const double courseLengthM, const double timeSec,
                            const int bins, const std::vector<double>& dnfTimes) {
    if (table.numRows() == 0) throw std::invalid_argument("snapshot: trajectory table is empty");
    if (bins < 1) throw std::invalid_argument("snapshot: bins must be >= 1");
    if (!dnfTimes.empty() && dnfTimes.size() != table.numRunners())
        throw std::invalid_argument("snapshot: dnfTimes must hold one entry per runner");

    const size_t row = nearestRow(table.timeSec, timeSec);
    const auto& positions = table.positions[row];
    const auto& finalPositions = table.positions.back();

    Snapshot snap;
    snap.timeSec = table.timeSec[row];
    snap.binWidthM = courseLengthM / bins;
    snap.histogram.assign(bins, 0);

    double sum = 0.0;
    for (size_t r = 0; r < positions.size(); ++r) {
        const double p = positions[r];
        if (p >= courseLengthM) {
            snap.finished++;
            continue;
        }

        const bool isDnf = dnfTimes.empty() ? p == finalPositions[r] : dnfTimes[r] <= snap.timeSec;
        if (isDnf) {
            snap.dnf++;
            continue;
        }

        snap.active++;
        sum += p;
        if (courseLengthM > 0.0) {
            const int bin = std::clamp(static_cast<int>(p / courseLengthM * bins), 0, bins - 1);
            snap.histogram[bin] += 1;
        }
    }
    snap.meanActivePositionM = snap.active > 0 ? sum / static_cast<double>(snap.active) : 0.0;
    return snap;
}


std::vector<GeoPoint> trailsim::geoPositions(const TrajectoryTable& table, const Course& course, const size_t row) {
    const auto& positions = table.positions.at(row);
    std::vector<GeoPoint> points;
    points.reserve(positions.size());
    for (const double p : positions)
        points.push_back(course.locate(p));
    return points;
}
