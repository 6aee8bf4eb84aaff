#include "CourseModel.h"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace trailsim;


CourseModel::CourseModel(Course course, const std::vector<CapacityRange>& ranges, const int defaultCapacity)
    : course_(std::move(course)), capacity_(course_.size(), defaultCapacity) {
    if (defaultCapacity < 1) throw std::invalid_argument("CourseModel: default capacity must be >= 1");
    for (const auto& range : ranges) {
        if (range.capacity < 1 || !(range.endM >= range.startM))
            throw std::invalid_argument("CourseModel: invalid capacity range [" + std::to_string(range.startM) + ", " +
                std::to_string(range.endM) + "] with capacity " + std::to_string(range.capacity));
    }

    for (const auto& range : ranges) {
        for (size_t i = 0; i < course_.size(); ++i) {
            const double d = course_[i].distance;
            if (d >= range.startM && d <= range.endM) capacity_[i] = range.capacity;
        }
    }
}


std::vector<Cell> CourseModel::cells(const double width) const {
    if (!(width > 0.0)) throw std::invalid_argument("CourseModel::cells: cell width must be > 0");

    const auto numCells = static_cast<size_t>(std::ceil(length() / width));
    std::vector<Cell> grid;
    grid.reserve(numCells);
    for (size_t i = 0; i < numCells; ++i) {
        const double start = static_cast<double>(i) * width;
        const double midpoint = start + width / 2.0;
        const size_t nearest = course_.nearestIndex(midpoint);
        grid.push_back({start, capacity_[nearest], course_[nearest].gradient, course_[nearest].elevation, midpoint});
    }
    return grid;
}
