#include "Course.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace trailsim;

namespace {
    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\"");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t\r\"");
        return s.substr(first, last - first + 1);
    }

    std::vector<std::string> splitRow(const std::string& line) {
        std::vector<std::string> cells;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ','))
            cells.push_back(trim(cell));
        return cells;
    }

    int columnIndex(const std::vector<std::string>& header, const std::string& name) {
        const auto it = std::find(header.begin(), header.end(), name);
        return it == header.end() ? -1 : static_cast<int>(it - header.begin());
    }
}


Course::Course(std::vector<CourseSample> samples): samples_(std::move(samples)) {
    if (samples_.empty()) throw std::invalid_argument("Course: at least one sample is required");
    if (samples_.front().distance < 0.0)
        throw std::invalid_argument("Course: first sample distance must be >= 0");

    samples_.front().gradient = 0.0;
    for (size_t i = 1; i < samples_.size(); ++i) {
        const double segment = samples_[i].distance - samples_[i - 1].distance;
        if (segment < 0.0)
            throw std::invalid_argument(
                "Course: distances must be non-decreasing (sample " + std::to_string(i) + ")");

        samples_[i].gradient = segment > 0.0
                                   ? (samples_[i].elevation - samples_[i - 1].elevation) / segment * 100.0
                                   : 0.0;
    }
}


Course Course::fromCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Course: cannot open course file '" + path + "'");

    std::string line;
    if (!std::getline(in, line)) throw std::runtime_error("Course: course file '" + path + "' is empty");

    const auto header = splitRow(line);
    const int distanceCol = columnIndex(header, "distance");
    const int elevationCol = columnIndex(header, "elevation");
    const int latitudeCol = columnIndex(header, "latitude");
    const int longitudeCol = columnIndex(header, "longitude");
    if (distanceCol < 0 || elevationCol < 0)
        throw std::runtime_error("Course: '" + path + "' needs 'distance' and 'elevation' columns");

    std::vector<CourseSample> samples;
    size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        auto field = [&](const int col) -> double {
            if (col >= static_cast<int>(row.size()) || row[col].empty())
                throw std::runtime_error(
                    "Course: '" + path + "' line " + std::to_string(lineNo) + ": missing column '" + header[col] + "'");
            try {
                return std::stod(row[col]);
            }
            catch (const std::logic_error&) {
                throw std::runtime_error("Course: '" + path + "' line " + std::to_string(lineNo) +
                    ": cannot parse '" + row[col] + "' as a number");
            }
        };

        CourseSample sample{field(distanceCol), field(elevationCol)};
        if (latitudeCol >= 0) sample.latitude = field(latitudeCol);
        if (longitudeCol >= 0) sample.longitude = field(longitudeCol);
        samples.push_back(sample);
    }

    if (samples.empty()) throw std::runtime_error("Course: course file '" + path + "' has no samples");

    try {
        return Course(std::move(samples));
    }
    catch (const std::invalid_argument& e) {
        throw std::runtime_error("Course: '" + path + "': " + e.what());
    }
}


size_t Course::nearestIndex(const double distance) const noexcept {
    const auto it = std::lower_bound(samples_.begin(), samples_.end(), distance,
                                     [](const CourseSample& s, const double d) { return s.distance < d; });
    if (it == samples_.begin()) return 0;
    if (it == samples_.end()) return samples_.size() - 1;

    const auto hi = static_cast<size_t>(it - samples_.begin());
    const size_t lo = hi - 1;
    return distance - samples_[lo].distance <= samples_[hi].distance - distance ? lo : hi;
}


GeoPoint Course::locate(const double distance) const noexcept {
    const auto it = std::lower_bound(samples_.begin(), samples_.end(), distance,
                                     [](const CourseSample& s, const double d) { return s.distance < d; });
    if (it == samples_.begin()) return {samples_.front().latitude, samples_.front().longitude};
    if (it == samples_.end()) return {samples_.back().latitude, samples_.back().longitude};

    const auto& b = *it;
    const auto& a = *(it - 1);
    const double span = b.distance - a.distance;
    if (span <= 0.0) return {b.latitude, b.longitude};

    const double f = (distance - a.distance) / span;
    return {a.latitude + f * (b.latitude - a.latitude), a.longitude + f * (b.longitude - a.longitude)};
}
