#include "PaceModel.h"

#include <algorithm>

using namespace trailsim;


double GradientPaceModel::factor(const Cell& cell) const {
    const double g = cell.gradient;
    const double f = g > 0.0 ? 1.0 + g * UPHILL_PER_PCT : 1.0 + g * DOWNHILL_PER_PCT;
    return std::max(f, MIN_FACTOR);
}

std::unique_ptr<PaceModel> GradientPaceModel::clone() const {
    return std::make_unique<GradientPaceModel>(*this);
}
