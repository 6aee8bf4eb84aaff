#include "SectionSpec.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

using namespace trailsim;

namespace {
    void validate(const SectionSpec& spec, const size_t index) {
        const std::string where = "section spec #" + std::to_string(index) + ": ";
        if (spec.capacity < 1)
            throw std::invalid_argument(where + "capacity must be >= 1, got " + std::to_string(spec.capacity));

        switch (spec.kind) {
        case SectionSpec::Kind::Explicit:
            if (!(spec.from >= 0.0 && spec.to >= spec.from))
                throw std::invalid_argument(where + "explicit range needs 0 <= start_km <= end_km");
            return;
        case SectionSpec::Kind::Percentage:
            if (!(spec.from >= 0.0 && spec.to <= 100.0 && spec.to >= spec.from))
                throw std::invalid_argument(where + "percentage range needs 0 <= start <= end <= 100");
            return;
        case SectionSpec::Kind::Random:
            if (!(spec.from >= 0.0 && spec.from <= 100.0))
                throw std::invalid_argument(where + "random percentage must lie in [0, 100]");
            if (!(spec.chunkM > 0.0))
                throw std::invalid_argument(where + "random chunk size must be > 0");
            return;
        }
        throw std::invalid_argument(where + "unknown section kind");
    }

    void appendRandom(const SectionSpec& spec, const double courseLengthM, RngEngine& rng,
                      std::vector<CapacityRange>& out) {
        const auto numChunks = static_cast<size_t>(std::ceil(courseLengthM / spec.chunkM));
        const auto numChosen = static_cast<size_t>(static_cast<double>(numChunks) * (spec.from / 100.0));
        if (numChosen == 0) return;

        std::vector<size_t> idx(numChunks);
        for (size_t i = 0; i < numChunks; ++i) idx[i] = i;
        // partial Fisher-Yates: the first numChosen slots become a uniform sample without replacement
        for (size_t i = 0; i < numChosen; ++i) {
            const size_t j = i + rng.uniformIndex(static_cast<uint32_t>(numChunks - i));
            std::swap(idx[i], idx[j]);
        }
        idx.resize(numChosen);
        std::sort(idx.begin(), idx.end());

        // merge runs of consecutive chunks
        size_t first = idx[0], last = idx[0];
        for (size_t i = 1; i <= idx.size(); ++i) {
            if (i < idx.size() && idx[i] == last + 1) {
                last = idx[i];
                continue;
            }
            out.push_back({first * spec.chunkM, (last + 1) * spec.chunkM, spec.capacity});
            if (i < idx.size()) first = last = idx[i];
        }
    }
}


SectionSpec SectionSpec::explicitRange(const double startKm, const double endKm, const int capacity) {
    return {Kind::Explicit, startKm, endKm, capacity, 0.0};
}

SectionSpec SectionSpec::percentage(const double startPct, const double endPct, const int capacity) {
    return {Kind::Percentage, startPct, endPct, capacity, 0.0};
}

SectionSpec SectionSpec::random(const double totalPct, const int capacity, const double chunkM) {
    return {Kind::Random, totalPct, 0.0, capacity, chunkM};
}


std::vector<CapacityRange> trailsim::resolveSections(const std::vector<SectionSpec>& specs,
                                                     const double courseLengthM, RngEngine& rng) {
    if (!(courseLengthM >= 0.0)) throw std::invalid_argument("resolveSections: course length must be >= 0");
    for (size_t i = 0; i < specs.size(); ++i)
        validate(specs[i], i);

    std::vector<CapacityRange> ranges;
    for (const auto& spec : specs) {
        switch (spec.kind) {
        case SectionSpec::Kind::Explicit:
            ranges.push_back({spec.from * 1000.0, spec.to * 1000.0, spec.capacity});
            break;
        case SectionSpec::Kind::Percentage:
            ranges.push_back({courseLengthM * spec.from / 100.0, courseLengthM * spec.to / 100.0, spec.capacity});
            break;
        case SectionSpec::Kind::Random:
            appendRandom(spec, courseLengthM, rng, ranges);
            break;
        }
    }
    return ranges;
}
