#include "RngEngine.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>


using namespace trailsim;


//------------------------------------------------------------------------------
// Seeding
//------------------------------------------------------------------------------
// not reproducible: clock ticks xor the hashed thread id
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

// odd stream increment, state stepped once past the seed
RngEngine::RngEngine(const uint64_t seed) : state_(0), increment_(seed << 1 | 1) {
    state_ = seed + increment_;
    state_ = state_ * 6364136223846793005ULL + increment_;
}

// 64-bit LCG state, 32-bit output by xorshift-high and a random rotation
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}


//------------------------------------------------------------------------------
// Distributions
//------------------------------------------------------------------------------
// standard normal, two per pair of uniforms
double RngEngine::sampleBoxMuller() {
    if (haveSpare_) {
        haveSpare_ = false;
        return spare_;
    }
    // 1 - uniform() lies in (0,1], keeps log() finite
    const double u1 = 1.0 - uniform();
    const double u2 = uniform();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * M_PI * u2;
    spare_ = r * std::sin(theta);
    haveSpare_ = true;
    return r * std::cos(theta);
}

// 32 bits scaled into [0, 1)
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}

double RngEngine::normal(const double mean, const double stddev) {
    assert(stddev >= 0.0 && "Normal stddev must be non-negative");
    return mean + stddev * sampleBoxMuller();
}

// [0, n) without modulo bias (Lemire)
uint32_t RngEngine::uniformIndex(const uint32_t n) {
    assert(n > 0 && "uniformIndex range must be non-empty");
    uint64_t m = static_cast<uint64_t>(nextUInt32()) * n;
    auto low = static_cast<uint32_t>(m);
    if (low < n) {
        const uint32_t threshold = (0u - n) % n;
        while (low < threshold) {
            m = static_cast<uint64_t>(nextUInt32()) * n;
            low = static_cast<uint32_t>(m);
        }
    }
    return static_cast<uint32_t>(m >> 32u);
}
