#pragma once
#include <cstdint>

namespace trailsim {
    /**
     * @brief Seedable PCG32 stream.
     *
     * Every random decision of a run (pace draws, random single-track placement) goes through one instance,
     * so a fixed seed reproduces the run exactly.
     */
    class RngEngine {
    public:
        /** @param seed  run seed; defaults to a clock/thread mix that is never reproducible */
        explicit RngEngine(uint64_t seed = defaultSeed());

        /** @return a double ∈ [0,1) */
        double uniform();

        /** @brief Normal(mean, stddev) draw; stddev 0 returns mean exactly. */
        double normal(double mean, double stddev);

        /** @return an index uniformly drawn from [0, n); n must be > 0 */
        uint32_t uniformIndex(uint32_t n);

        static uint64_t defaultSeed();

        /** @brief raw PCG-XSH-RR output */
        uint32_t nextUInt32();

    private:
        // PCG
        uint64_t state_;
        uint64_t increment_;
        bool haveSpare_ = false;
        double spare_ = 0.0;

        // standard normal; the second Box-Muller value is cached in spare_
        double sampleBoxMuller();
    };
}
