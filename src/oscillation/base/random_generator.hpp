#pragma once

/**
 * @file random_generator.hpp
 * @brief Declarations for the oscillation module.
 *
 * Defines the explicitly seeded random source threaded through every
 * excitation draw. This file is part of the src/oscillation subsystem.
 */

#include <random>
#include <cstdint>

namespace solarosc
{

/**
 * @brief Reproducible random number generator for stochastic mode excitation
 *
 * Provides deterministic random sequences based on seed and member_id.
 * Independent streams (one per mode for the parallel scheme) are derived
 * from the same components plus a stream key.
 */
class OscillationRNG
{
public:
    /**
     * @brief Initialize RNG with base seed and member ID
     * @param base_seed Base random seed
     * @param member_id Ensemble member identifier
     */
    explicit OscillationRNG(uint64_t base_seed = 42, int member_id = 0);

    /**
     * @brief Generate a single standard normal random variable
     * @return Single N(0,1) random variable
     */
    double normal();

    /**
     * @brief Generate a normal random variable with given mean and standard deviation
     * @param mean Distribution mean
     * @param stdev Standard deviation (zero returns the mean)
     */
    double normal(double mean, double stdev);

    /**
     * @brief Generate a single uniform random variable in [0,1)
     */
    double uniform();

    /**
     * @brief Generate a uniform random variable in [lo,hi)
     */
    double uniform(double lo, double hi);

    /**
     * @brief Create an independent generator for a specific stream
     * @param stream_key Stream identifier (mode index, field id, ...)
     * @return Generator seeded from (base_seed, member_id, stream_key)
     */
    OscillationRNG spawn_stream(uint64_t stream_key) const;

    /**
     * @brief Create an independent generator keyed by a stream and a sub-key
     * @param stream_key Stream identifier
     * @param sub_key Secondary identifier, e.g. a per-run draw from draw_bits()
     */
    OscillationRNG spawn_stream(uint64_t stream_key, uint64_t sub_key) const;

    /**
     * @brief Draw 64 raw bits from the generator
     */
    uint64_t draw_bits();

    /**
     * @brief Reset RNG state (for reproducibility testing)
     */
    void reset();

    uint64_t base_seed() const { return base_seed_; }
    int member_id() const { return member_id_; }

private:
    uint64_t base_seed_;
    int member_id_;
    uint64_t stream_key_ = 0;
    uint64_t stream_sub_key_ = 1;
    bool is_stream_ = false;
    std::mt19937_64 generator_;
    std::normal_distribution<double> normal_dist_;
    std::uniform_real_distribution<double> uniform_dist_;

    /**
     * @brief Create a deterministic stream seed from components
     * @param stream_key Primary stream identifier
     * @param sub_key Secondary identifier
     * @return Deterministic 64-bit seed
     */
    uint64_t make_stream_seed(uint64_t stream_key, uint64_t sub_key = 0) const;

    void seed_generator();
};

}
