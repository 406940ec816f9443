/**
 * @file random_generator.cpp
 * @brief Implementation for the oscillation module.
 *
 * Provides the seeded random source used by warm-up, kick-phase
 * initialization and main-pass kicks.
 * This file is part of the src/oscillation subsystem.
 */

#include "random_generator.hpp"

namespace solarosc
{

OscillationRNG::OscillationRNG(uint64_t base_seed, int member_id)
    : base_seed_(base_seed), member_id_(member_id),
      normal_dist_(0.0, 1.0), uniform_dist_(0.0, 1.0)
{
    seed_generator();
}

/**
 * @brief Draws a standard normal variate.
 */
double OscillationRNG::normal()
{
    return normal_dist_(generator_);
}

/**
 * @brief Draws a scaled normal variate.
 */
double OscillationRNG::normal(double mean, double stdev)
{
    return mean + stdev * normal_dist_(generator_);
}

/**
 * @brief Draws a uniform variate in [0,1).
 */
double OscillationRNG::uniform()
{
    return uniform_dist_(generator_);
}

/**
 * @brief Draws a uniform variate in [lo,hi).
 */
double OscillationRNG::uniform(double lo, double hi)
{
    return lo + (hi - lo) * uniform_dist_(generator_);
}

/**
 * @brief Derives an independent generator for one stream key.
 */
OscillationRNG OscillationRNG::spawn_stream(uint64_t stream_key) const
{
    return spawn_stream(stream_key, 1);
}

OscillationRNG OscillationRNG::spawn_stream(uint64_t stream_key, uint64_t sub_key) const
{
    OscillationRNG stream(base_seed_, member_id_);
    stream.stream_key_ = stream_key;
    stream.stream_sub_key_ = sub_key;
    stream.is_stream_ = true;
    stream.seed_generator();
    return stream;
}

uint64_t OscillationRNG::draw_bits()
{
    return generator_();
}

/**
 * @brief Resets the random number generator.
 */
void OscillationRNG::reset()
{
    normal_dist_.reset();
    uniform_dist_.reset();
    seed_generator();
}

/**
 * @brief Makes the stream seed.
 */
uint64_t OscillationRNG::make_stream_seed(uint64_t stream_key, uint64_t sub_key) const
{
    uint64_t combined = base_seed_;
    combined = combined * 6364136223846793005ULL + static_cast<uint64_t>(member_id_);
    combined = combined * 6364136223846793005ULL + stream_key;
    combined = combined * 6364136223846793005ULL + sub_key;
    return combined;
}

void OscillationRNG::seed_generator()
{
    if (is_stream_)
    {
        generator_.seed(make_stream_seed(stream_key_, stream_sub_key_));
    }
    else
    {
        generator_.seed(base_seed_ + static_cast<uint64_t>(member_id_));
    }
}

}
