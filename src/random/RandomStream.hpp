#pragma once

// ============================================================================
// RandomStream — one named, independently seeded pseudorandom stream
// ============================================================================
// Every stage owns its own stream built from master_seed + a fixed offset:
//
//   customers    -> master + offsets.customers
//   products     -> master + offsets.products
//   transactions -> master + offsets.transactions
//   ...
//
// No stage reads another stage's engine, so the output of a table depends only
// on the master seed and its own offset, never on which other tables ran or in
// what order.
// ============================================================================

#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace RetailForge
{

    class RandomStream
    {
    public:
        explicit RandomStream(uint64_t seed)
            : seed_(seed), engine_(seed) {}

        static RandomStream derive(uint64_t master_seed, uint64_t offset)
        {
            return RandomStream(master_seed + offset);
        }

        // Rewinds to the first value of the stream.
        void reset() { engine_.seed(seed_); }

        // Uniform real in [lo, hi).
        double uniform(double lo, double hi)
        {
            return std::uniform_real_distribution<double>(lo, hi)(engine_);
        }

        // Uniform integer in [lo, hi].
        template <typename Int>
        Int uniform_int(Int lo, Int hi)
        {
            return std::uniform_int_distribution<Int>(lo, hi)(engine_);
        }

        // Uniform index in [0, n). n must be positive.
        size_t index(size_t n)
        {
            return std::uniform_int_distribution<size_t>(0, n - 1)(engine_);
        }

        bool chance(double p)
        {
            return uniform(0.0, 1.0) < p;
        }

        uint32_t poisson(double mean)
        {
            if (mean <= 0.0)
                return 0;
            return std::poisson_distribution<uint32_t>(mean)(engine_);
        }

        uint64_t next_u64() { return engine_(); }

    private:
        uint64_t seed_;
        std::mt19937_64 engine_;
    };

    // ============================================================================
    // WeightedChoice — categorical sampling over a fixed weight vector
    // ============================================================================
    // Weights are validated by GeneratorConfig before they get here; the table
    // stores the cumulative sum and maps one uniform draw to an index.
    // ============================================================================
    template <size_t N>
    class WeightedChoice
    {
    public:
        explicit WeightedChoice(const std::array<double, N> &weights)
        {
            double running = 0.0;
            for (size_t i = 0; i < N; ++i)
            {
                if (weights[i] < 0.0)
                    throw std::invalid_argument("WeightedChoice: negative weight");
                running += weights[i];
                cumulative_[i] = running;
            }
            if (running <= 0.0)
                throw std::invalid_argument("WeightedChoice: weights sum to zero");
        }

        size_t sample(RandomStream &rng) const
        {
            const double draw = rng.uniform(0.0, cumulative_[N - 1]);
            for (size_t i = 0; i < N; ++i)
            {
                if (draw < cumulative_[i])
                    return i;
            }
            return N - 1;
        }

    private:
        std::array<double, N> cumulative_{};
    };

} // namespace RetailForge
