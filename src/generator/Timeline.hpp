#pragma once

#include <cstdint>
#include "../model/Entities.hpp"
#include "../random/RandomStream.hpp"

namespace RetailForge
{

    // Recency-biased purchase time relative to 'reference':
    //   60% within the last 90 days
    //   30% between 90 and 180 days ago
    //   10% between 180 and 365 days ago
    // The second-of-day is uniform.
    inline int64_t recency_biased_timestamp(RandomStream &rng, int64_t reference)
    {
        const double bucket = rng.uniform(0.0, 1.0);
        int32_t days = 0;
        if (bucket < 0.60)
            days = rng.uniform_int<int32_t>(0, 89);
        else if (bucket < 0.90)
            days = rng.uniform_int<int32_t>(90, 179);
        else
            days = rng.uniform_int<int32_t>(180, 364);

        const int64_t second_of_day = rng.uniform_int<int64_t>(0, kSecondsPerDay - 1);
        return reference - static_cast<int64_t>(days) * kSecondsPerDay - second_of_day;
    }

    // Uniform time within the last 'days' days.
    inline int64_t uniform_recent_timestamp(RandomStream &rng, int64_t reference, int32_t days)
    {
        return reference - rng.uniform_int<int64_t>(0, static_cast<int64_t>(days) * kSecondsPerDay - 1);
    }

} // namespace RetailForge
