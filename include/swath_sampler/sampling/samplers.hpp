#pragma once

#include "swath_sampler/core/band_layout.hpp"
#include "swath_sampler/core/types.hpp"

#include <cstddef>
#include <random>

namespace swath_sampler::sampling {

// One tile per valid row; the column is drawn uniformly from the left or the
// right half of the swath, never from the exclusion band.
TileCollection random_tile_sample(const Swath& swath, int tile_size, std::mt19937& rng);

// Deterministic row-major grid of tile centers on `stride`, exclusion band
// skipped.
TileCollection strided_tile_sample(const Swath& swath, int tile_size, int stride);

struct CloudSample {
    TileCollection tiles;
    size_t requested = 0;
    size_t available = 0;  // cloudy candidates on the grid

    bool shortfall() const { return available < requested; }
};

// Strided grid restricted to cloudy centers, shuffled, truncated to
// `number_of_tiles`. With ShortfallPolicy::ERROR an undersized candidate pool
// raises InsufficientCandidatesError; otherwise the sample is short.
CloudSample cloud_masked_random_sample(const Swath& swath, const BandLayout& layout,
                                       size_t number_of_tiles, int tile_size, int stride,
                                       std::mt19937& rng,
                                       ShortfallPolicy shortfall = ShortfallPolicy::WARN);

} // namespace swath_sampler::sampling
