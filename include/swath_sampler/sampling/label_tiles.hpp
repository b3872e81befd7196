#pragma once

#include "swath_sampler/core/band_layout.hpp"
#include "swath_sampler/core/types.hpp"

#include <cstddef>
#include <random>

namespace swath_sampler::sampling {

// Positions whose label-band sum is positive and whose cloud mask is set.
MatrixXb positive_label_mask(const Swath& swath, const BandLayout& layout);

// One tile per positive label position, scanned row-major. Positions whose
// tile would cross a swath edge are skipped.
TileCollection extract_label_tiles(const Swath& swath, const BandLayout& layout, int tile_size);

struct BalancedTileSet {
    TileCollection label;
    TileCollection nonlabel;
    size_t nonlabel_requested = 0;
    size_t nonlabel_available = 0;

    bool shortfall() const { return nonlabel.size() < nonlabel_requested; }
};

// Label tiles plus as many cloud-masked random tiles. Throws ShapeError when
// the swath is not the layout's label-bearing shape.
BalancedTileSet extract_labels_and_cloud_tiles(const Swath& swath, const BandLayout& layout,
                                               int tile_size, int stride, std::mt19937& rng,
                                               ShortfallPolicy shortfall = ShortfallPolicy::WARN);

} // namespace swath_sampler::sampling
