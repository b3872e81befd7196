#pragma once

#include "swath_sampler/core/types.hpp"

#include <vector>

namespace swath_sampler::sampling {

// Pixel offsets around a tile center. A tile centered on p covers
// [p - low, p + high + 1); high == low + 1 for even tile sizes.
struct TileOffsets {
    int low = 0;
    int high = 0;

    int extent() const { return low + high + 1; }
};

TileOffsets compute_tile_offsets(int tile_size);

PixelRange tile_span(int center, const TileOffsets& offsets);

TileOrigin tile_origin(int row, int col, const TileOffsets& offsets);

// Closed column interval reserved for ground-truth alignment around breadth / 2.
struct ExclusionBand {
    int first = 0;
    int last = 0;

    bool contains(int col) const { return col >= first && col <= last; }
};

ExclusionBand exclusion_band(int breadth, const TileOffsets& offsets);

// Tile-center ranges on either side of the exclusion band.
PixelRange left_half_columns(int breadth, const TileOffsets& offsets);
PixelRange right_half_columns(int breadth, const TileOffsets& offsets);

// Rows whose tiles clear both swath edges.
PixelRange valid_row_centers(int length, const TileOffsets& offsets);

std::vector<int> stepped(const PixelRange& range, int stride);

std::vector<int> strided_row_centers(int length, const TileOffsets& offsets, int stride);
std::vector<int> strided_column_centers(int breadth, const TileOffsets& offsets, int stride);

// Copy the window at `origin` across all bands. The caller guarantees the
// window lies inside the swath.
BandStack cut_tile(const Swath& swath, const TileOrigin& origin);

} // namespace swath_sampler::sampling
