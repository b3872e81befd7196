#include "swath_sampler/sampling/geometry.hpp"
#include "swath_sampler/core/errors.hpp"

namespace swath_sampler::sampling {

TileOffsets compute_tile_offsets(int tile_size) {
    if (tile_size < 1) {
        throw ValidationError("tile_size must be >= 1, got " + std::to_string(tile_size));
    }
    TileOffsets out;
    out.low = tile_size / 2;
    out.high = (tile_size % 2 == 0) ? out.low + 1 : out.low;
    return out;
}

PixelRange tile_span(int center, const TileOffsets& offsets) {
    return {center - offsets.low, center + offsets.high + 1};
}

TileOrigin tile_origin(int row, int col, const TileOffsets& offsets) {
    return {tile_span(row, offsets), tile_span(col, offsets)};
}

ExclusionBand exclusion_band(int breadth, const TileOffsets& offsets) {
    const int mid = breadth / 2;
    return {mid - offsets.low - 1, mid + offsets.low + 1};
}

PixelRange left_half_columns(int breadth, const TileOffsets& offsets) {
    const ExclusionBand band = exclusion_band(breadth, offsets);
    return {offsets.low + 1, band.first};
}

PixelRange right_half_columns(int breadth, const TileOffsets& offsets) {
    const ExclusionBand band = exclusion_band(breadth, offsets);
    return {band.last + 1, breadth - offsets.low - 1};
}

PixelRange valid_row_centers(int length, const TileOffsets& offsets) {
    return {offsets.low + 1, length - offsets.low - 1};
}

std::vector<int> stepped(const PixelRange& range, int stride) {
    if (stride < 1) {
        throw ValidationError("stride must be >= 1, got " + std::to_string(stride));
    }
    std::vector<int> out;
    if (range.empty()) return out;
    out.reserve(static_cast<size_t>((range.size() + stride - 1) / stride));
    for (int v = range.start; v < range.end; v += stride) {
        out.push_back(v);
    }
    return out;
}

std::vector<int> strided_row_centers(int length, const TileOffsets& offsets, int stride) {
    return stepped(valid_row_centers(length, offsets), stride);
}

std::vector<int> strided_column_centers(int breadth, const TileOffsets& offsets, int stride) {
    std::vector<int> out = stepped(left_half_columns(breadth, offsets), stride);
    std::vector<int> right = stepped(right_half_columns(breadth, offsets), stride);
    out.insert(out.end(), right.begin(), right.end());
    return out;
}

BandStack cut_tile(const Swath& swath, const TileOrigin& origin) {
    BandStack tile;
    tile.bands.reserve(swath.bands.size());
    for (const auto& band : swath.bands) {
        tile.bands.emplace_back(band.block(origin.rows.start, origin.cols.start,
                                           origin.rows.size(), origin.cols.size()));
    }
    return tile;
}

} // namespace swath_sampler::sampling
