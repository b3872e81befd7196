#include "swath_sampler/sampling/samplers.hpp"
#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/sampling/geometry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace swath_sampler::sampling {

static void require_band(const Swath& swath, int band, const char* what) {
    if (band < 0 || band >= swath.band_count()) {
        throw ValidationError(std::string(what) + " band " + std::to_string(band) +
                              " not present in swath of shape " +
                              shape_to_string(swath.shape()));
    }
}

TileCollection random_tile_sample(const Swath& swath, int tile_size, std::mt19937& rng) {
    const TileOffsets off = compute_tile_offsets(tile_size);
    const PixelRange rows = valid_row_centers(swath.rows(), off);

    TileCollection out;
    if (rows.empty()) return out;

    std::vector<PixelRange> halves;
    for (const PixelRange& h : {left_half_columns(swath.cols(), off),
                                right_half_columns(swath.cols(), off)}) {
        if (!h.empty()) halves.push_back(h);
    }
    if (halves.empty()) {
        throw ValidationError("swath breadth " + std::to_string(swath.cols()) +
                              " leaves no columns outside the exclusion band for tile_size " +
                              std::to_string(tile_size));
    }

    // Both halves stay eligible; a half only drops out when it has no columns.
    std::uniform_int_distribution<size_t> pick_half(0, halves.size() - 1);

    out.reserve(static_cast<size_t>(rows.size()));
    for (int row = rows.start; row < rows.end; ++row) {
        const PixelRange& half = halves[pick_half(rng)];
        std::uniform_int_distribution<int> pick_col(half.start, half.end - 1);
        const int col = pick_col(rng);

        const TileOrigin origin = tile_origin(row, col, off);
        out.push_back(cut_tile(swath, origin), origin);
    }
    return out;
}

TileCollection strided_tile_sample(const Swath& swath, int tile_size, int stride) {
    const TileOffsets off = compute_tile_offsets(tile_size);
    const std::vector<int> row_centers = strided_row_centers(swath.rows(), off, stride);
    const std::vector<int> col_centers = strided_column_centers(swath.cols(), off, stride);

    TileCollection out;
    out.reserve(row_centers.size() * col_centers.size());
    for (int row : row_centers) {
        for (int col : col_centers) {
            const TileOrigin origin = tile_origin(row, col, off);
            out.push_back(cut_tile(swath, origin), origin);
        }
    }
    return out;
}

CloudSample cloud_masked_random_sample(const Swath& swath, const BandLayout& layout,
                                       size_t number_of_tiles, int tile_size, int stride,
                                       std::mt19937& rng, ShortfallPolicy shortfall) {
    const int mask_band = layout.cloud_mask_band();
    require_band(swath, mask_band, "cloud_mask");

    const TileOffsets off = compute_tile_offsets(tile_size);
    const std::vector<int> row_centers = strided_row_centers(swath.rows(), off, stride);
    const std::vector<int> col_centers = strided_column_centers(swath.cols(), off, stride);
    const Matrix2Df& mask = swath.bands[static_cast<size_t>(mask_band)];

    // Any non-zero value (NaN included) counts as cloudy.
    std::vector<std::pair<int, int>> candidates;
    for (int row : row_centers) {
        for (int col : col_centers) {
            if (mask(row, col) != 0.0f) {
                candidates.emplace_back(row, col);
            }
        }
    }

    CloudSample out;
    out.requested = number_of_tiles;
    out.available = candidates.size();
    if (out.shortfall() && shortfall == ShortfallPolicy::ERROR) {
        throw InsufficientCandidatesError(out.requested, out.available);
    }

    std::shuffle(candidates.begin(), candidates.end(), rng);
    candidates.resize(std::min(candidates.size(), number_of_tiles));

    out.tiles.reserve(candidates.size());
    for (const auto& [row, col] : candidates) {
        const TileOrigin origin = tile_origin(row, col, off);
        out.tiles.push_back(cut_tile(swath, origin), origin);
    }
    return out;
}

} // namespace swath_sampler::sampling
