#include "swath_sampler/sampling/label_tiles.hpp"
#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/sampling/geometry.hpp"
#include "swath_sampler/sampling/samplers.hpp"

namespace swath_sampler::sampling {

MatrixXb positive_label_mask(const Swath& swath, const BandLayout& layout) {
    const BandRange labels = layout.label_bands();
    const int mask_band = layout.cloud_mask_band();
    if (labels.first < 0 || labels.count < 1) {
        throw ValidationError("labels band range [" + std::to_string(labels.first) + "," +
                              std::to_string(labels.end()) + ") not present in swath of shape " +
                              shape_to_string(swath.shape()));
    }
    if (mask_band < 0) {
        throw ValidationError("cloud_mask band " + std::to_string(mask_band) +
                              " not present in swath of shape " + shape_to_string(swath.shape()));
    }
    if (labels.end() > swath.band_count() || mask_band >= swath.band_count()) {
        throw ShapeError("swath " + shape_to_string(swath.shape()) +
                         " has no room for label bands [" + std::to_string(labels.first) + "," +
                         std::to_string(labels.end()) + ") and cloud_mask band " +
                         std::to_string(mask_band));
    }

    Matrix2Df label_sum = Matrix2Df::Zero(swath.rows(), swath.cols());
    for (int b = labels.first; b < labels.end(); ++b) {
        label_sum += swath.bands[static_cast<size_t>(b)];
    }
    const Matrix2Df& cloud = swath.bands[static_cast<size_t>(mask_band)];

    return (label_sum.array() > 0.0f && cloud.array() != 0.0f).matrix();
}

TileCollection extract_label_tiles(const Swath& swath, const BandLayout& layout, int tile_size) {
    const TileOffsets off = compute_tile_offsets(tile_size);
    const MatrixXb positive = positive_label_mask(swath, layout);
    const int length = swath.rows();
    const int breadth = swath.cols();

    TileCollection out;
    for (int row = 0; row < length; ++row) {
        if (row < off.low || row + off.high + 1 > length) continue;
        for (int col = 0; col < breadth; ++col) {
            if (!positive(row, col)) continue;
            if (col < off.low || col + off.high + 1 > breadth) continue;

            const TileOrigin origin = tile_origin(row, col, off);
            out.push_back(cut_tile(swath, origin), origin);
        }
    }
    return out;
}

BalancedTileSet extract_labels_and_cloud_tiles(const Swath& swath, const BandLayout& layout,
                                               int tile_size, int stride, std::mt19937& rng,
                                               ShortfallPolicy shortfall) {
    if (swath.shape() != layout.swath_shape()) {
        throw ShapeError("tiles are extracted only from swaths with a label mask; expected " +
                         shape_to_string(layout.swath_shape()) + ", got " +
                         shape_to_string(swath.shape()));
    }

    BalancedTileSet out;
    out.label = extract_label_tiles(swath, layout, tile_size);

    CloudSample negatives = cloud_masked_random_sample(swath, layout, out.label.size(),
                                                       tile_size, stride, rng, shortfall);
    out.nonlabel = std::move(negatives.tiles);
    out.nonlabel_requested = negatives.requested;
    out.nonlabel_available = negatives.available;
    return out;
}

} // namespace swath_sampler::sampling
