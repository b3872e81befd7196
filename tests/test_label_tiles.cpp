#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/sampling/geometry.hpp"
#include "swath_sampler/sampling/label_tiles.hpp"

#include <random>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace swath_sampler;
using namespace swath_sampler::sampling;

namespace {

BandLayout small_layout(int rows, int cols) {
    BandLayout layout({5, rows, cols});
    layout.set_channel("radiance", {0, 2});
    layout.set_channel(BandLayout::kCloudMask, {2, 1});
    layout.set_channel(BandLayout::kLabels, {3, 2});
    return layout;
}

// Cloudy everywhere, no labels.
Swath cloudy_swath(const BandLayout& layout) {
    const Shape3 s = layout.swath_shape();
    Swath swath(s[0], s[1], s[2]);
    swath.bands[static_cast<size_t>(layout.cloud_mask_band())].setOnes();
    return swath;
}

void set_label(Swath& swath, const BandLayout& layout, int row, int col) {
    swath(layout.label_bands().first, row, col) = 1.0f;
}

void require_tiles_match_origins(const Swath& swath, const TileCollection& tiles, int extent) {
    REQUIRE(tiles.tiles.size() == tiles.origins.size());
    for (size_t i = 0; i < tiles.size(); ++i) {
        const TileOrigin& o = tiles.origins[i];
        REQUIRE(o.rows.size() == extent);
        REQUIRE(o.cols.size() == extent);
        const BandStack& tile = tiles.tiles[i];
        REQUIRE(tile.shape() == Shape3{swath.band_count(), extent, extent});
        for (int b = 0; b < swath.band_count(); ++b) {
            REQUIRE(tile.bands[b] ==
                    swath.bands[b].block(o.rows.start, o.cols.start, extent, extent));
        }
    }
}

} // namespace

TEST_CASE("positive_mask_needs_label_and_cloud") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    set_label(swath, layout, 4, 4);
    swath(4, 6, 6) = 2.0f;  // second label band
    swath(3, 7, 7) = 1.0f;
    swath(2, 7, 7) = 0.0f;  // labeled but clear

    const MatrixXb mask = positive_label_mask(swath, layout);
    REQUIRE(mask.count() == 2);
    REQUIRE(mask(4, 4));
    REQUIRE(mask(6, 6));
    REQUIRE_FALSE(mask(7, 7));
}

TEST_CASE("positive_mask_ignores_negative_label_sum") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    swath(3, 5, 5) = 1.0f;
    swath(4, 5, 5) = -2.0f;
    REQUIRE(positive_label_mask(swath, layout).count() == 0);
}

TEST_CASE("single_interior_label_yields_one_centered_tile") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    set_label(swath, layout, 5, 6);

    const TileCollection tiles = extract_label_tiles(swath, layout, 3);
    REQUIRE(tiles.size() == 1);
    REQUIRE(tiles.origins[0] == TileOrigin{{4, 7}, {5, 8}});
    REQUIRE(tiles.tiles[0].shape() == Shape3{5, 3, 3});
    REQUIRE(tiles.tiles[0](3, 1, 1) == 1.0f);
}

TEST_CASE("labels_whose_tile_crosses_an_edge_are_skipped") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    set_label(swath, layout, 0, 5);
    set_label(swath, layout, 9, 5);
    set_label(swath, layout, 5, 0);
    set_label(swath, layout, 5, 11);
    set_label(swath, layout, 1, 1);

    const TileCollection tiles = extract_label_tiles(swath, layout, 3);
    REQUIRE(tiles.size() == 1);
    REQUIRE(tiles.origins[0] == TileOrigin{{0, 3}, {0, 3}});
}

TEST_CASE("even_tile_size_label_tiles_use_wider_window") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    set_label(swath, layout, 5, 5);
    set_label(swath, layout, 7, 5);  // row 7 + 3 + 1 > 10

    const TileCollection tiles = extract_label_tiles(swath, layout, 4);
    REQUIRE(tiles.size() == 1);
    REQUIRE(tiles.origins[0] == TileOrigin{{3, 9}, {3, 9}});
}

TEST_CASE("label_tiles_are_returned_in_row_major_order") {
    const BandLayout layout = small_layout(10, 12);
    Swath swath = cloudy_swath(layout);
    set_label(swath, layout, 6, 2);
    set_label(swath, layout, 3, 8);
    set_label(swath, layout, 3, 4);

    const TileCollection tiles = extract_label_tiles(swath, layout, 3);
    REQUIRE(tiles.size() == 3);
    REQUIRE(tiles.origins[0].cols.start == 3);
    REQUIRE(tiles.origins[1].cols.start == 7);
    REQUIRE(tiles.origins[2].rows.start == 5);
}

TEST_CASE("balanced_extraction_pairs_label_and_cloud_tiles") {
    const BandLayout layout = small_layout(30, 40);
    Swath swath = cloudy_swath(layout);
    const std::vector<std::pair<int, int>> positives = {{4, 4}, {10, 30}, {20, 7}};
    for (const auto& [r, c] : positives) set_label(swath, layout, r, c);

    std::mt19937 rng(17);
    const BalancedTileSet set = extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng);
    REQUIRE(set.label.size() == positives.size());
    REQUIRE(set.nonlabel_requested == positives.size());
    REQUIRE(set.nonlabel.size() == positives.size());
    REQUIRE_FALSE(set.shortfall());
}

TEST_CASE("balanced_tiles_reproduce_swath_windows") {
    const BandLayout layout = small_layout(30, 40);
    Swath swath(5, 30, 40);
    for (int b = 0; b < 2; ++b)
        for (int r = 0; r < 30; ++r)
            for (int c = 0; c < 40; ++c)
                swath(b, r, c) = static_cast<float>(b * 10000 + r * 100 + c);
    // Cloudy on alternate stride-grid rows and on the labeled rows.
    for (int r : {2, 8, 14, 20, 26}) swath.bands[2].row(r).setOnes();
    for (int r : {4, 9, 27}) swath.bands[2].row(r).setOnes();
    set_label(swath, layout, 4, 6);
    set_label(swath, layout, 9, 33);
    set_label(swath, layout, 27, 20);
    set_label(swath, layout, 5, 5);  // labeled but clear

    std::mt19937 rng(31);
    const BalancedTileSet set = extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng);
    REQUIRE(set.label.size() == 3);
    REQUIRE(set.nonlabel.size() == 3);
    require_tiles_match_origins(swath, set.label, 3);
    require_tiles_match_origins(swath, set.nonlabel, 3);

    const TileOffsets off = compute_tile_offsets(3);
    const int mask_band = layout.cloud_mask_band();
    for (const auto& o : set.label.origins) {
        REQUIRE(swath(layout.label_bands().first, o.rows.start + off.low,
                      o.cols.start + off.low) > 0.0f);
    }
    for (const auto& o : set.nonlabel.origins) {
        REQUIRE(swath(mask_band, o.rows.start + off.low, o.cols.start + off.low) != 0.0f);
    }
}

TEST_CASE("balanced_extraction_without_labels_is_empty") {
    const BandLayout layout = small_layout(30, 40);
    const Swath swath = cloudy_swath(layout);
    std::mt19937 rng(17);
    const BalancedTileSet set = extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng);
    REQUIRE(set.label.empty());
    REQUIRE(set.nonlabel.empty());
}

TEST_CASE("balanced_extraction_reports_shortfall_on_clear_grid") {
    const BandLayout layout = small_layout(30, 40);
    Swath swath(5, 30, 40);
    // Cloudy only off the stride grid, labeled there too.
    swath(2, 4, 4) = 1.0f;
    swath(2, 7, 10) = 1.0f;
    set_label(swath, layout, 4, 4);
    set_label(swath, layout, 7, 10);

    std::mt19937 rng(2);
    const BalancedTileSet set =
        extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng, ShortfallPolicy::ACCEPT);
    REQUIRE(set.label.size() == 2);
    REQUIRE(set.nonlabel.empty());
    REQUIRE(set.nonlabel_available == 0);
    REQUIRE(set.shortfall());

    std::mt19937 rng2(2);
    REQUIRE_THROWS_AS(
        extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng2, ShortfallPolicy::ERROR),
        InsufficientCandidatesError);
}

TEST_CASE("balanced_extraction_rejects_swath_of_wrong_shape") {
    const BandLayout layout = BandLayout::modis_cloudsat();
    const Swath swath(3, 10, 10);
    std::mt19937 rng(1);
    REQUIRE_THROWS_AS(extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng), ShapeError);
}

TEST_CASE("balanced_extraction_on_full_modis_cloudsat_swath") {
    const BandLayout layout = BandLayout::modis_cloudsat();
    Swath swath = cloudy_swath(layout);
    const std::vector<std::pair<int, int>> positives = {
        {100, 100}, {500, 674}, {1000, 1200}, {2000, 50}, {1500, 675}};
    for (const auto& [r, c] : positives) set_label(swath, layout, r, c);

    std::mt19937 rng(123);
    const BalancedTileSet set = extract_labels_and_cloud_tiles(swath, layout, 3, 3, rng);
    REQUIRE(set.label.size() == positives.size());
    REQUIRE(set.nonlabel.size() <= positives.size());
    require_tiles_match_origins(swath, set.label, 3);
    require_tiles_match_origins(swath, set.nonlabel, 3);
}
