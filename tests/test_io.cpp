#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/core/utils.hpp"
#include "swath_sampler/io/fits_io.hpp"
#include "swath_sampler/io/metadata_io.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace swath_sampler;

namespace {

std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("swath_sampler_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("tile_origin_serializes_as_nested_ranges") {
    const TileOrigin origin{{4, 7}, {10, 13}};
    const nlohmann::json j = origin;
    REQUIRE(j.dump() == "[[4,7],[10,13]]");
    REQUIRE(j.get<TileOrigin>() == origin);
}

TEST_CASE("tile_origin_rejects_malformed_entry") {
    const nlohmann::json j = nlohmann::json::array({1, 2, 3});
    REQUIRE_THROWS_AS(j.get<TileOrigin>(), ValidationError);
}

TEST_CASE("tile_metadata_records_source_policy_and_origins") {
    io::TileSetInfo info;
    info.source = "MYD021KM.A2008001.fits";
    info.policy = "balanced";
    info.tile_set = "nonlabel";
    info.tile_size = 3;
    info.stride = 3;
    info.requested = 5;

    const std::vector<TileOrigin> origins = {{{1, 4}, {2, 5}}, {{7, 10}, {20, 23}}};
    const nlohmann::json j = io::tile_metadata_to_json(info, origins);
    REQUIRE(j.at("source") == "MYD021KM.A2008001.fits");
    REQUIRE(j.at("policy") == "balanced");
    REQUIRE(j.at("tile_set") == "nonlabel");
    REQUIRE(j.at("requested") == 5);
    REQUIRE(j.at("count") == 2);
    REQUIRE(j.at("tiles").size() == 2);
}

TEST_CASE("tile_metadata_file_reads_back_origins") {
    const auto dir = scratch_dir("metadata");
    const auto path = dir / "granule.json";
    const std::vector<TileOrigin> origins = {{{1, 4}, {2, 5}}, {{7, 10}, {20, 23}}};

    io::TileSetInfo info;
    info.source = "granule.fits";
    info.policy = "strided";
    io::write_tile_metadata(path, info, origins);
    REQUIRE(io::read_tile_metadata(path) == origins);

    core::write_text(dir / "broken.json", "{\"tiles\": [");
    REQUIRE_THROWS_AS(io::read_tile_metadata(dir / "broken.json"), IOError);
    core::write_text(dir / "no_tiles.json", "{}");
    REQUIRE_THROWS_AS(io::read_tile_metadata(dir / "no_tiles.json"), ValidationError);
    REQUIRE_THROWS_AS(io::read_tile_metadata(dir / "missing.json"), IOError);

    std::filesystem::remove_all(dir);
}

TEST_CASE("swath_fits_keeps_band_row_column_order") {
    const auto dir = scratch_dir("swath_fits");
    const auto path = dir / "swath.fits";

    Swath swath(3, 4, 6);
    for (int b = 0; b < 3; ++b)
        for (int r = 0; r < 4; ++r)
            for (int c = 0; c < 6; ++c)
                swath(b, r, c) = static_cast<float>(b * 100 + r * 10 + c);

    io::FitsHeader header;
    header.set("ORIGIN", std::string("unit-test"));
    header.set("SCALE", 0.25);
    header.set("GRANULE", 42);
    io::write_swath_fits(path, swath, header);

    const auto [loaded, loaded_header] = io::read_swath_fits(path);
    REQUIRE(loaded.shape() == Shape3{3, 4, 6});
    REQUIRE(loaded(2, 3, 5) == 235.0f);
    REQUIRE(loaded(1, 0, 4) == 104.0f);
    REQUIRE(loaded_header.get_string("ORIGIN") == std::string("unit-test"));
    REQUIRE(loaded_header.get_double("SCALE") == 0.25);
    REQUIRE(loaded_header.get_int("GRANULE") == 42);
    REQUIRE(loaded_header.get_bool("SIMPLE") == true);

    std::filesystem::remove_all(dir);
}

TEST_CASE("tile_stack_fits_stores_every_tile") {
    const auto dir = scratch_dir("tile_fits");
    const auto path = dir / "tiles.fits";

    TileCollection tiles;
    for (int n = 0; n < 3; ++n) {
        BandStack tile(2, 3, 3);
        tile(1, 2, 0) = static_cast<float>(n + 1);
        tiles.push_back(tile, TileOrigin{{n, n + 3}, {0, 3}});
    }

    io::FitsHeader header;
    header.set("TILESIZE", 3);
    io::write_tile_stack_fits(path, tiles, header);

    const auto [loaded, loaded_header] = io::read_tile_stack_fits(path);
    REQUIRE(loaded.size() == 3);
    REQUIRE(loaded[2].shape() == Shape3{2, 3, 3});
    REQUIRE(loaded[2](1, 2, 0) == 3.0f);
    REQUIRE(loaded_header.get_int("NTILES") == 3);
    REQUIRE(loaded_header.get_int("TILESIZE") == 3);

    std::filesystem::remove_all(dir);
}

TEST_CASE("empty_tile_stack_fits_keeps_header_cards") {
    const auto dir = scratch_dir("empty_tile_fits");
    const auto path = dir / "empty.fits";

    io::FitsHeader header;
    header.set("TILESET", std::string("nonlabel"));
    header.set("NREQ", 4);
    io::write_tile_stack_fits(path, TileCollection{}, header);

    const auto [loaded, loaded_header] = io::read_tile_stack_fits(path);
    REQUIRE(loaded.empty());
    REQUIRE(loaded_header.get_int("NTILES") == 0);
    REQUIRE(loaded_header.get_int("NREQ") == 4);
    REQUIRE(loaded_header.get_string("TILESET") == std::string("nonlabel"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("reading_a_missing_swath_raises_fits_error") {
    REQUIRE_THROWS_AS(io::read_swath_fits("/nonexistent/swath.fits"), FitsError);
}

TEST_CASE("writing_a_tile_stack_into_a_missing_directory_raises_fits_error") {
    io::FitsHeader header;
    REQUIRE_THROWS_AS(
        io::write_tile_stack_fits("/nonexistent/dir/tiles.fits", TileCollection{}, header),
        FitsError);
}

TEST_CASE("glob_match_supports_alternatives") {
    REQUIRE(core::glob_match("*.fits;*.fit", "a.fit"));
    REQUIRE(core::glob_match("MYD*.fits", "MYD021KM.fits"));
    REQUIRE_FALSE(core::glob_match("MYD*.fits", "MOD021KM.fits"));
    REQUIRE(core::glob_match("swath_?.fits", "swath_1.fits"));
}
