#include "swath_sampler/io/metadata_io.hpp"
#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/core/utils.hpp"

#include <fstream>

namespace swath_sampler {

void to_json(nlohmann::json& j, const TileOrigin& origin) {
    j = nlohmann::json::array({{origin.rows.start, origin.rows.end},
                               {origin.cols.start, origin.cols.end}});
}

void from_json(const nlohmann::json& j, TileOrigin& origin) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_array() || j[0].size() != 2 ||
        !j[1].is_array() || j[1].size() != 2) {
        throw ValidationError("tile metadata entry must be [[r0, r1], [c0, c1]], got " + j.dump());
    }
    origin.rows = {j[0][0].get<int>(), j[0][1].get<int>()};
    origin.cols = {j[1][0].get<int>(), j[1][1].get<int>()};
}

} // namespace swath_sampler

namespace swath_sampler::io {

using json = nlohmann::json;

json tile_metadata_to_json(const TileSetInfo& info, const std::vector<TileOrigin>& origins) {
    return {
        {"source", info.source},
        {"policy", info.policy},
        {"tile_set", info.tile_set},
        {"tile_size", info.tile_size},
        {"stride", info.stride},
        {"requested", info.requested},
        {"count", origins.size()},
        {"tiles", origins}
    };
}

void write_tile_metadata(const fs::path& path, const TileSetInfo& info,
                         const std::vector<TileOrigin>& origins) {
    core::write_text(path, tile_metadata_to_json(info, origins).dump(2) + "\n");
}

std::vector<TileOrigin> read_tile_metadata(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open tile metadata: " + path.string());
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw IOError("Cannot parse tile metadata " + path.string() + ": " + e.what());
    }
    if (!j.contains("tiles")) {
        throw ValidationError("tile metadata has no 'tiles' array: " + path.string());
    }
    return j["tiles"].get<std::vector<TileOrigin>>();
}

} // namespace swath_sampler::io
