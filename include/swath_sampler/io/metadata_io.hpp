#pragma once

#include "swath_sampler/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace swath_sampler {

// [[row_start, row_end], [col_start, col_end]]
void to_json(nlohmann::json& j, const TileOrigin& origin);
void from_json(const nlohmann::json& j, TileOrigin& origin);

} // namespace swath_sampler

namespace swath_sampler::io {

struct TileSetInfo {
    std::string source;
    std::string policy;
    std::string tile_set;
    int tile_size = 0;
    int stride = 0;
    size_t requested = 0;
};

nlohmann::json tile_metadata_to_json(const TileSetInfo& info,
                                     const std::vector<TileOrigin>& origins);

void write_tile_metadata(const fs::path& path, const TileSetInfo& info,
                         const std::vector<TileOrigin>& origins);

std::vector<TileOrigin> read_tile_metadata(const fs::path& path);

} // namespace swath_sampler::io
