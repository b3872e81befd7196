#pragma once

#include "swath_sampler/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace swath_sampler::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// 3-D cube: NAXIS1 = columns, NAXIS2 = rows, NAXIS3 = bands.
std::pair<Swath, FitsHeader> read_swath_fits(const fs::path& path);

void write_swath_fits(const fs::path& path, const Swath& swath, const FitsHeader& header);

// 4-D cube: NAXIS1 = tile width, NAXIS2 = tile height, NAXIS3 = bands,
// NAXIS4 = tiles. An empty collection is written as a header-only HDU with
// NTILES = 0.
void write_tile_stack_fits(const fs::path& path, const TileCollection& tiles,
                           const FitsHeader& header);

std::pair<std::vector<BandStack>, FitsHeader> read_tile_stack_fits(const fs::path& path);

} // namespace swath_sampler::io
