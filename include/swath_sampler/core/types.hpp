#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace swath_sampler {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MatrixXb = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// (band, row, column) shape
using Shape3 = std::array<int, 3>;

inline std::string shape_to_string(const Shape3& s) {
    return "(" + std::to_string(s[0]) + ", " + std::to_string(s[1]) + ", " +
           std::to_string(s[2]) + ")";
}

// Band-major multi-band array, indexed (band, row, column).
// Used both for whole swaths and for the tiles cut out of them.
struct BandStack {
    std::vector<Matrix2Df> bands;

    BandStack() = default;
    BandStack(int band_count, int rows, int cols)
        : bands(static_cast<size_t>(band_count), Matrix2Df::Zero(rows, cols)) {}

    int band_count() const { return static_cast<int>(bands.size()); }
    int rows() const { return bands.empty() ? 0 : static_cast<int>(bands.front().rows()); }
    int cols() const { return bands.empty() ? 0 : static_cast<int>(bands.front().cols()); }
    Shape3 shape() const { return {band_count(), rows(), cols()}; }
    size_t element_count() const {
        return static_cast<size_t>(band_count()) * static_cast<size_t>(rows()) *
               static_cast<size_t>(cols());
    }

    float& operator()(int band, int row, int col) { return bands[band](row, col); }
    float operator()(int band, int row, int col) const { return bands[band](row, col); }
};

using Swath = BandStack;

// Half-open pixel interval [start, end)
struct PixelRange {
    int start = 0;
    int end = 0;

    int size() const { return std::max(0, end - start); }
    bool empty() const { return end <= start; }
    bool contains(int v) const { return v >= start && v < end; }

    bool operator==(const PixelRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const PixelRange& o) const { return !(*this == o); }
};

// Where a tile was cut from its swath
struct TileOrigin {
    PixelRange rows;
    PixelRange cols;

    bool operator==(const TileOrigin& o) const { return rows == o.rows && cols == o.cols; }
    bool operator!=(const TileOrigin& o) const { return !(*this == o); }
};

// Tiles and their origins; index i of one always belongs to index i of the other.
struct TileCollection {
    std::vector<BandStack> tiles;
    std::vector<TileOrigin> origins;

    size_t size() const { return tiles.size(); }
    bool empty() const { return tiles.empty(); }

    void push_back(BandStack tile, const TileOrigin& origin) {
        tiles.push_back(std::move(tile));
        origins.push_back(origin);
    }

    void reserve(size_t n) {
        tiles.reserve(n);
        origins.reserve(n);
    }
};

// Sampling policy enumeration
enum class SamplingPolicy {
    BALANCED,
    RANDOM,
    STRIDED,
    CLOUD
};

inline std::string sampling_policy_to_string(SamplingPolicy policy) {
    switch (policy) {
        case SamplingPolicy::BALANCED: return "balanced";
        case SamplingPolicy::RANDOM: return "random";
        case SamplingPolicy::STRIDED: return "strided";
        case SamplingPolicy::CLOUD: return "cloud";
        default: return "unknown";
    }
}

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

inline bool string_to_sampling_policy(const std::string& s, SamplingPolicy& out) {
    const std::string norm = normalize_token(s);
    if (norm == "balanced") { out = SamplingPolicy::BALANCED; return true; }
    if (norm == "random") { out = SamplingPolicy::RANDOM; return true; }
    if (norm == "strided") { out = SamplingPolicy::STRIDED; return true; }
    if (norm == "cloud") { out = SamplingPolicy::CLOUD; return true; }
    return false;
}

// What to do when fewer cloudy candidates exist than were requested
enum class ShortfallPolicy {
    ACCEPT,
    WARN,
    ERROR
};

inline std::string shortfall_policy_to_string(ShortfallPolicy policy) {
    switch (policy) {
        case ShortfallPolicy::ACCEPT: return "accept";
        case ShortfallPolicy::WARN: return "warn";
        case ShortfallPolicy::ERROR: return "error";
        default: return "unknown";
    }
}

inline bool string_to_shortfall_policy(const std::string& s, ShortfallPolicy& out) {
    const std::string norm = normalize_token(s);
    if (norm == "accept") { out = ShortfallPolicy::ACCEPT; return true; }
    if (norm == "warn") { out = ShortfallPolicy::WARN; return true; }
    if (norm == "error") { out = ShortfallPolicy::ERROR; return true; }
    return false;
}

} // namespace swath_sampler
