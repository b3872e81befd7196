#pragma once

#include "swath_sampler/core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace swath_sampler {

// Contiguous block of bands [first, first + count)
struct BandRange {
    int first = 0;
    int count = 1;

    int end() const { return first + count; }
    bool contains(int band) const { return band >= first && band < end(); }
};

// Logical channel names for the band axis of a swath.
class BandLayout {
public:
    static constexpr const char* kCloudMask = "cloud_mask";
    static constexpr const char* kLabels = "labels";

    BandLayout() = default;
    explicit BandLayout(const Shape3& swath_shape);

    // MODIS radiances + geolocation + L2 products + cloud mask + CloudSat labels
    static BandLayout modis_cloudsat();

    void set_channel(const std::string& name, BandRange range);
    bool has_channel(const std::string& name) const;
    BandRange channel(const std::string& name) const;
    std::vector<std::string> channel_names() const;

    int cloud_mask_band() const { return channel(kCloudMask).first; }
    BandRange label_bands() const { return channel(kLabels); }

    const Shape3& swath_shape() const { return swath_shape_; }
    int band_count() const { return swath_shape_[0]; }

    void validate() const;

private:
    Shape3 swath_shape_{0, 0, 0};
    std::map<std::string, BandRange> channels_;
};

} // namespace swath_sampler
