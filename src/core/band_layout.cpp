#include "swath_sampler/core/band_layout.hpp"
#include "swath_sampler/core/errors.hpp"

namespace swath_sampler {

BandLayout::BandLayout(const Shape3& swath_shape) : swath_shape_(swath_shape) {}

BandLayout BandLayout::modis_cloudsat() {
    BandLayout layout({27, 2030, 1350});
    layout.set_channel("radiance", {0, 13});
    layout.set_channel("latitude", {13, 1});
    layout.set_channel("longitude", {14, 1});
    layout.set_channel("liquid_water_path", {15, 1});
    layout.set_channel("cloud_optical_depth", {16, 1});
    layout.set_channel("cloud_top_pressure", {17, 1});
    layout.set_channel(kCloudMask, {18, 1});
    layout.set_channel(kLabels, {19, 8});
    return layout;
}

void BandLayout::set_channel(const std::string& name, BandRange range) {
    channels_[name] = range;
}

bool BandLayout::has_channel(const std::string& name) const {
    return channels_.find(name) != channels_.end();
}

BandRange BandLayout::channel(const std::string& name) const {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        throw ValidationError("band layout has no channel '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> BandLayout::channel_names() const {
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto& [name, range] : channels_) {
        names.push_back(name);
    }
    return names;
}

void BandLayout::validate() const {
    if (swath_shape_[0] < 1 || swath_shape_[1] < 1 || swath_shape_[2] < 1) {
        throw ValidationError("band_layout.shape must be positive, got " +
                              shape_to_string(swath_shape_));
    }
    for (const auto& [name, range] : channels_) {
        if (range.count < 1) {
            throw ValidationError("band_layout channel '" + name + "' must cover >= 1 band");
        }
        if (range.first < 0 || range.end() > swath_shape_[0]) {
            throw ValidationError("band_layout channel '" + name + "' lies outside [0," +
                                  std::to_string(swath_shape_[0]) + ")");
        }
    }
    if (!has_channel(kCloudMask)) {
        throw ValidationError("band_layout must define 'cloud_mask'");
    }
    if (channel(kCloudMask).count != 1) {
        throw ValidationError("band_layout.cloud_mask must be exactly one band");
    }
    if (!has_channel(kLabels)) {
        throw ValidationError("band_layout must define 'labels'");
    }
    if (label_bands().contains(cloud_mask_band())) {
        throw ValidationError("band_layout.labels must not contain the cloud_mask band");
    }
}

} // namespace swath_sampler
