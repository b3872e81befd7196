#include "swath_sampler/config/configuration.hpp"
#include "swath_sampler/core/errors.hpp"

#include <fstream>

namespace swath_sampler::config {

static void read_int_triple(const YAML::Node& n, std::array<int, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
        out[2] = n[2].as<int>();
    }
}

// Accepts either a bare band index or [first, count].
static std::array<int, 2> read_band_range(const std::string& name, const YAML::Node& n) {
    if (n.IsScalar()) {
        return {n.as<int>(), 1};
    }
    if (n.IsSequence() && n.size() == 2) {
        return {n[0].as<int>(), n[1].as<int>()};
    }
    throw ConfigError("band_layout.channels." + name + " must be an index or [first, count]");
}

BandLayoutConfig BandLayoutConfig::from_layout(const BandLayout& layout) {
    BandLayoutConfig out;
    out.shape = layout.swath_shape();
    for (const std::string& name : layout.channel_names()) {
        const BandRange range = layout.channel(name);
        out.channels[name] = {range.first, range.count};
    }
    return out;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["pattern"]) cfg.input.pattern = i["pattern"].as<std::string>();
            if (i["max_swaths"]) cfg.input.max_swaths = i["max_swaths"].as<int>();
        }

        if (node["sampling"]) {
            auto s = node["sampling"];
            if (s["policy"]) cfg.sampling.policy = s["policy"].as<std::string>();
            if (s["tile_size"]) cfg.sampling.tile_size = s["tile_size"].as<int>();
            if (s["stride"]) cfg.sampling.stride = s["stride"].as<int>();
            if (s["seed"]) cfg.sampling.seed = s["seed"].as<long long>();
            if (s["shortfall_policy"]) cfg.sampling.shortfall_policy = s["shortfall_policy"].as<std::string>();
            if (s["cloud_tiles"]) cfg.sampling.cloud_tiles = s["cloud_tiles"].as<int>();
        }

        if (node["completeness"]) {
            auto c = node["completeness"];
            if (c["enabled"]) cfg.completeness.enabled = c["enabled"].as<bool>();
            if (c["fill_value"] && !c["fill_value"].IsNull()) {
                cfg.completeness.fill_value = c["fill_value"].as<float>();
            }
        }

        if (node["band_layout"]) {
            auto b = node["band_layout"];
            read_int_triple(b["shape"], cfg.band_layout.shape);
            if (b["channels"]) {
                auto ch = b["channels"];
                if (!ch.IsMap()) {
                    throw ConfigError("band_layout.channels must be a mapping");
                }
                cfg.band_layout.channels.clear();
                for (const auto& kv : ch) {
                    const std::string name = kv.first.as<std::string>();
                    cfg.band_layout.channels[name] = read_band_range(name, kv.second);
                }
            }
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["quarantine_dir"]) cfg.output.quarantine_dir = o["quarantine_dir"].as<std::string>();
            if (o["write_metadata"]) cfg.output.write_metadata = o["write_metadata"].as<bool>();
            if (o["overwrite"]) cfg.output.overwrite = o["overwrite"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["input"]["pattern"] = input.pattern;
    node["input"]["max_swaths"] = input.max_swaths;

    node["sampling"]["policy"] = sampling.policy;
    node["sampling"]["tile_size"] = sampling.tile_size;
    node["sampling"]["stride"] = sampling.stride;
    node["sampling"]["seed"] = sampling.seed;
    node["sampling"]["shortfall_policy"] = sampling.shortfall_policy;
    node["sampling"]["cloud_tiles"] = sampling.cloud_tiles;

    node["completeness"]["enabled"] = completeness.enabled;
    if (completeness.fill_value) {
        node["completeness"]["fill_value"] = *completeness.fill_value;
    } else {
        node["completeness"]["fill_value"] = YAML::Node(YAML::NodeType::Null);
    }

    YAML::Node shape(YAML::NodeType::Sequence);
    for (int v : band_layout.shape) shape.push_back(v);
    node["band_layout"]["shape"] = shape;
    for (const auto& [name, range] : band_layout.channels) {
        YAML::Node r(YAML::NodeType::Sequence);
        r.push_back(range[0]);
        r.push_back(range[1]);
        node["band_layout"]["channels"][name] = r;
    }

    node["output"]["quarantine_dir"] = output.quarantine_dir;
    node["output"]["write_metadata"] = output.write_metadata;
    node["output"]["overwrite"] = output.overwrite;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::validate() const {
    if (input.pattern.empty()) {
        throw ValidationError("input.pattern must not be empty");
    }
    if (input.max_swaths < 0) {
        throw ValidationError("input.max_swaths must be >= 0");
    }

    SamplingPolicy sp;
    if (!string_to_sampling_policy(sampling.policy, sp)) {
        throw ValidationError("sampling.policy must be one of balanced|random|strided|cloud");
    }
    if (sampling.tile_size < 1) {
        throw ValidationError("sampling.tile_size must be >= 1");
    }
    if (sampling.stride < 1) {
        throw ValidationError("sampling.stride must be >= 1");
    }
    if (sampling.seed < -1) {
        throw ValidationError("sampling.seed must be -1 (random) or >= 0");
    }
    ShortfallPolicy sf;
    if (!string_to_shortfall_policy(sampling.shortfall_policy, sf)) {
        throw ValidationError("sampling.shortfall_policy must be one of accept|warn|error");
    }
    if (sampling.cloud_tiles < 0) {
        throw ValidationError("sampling.cloud_tiles must be >= 0");
    }

    layout().validate();

    if (output.quarantine_dir.empty()) {
        throw ValidationError("output.quarantine_dir must not be empty");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 32) {
        throw ValidationError("runtime.parallel_workers must be in [1,32]");
    }
}

BandLayout Config::layout() const {
    BandLayout out(band_layout.shape);
    for (const auto& [name, range] : band_layout.channels) {
        out.set_channel(name, {range[0], range[1]});
    }
    return out;
}

SamplingPolicy Config::sampling_policy() const {
    SamplingPolicy sp = SamplingPolicy::BALANCED;
    if (!string_to_sampling_policy(sampling.policy, sp)) {
        throw ValidationError("unknown sampling.policy '" + sampling.policy + "'");
    }
    return sp;
}

ShortfallPolicy Config::shortfall() const {
    ShortfallPolicy sf = ShortfallPolicy::WARN;
    if (!string_to_shortfall_policy(sampling.shortfall_policy, sf)) {
        throw ValidationError("unknown sampling.shortfall_policy '" +
                              sampling.shortfall_policy + "'");
    }
    return sf;
}

} // namespace swath_sampler::config
