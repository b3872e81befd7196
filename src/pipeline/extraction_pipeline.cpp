#include "swath_sampler/pipeline/extraction_pipeline.hpp"

#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/core/utils.hpp"
#include "swath_sampler/io/fits_io.hpp"
#include "swath_sampler/io/metadata_io.hpp"
#include "swath_sampler/sampling/label_tiles.hpp"
#include "swath_sampler/sampling/samplers.hpp"

#include <filesystem>
#include <sstream>

namespace swath_sampler::pipeline {

namespace fs = std::filesystem;

SamplingOutcome sample_swath(const Swath& swath, const config::Config& cfg, std::mt19937& rng) {
    const int tile_size = cfg.sampling.tile_size;
    const int stride = cfg.sampling.stride;
    const SamplingPolicy policy = cfg.sampling_policy();

    SamplingOutcome out;
    switch (policy) {
        case SamplingPolicy::BALANCED: {
            sampling::BalancedTileSet balanced = sampling::extract_labels_and_cloud_tiles(
                swath, cfg.layout(), tile_size, stride, rng, cfg.shortfall());
            out.requested = balanced.nonlabel_requested;
            out.available = balanced.nonlabel_available;
            out.shortfall = balanced.shortfall();
            out.sets.push_back({"label", std::move(balanced.label), 0});
            out.sets.push_back({"nonlabel", std::move(balanced.nonlabel), out.requested});
            break;
        }
        case SamplingPolicy::CLOUD: {
            sampling::CloudSample cloud = sampling::cloud_masked_random_sample(
                swath, cfg.layout(), static_cast<size_t>(cfg.sampling.cloud_tiles), tile_size,
                stride, rng, cfg.shortfall());
            out.requested = cloud.requested;
            out.available = cloud.available;
            out.shortfall = cloud.shortfall();
            out.sets.push_back({"cloud", std::move(cloud.tiles), out.requested});
            break;
        }
        case SamplingPolicy::RANDOM:
            out.sets.push_back({"random", sampling::random_tile_sample(swath, tile_size, rng), 0});
            break;
        case SamplingPolicy::STRIDED:
            out.sets.push_back(
                {"strided", sampling::strided_tile_sample(swath, tile_size, stride), 0});
            break;
    }
    return out;
}

TileSetPaths tile_set_paths(const fs::path& output_dir, const std::string& set_name,
                            const std::string& stem) {
    return {output_dir / set_name / "tiles" / (stem + ".fits"),
            output_dir / set_name / "metadata" / (stem + ".json")};
}

std::vector<std::string> tile_set_names(SamplingPolicy policy) {
    if (policy == SamplingPolicy::BALANCED) {
        return {"label", "nonlabel"};
    }
    return {sampling_policy_to_string(policy)};
}

void persist_tile_sets(const SamplingOutcome& outcome, const fs::path& output_dir,
                       const std::string& swath_name, const config::Config& cfg) {
    const std::string stem = fs::path(swath_name).stem().string();
    const std::string policy = sampling_policy_to_string(cfg.sampling_policy());

    for (const TileSet& set : outcome.sets) {
        const TileSetPaths paths = tile_set_paths(output_dir, set.name, stem);
        fs::create_directories(paths.tiles.parent_path());

        io::FitsHeader header;
        header.set("SOURCE", swath_name);
        header.set("POLICY", policy);
        header.set("TILESET", set.name);
        header.set("TILESIZE", cfg.sampling.tile_size);
        header.set("STRIDE", cfg.sampling.stride);
        header.set("NREQ", static_cast<int>(set.requested));
        io::write_tile_stack_fits(paths.tiles, set.tiles, header);

        if (cfg.output.write_metadata) {
            fs::create_directories(paths.metadata.parent_path());
            io::TileSetInfo info;
            info.source = swath_name;
            info.policy = policy;
            info.tile_set = set.name;
            info.tile_size = cfg.sampling.tile_size;
            info.stride = cfg.sampling.stride;
            info.requested = set.requested;
            io::write_tile_metadata(paths.metadata, info, set.tiles.origins);
        }
    }
}

static bool outputs_exist(const fs::path& output_dir, const std::string& stem,
                          const config::Config& cfg) {
    for (const std::string& name : tile_set_names(cfg.sampling_policy())) {
        const TileSetPaths paths = tile_set_paths(output_dir, name, stem);
        if (!fs::exists(paths.tiles)) return false;
        if (cfg.output.write_metadata && !fs::exists(paths.metadata)) return false;
    }
    return true;
}

// Each message reaches the stream in a single write.
static void write_diag(std::ostream& diag, const std::ostringstream& oss) {
    diag << oss.str();
    diag.flush();
}

static void quarantine(const fs::path& swath_path, const fs::path& output_dir,
                       const config::Config& cfg, SwathResult& result, std::ostream& diag) {
    const fs::path dst = output_dir / cfg.output.quarantine_dir / swath_path.filename();
    try {
        core::safe_hardlink_or_copy(swath_path, dst);
        result.status = SwathStatus::QUARANTINED;
        std::ostringstream oss;
        oss << "[QUARANTINE] " << result.swath_name << " -> " << dst.string() << "\n";
        write_diag(diag, oss);
    } catch (const fs::filesystem_error& e) {
        result.status = SwathStatus::FAILED;
        result.error_message += " (quarantine failed: " + std::string(e.what()) + ")";
    }
}

SwathResult process_swath(const fs::path& swath_path, const fs::path& output_dir,
                          const config::Config& cfg, std::mt19937& rng, std::ostream& diag) {
    SwathResult result;
    result.swath_name = swath_path.filename().string();
    const std::string stem = swath_path.stem().string();

    if (!cfg.output.overwrite && outputs_exist(output_dir, stem, cfg)) {
        result.status = SwathStatus::SKIPPED;
        std::ostringstream oss;
        oss << "[EXTRACT] " << result.swath_name << " already extracted, skipping\n";
        write_diag(diag, oss);
        return result;
    }

    Swath swath;
    try {
        swath = io::read_swath_fits(swath_path).first;
    } catch (const IOError& e) {
        result.error_message = e.what();
        quarantine(swath_path, output_dir, cfg, result, diag);
        return result;
    }

    if (cfg.completeness.enabled) {
        result.completeness = sampling::check_completeness(swath, cfg.completeness.fill_value);
        sampling::report_completeness(result.completeness, result.swath_name, diag);
    }

    try {
        result.sampling = sample_swath(swath, cfg, rng);
    } catch (const ValidationError& e) {
        result.error_message = e.what();
        quarantine(swath_path, output_dir, cfg, result, diag);
        return result;
    } catch (const InsufficientCandidatesError& e) {
        result.error_message = e.what();
        result.status = SwathStatus::FAILED;
        return result;
    }

    std::ostringstream oss;
    for (const TileSet& set : result.sampling.sets) {
        oss << "[EXTRACT] " << result.swath_name << ": " << set.tiles.size() << " " << set.name
            << " tiles\n";
    }
    write_diag(diag, oss);

    persist_tile_sets(result.sampling, output_dir, result.swath_name, cfg);
    result.status = SwathStatus::OK;
    return result;
}

} // namespace swath_sampler::pipeline
