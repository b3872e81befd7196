#pragma once

#include "swath_sampler/config/configuration.hpp"
#include "swath_sampler/core/types.hpp"
#include "swath_sampler/sampling/completeness.hpp"

#include <cstddef>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace swath_sampler::pipeline {

// One named output set: "label"/"nonlabel" for balanced sampling, the
// policy name otherwise.
struct TileSet {
    std::string name;
    TileCollection tiles;
    size_t requested = 0;  // 0 where the policy has no target count
};

struct SamplingOutcome {
    std::vector<TileSet> sets;
    bool shortfall = false;
    size_t requested = 0;
    size_t available = 0;
};

// Runs the configured sampling policy on an in-memory swath.
SamplingOutcome sample_swath(const Swath& swath, const config::Config& cfg, std::mt19937& rng);

struct TileSetPaths {
    fs::path tiles;
    fs::path metadata;
};

// <output_dir>/<set>/tiles/<stem>.fits and <output_dir>/<set>/metadata/<stem>.json
TileSetPaths tile_set_paths(const fs::path& output_dir, const std::string& set_name,
                            const std::string& stem);

std::vector<std::string> tile_set_names(SamplingPolicy policy);

void persist_tile_sets(const SamplingOutcome& outcome, const fs::path& output_dir,
                       const std::string& swath_name, const config::Config& cfg);

enum class SwathStatus {
    OK,
    SKIPPED,
    QUARANTINED,
    FAILED
};

inline std::string swath_status_to_string(SwathStatus status) {
    switch (status) {
        case SwathStatus::OK: return "ok";
        case SwathStatus::SKIPPED: return "skipped";
        case SwathStatus::QUARANTINED: return "quarantined";
        case SwathStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

struct SwathResult {
    std::string swath_name;
    SwathStatus status = SwathStatus::FAILED;
    std::string error_message;
    sampling::CompletenessReport completeness;
    SamplingOutcome sampling;
};

// Load, check, sample and persist one swath. Validation and read failures
// copy the input into <output_dir>/<quarantine_dir>/ and are reported in the
// result instead of being thrown.
SwathResult process_swath(const fs::path& swath_path, const fs::path& output_dir,
                          const config::Config& cfg, std::mt19937& rng, std::ostream& diag);

} // namespace swath_sampler::pipeline
