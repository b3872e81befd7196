#pragma once

#include "swath_sampler/core/band_layout.hpp"
#include "swath_sampler/core/types.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace swath_sampler::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = false;
};

struct InputConfig {
  std::string pattern = "*.fits;*.fit;*.fts";
  int max_swaths = 0; // 0 = no limit
};

struct SamplingConfig {
  std::string policy = "balanced";        // balanced | random | strided | cloud
  int tile_size = 3;
  int stride = 3;
  long long seed = -1;                    // -1 = non-deterministic
  std::string shortfall_policy = "warn";  // accept | warn | error
  int cloud_tiles = 100;                  // tile count for the cloud policy
};

struct CompletenessConfig {
  bool enabled = true;
  std::optional<float> fill_value;        // sentinel counted as missing besides NaN
};

struct BandLayoutConfig {
  std::array<int, 3> shape{0, 0, 0};
  // name -> {first, count}
  std::map<std::string, std::array<int, 2>> channels;

  static BandLayoutConfig from_layout(const BandLayout &layout);
};

struct OutputConfig {
  std::string quarantine_dir = "corrupt";
  bool write_metadata = true;
  bool overwrite = true;
};

struct RuntimeConfig {
  int parallel_workers = 1;
};

struct Config {
  PipelineConfig pipeline;
  InputConfig input;
  SamplingConfig sampling;
  CompletenessConfig completeness;
  BandLayoutConfig band_layout =
      BandLayoutConfig::from_layout(BandLayout::modis_cloudsat());
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Derived views; valid after validate().
  BandLayout layout() const;
  SamplingPolicy sampling_policy() const;
  ShortfallPolicy shortfall() const;
};

} // namespace swath_sampler::config
