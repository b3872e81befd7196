#include "swath_sampler/config/configuration.hpp"
#include "swath_sampler/core/errors.hpp"
#include "swath_sampler/core/events.hpp"
#include "swath_sampler/core/types.hpp"
#include "swath_sampler/core/utils.hpp"
#include "swath_sampler/io/fits_io.hpp"
#include "swath_sampler/pipeline/extraction_pipeline.hpp"
#include "swath_sampler/sampling/completeness.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using swath_sampler::runner::TeeBuf;
using swath_sampler::runner::estimate_total_file_bytes;
using swath_sampler::runner::format_bytes;
using swath_sampler::runner::make_swath_rng;

namespace core = swath_sampler::core;
namespace config = swath_sampler::config;
namespace pipeline = swath_sampler::pipeline;
namespace sampling = swath_sampler::sampling;
namespace io = swath_sampler::io;

struct RunOptions {
  std::string config_path;
  std::string input_dir;
  std::string runs_dir;
  std::optional<long long> seed;
  std::optional<int> max_swaths;
  bool dry_run = false;
};

struct CheckOptions {
  std::string input_dir;
  std::string pattern = "*.fits;*.fit;*.fts";
  std::optional<float> fill_value;
};

core::json completeness_json(const sampling::CompletenessReport &report) {
  return {{"total_elements", report.total_elements},
          {"valid_elements", report.valid_elements},
          {"ratio", report.ratio()},
          {"has_missing", report.has_missing()}};
}

int run_command(const RunOptions &opts) {
  using namespace swath_sampler;

  fs::path in_dir(opts.input_dir);
  fs::path runs(opts.runs_dir);

  if (!fs::exists(in_dir)) {
    std::cerr << "Error: Input directory not found: " << opts.input_dir
              << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(opts.config_path);
    if (opts.seed) {
      cfg.sampling.seed = *opts.seed;
    }
    if (opts.max_swaths) {
      cfg.input.max_swaths = *opts.max_swaths;
    }
    cfg.validate();
  } catch (const SwathSamplerError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  auto swaths = core::discover_files(in_dir, cfg.input.pattern);
  if (cfg.input.max_swaths > 0 &&
      swaths.size() > static_cast<size_t>(cfg.input.max_swaths)) {
    swaths.resize(static_cast<size_t>(cfg.input.max_swaths));
  }
  if (swaths.empty()) {
    std::cerr << "Error: No swaths matching '" << cfg.input.pattern
              << "' found in " << opts.input_dir << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  const fs::path run_dir = runs / run_id;
  const fs::path output_dir = run_dir / "outputs";
  fs::create_directories(run_dir / "logs");
  fs::create_directories(output_dir);
  cfg.save(run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const uint64_t total_bytes = estimate_total_file_bytes(swaths);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", opts.config_path},
                     {"input_dir", opts.input_dir},
                     {"run_dir", run_dir.string()},
                     {"swaths_discovered", swaths.size()},
                     {"input_bytes", total_bytes},
                     {"policy", cfg.sampling.policy},
                     {"tile_size", cfg.sampling.tile_size},
                     {"stride", cfg.sampling.stride},
                     {"seed", cfg.sampling.seed},
                     {"shortfall_policy",
                      shortfall_policy_to_string(cfg.shortfall())},
                     {"dry_run", opts.dry_run}},
                    log_file);

  std::cerr << "Run ID: " << run_id << std::endl;
  std::cerr << "Swaths: " << swaths.size() << " (" << format_bytes(total_bytes)
            << ")" << std::endl;
  std::cerr << "Output: " << run_dir.string() << std::endl;

  if (opts.dry_run) {
    std::cerr << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  const int total = static_cast<int>(swaths.size());
  const int workers =
      std::max(1, std::min(cfg.runtime.parallel_workers, total));

  std::atomic<size_t> next{0};
  std::atomic<bool> stop{false};
  std::atomic<int> n_ok{0};
  std::atomic<int> n_skipped{0};
  std::atomic<int> n_quarantined{0};
  std::atomic<int> n_failed{0};
  std::mutex log_mutex;

  auto worker = [&]() {
    for (;;) {
      if (stop.load())
        break;
      const size_t idx = next.fetch_add(1);
      if (idx >= swaths.size())
        break;

      const fs::path &path = swaths[idx];
      const std::string name = path.filename().string();

      core::json start_extra = {{"path", path.string()}};
      try {
        start_extra["sha256"] = core::sha256_file(path);
        start_extra["bytes"] = static_cast<uint64_t>(fs::file_size(path));
      } catch (const IOError &e) {
        start_extra["sha256_error"] = e.what();
      } catch (const fs::filesystem_error &e) {
        start_extra["size_error"] = e.what();
      }
      {
        std::lock_guard<std::mutex> lock(log_mutex);
        emitter.swath_start(run_id, static_cast<int>(idx), total, name,
                            start_extra, log_file);
      }

      std::mt19937 rng = make_swath_rng(cfg.sampling.seed, idx);
      pipeline::SwathResult result;
      try {
        result = pipeline::process_swath(path, output_dir, cfg, rng, std::cerr);
      } catch (const std::exception &e) {
        result.swath_name = name;
        result.status = pipeline::SwathStatus::FAILED;
        result.error_message = e.what();
      }

      std::lock_guard<std::mutex> lock(log_mutex);
      for (const auto &set : result.sampling.sets) {
        emitter.tiles_extracted(run_id, name, set.name, set.tiles.size(),
                                log_file);
      }
      if (result.sampling.shortfall &&
          cfg.shortfall() == ShortfallPolicy::WARN) {
        emitter.warning(run_id,
                        name + ": requested " +
                            std::to_string(result.sampling.requested) +
                            " non-label tiles, only " +
                            std::to_string(result.sampling.available) +
                            " candidates",
                        log_file);
      }
      if (cfg.completeness.enabled && result.completeness.has_missing()) {
        emitter.warning(run_id, name + ": missing values present", log_file);
      }

      core::json end_extra = {
          {"completeness", completeness_json(result.completeness)}};
      if (!result.error_message.empty()) {
        end_extra["error"] = result.error_message;
        emitter.error(run_id, name + ": " + result.error_message, log_file);
      }

      switch (result.status) {
      case pipeline::SwathStatus::OK:
        n_ok.fetch_add(1);
        break;
      case pipeline::SwathStatus::SKIPPED:
        n_skipped.fetch_add(1);
        break;
      case pipeline::SwathStatus::QUARANTINED:
        n_quarantined.fetch_add(1);
        break;
      case pipeline::SwathStatus::FAILED:
        n_failed.fetch_add(1);
        break;
      }
      emitter.swath_end(run_id, name,
                        pipeline::swath_status_to_string(result.status),
                        end_extra, log_file);

      if (cfg.pipeline.abort_on_fail &&
          (result.status == pipeline::SwathStatus::FAILED ||
           result.status == pipeline::SwathStatus::QUARANTINED)) {
        stop.store(true);
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    pool.emplace_back(worker);
  }
  for (auto &t : pool) {
    t.join();
  }

  std::cerr << "[EXTRACT] done: ok=" << n_ok.load()
            << " skipped=" << n_skipped.load()
            << " quarantined=" << n_quarantined.load()
            << " failed=" << n_failed.load() << std::endl;

  runner::RunTally tally;
  tally.ok = n_ok.load();
  tally.skipped = n_skipped.load();
  tally.quarantined = n_quarantined.load();
  tally.failed = n_failed.load();
  tally.aborted = stop.load();
  emitter.run_end(run_id, tally.succeeded(), tally.status(), log_file);
  return tally.exit_code();
}

int check_command(const CheckOptions &opts) {
  using namespace swath_sampler;

  fs::path in_dir(opts.input_dir);
  if (!fs::exists(in_dir)) {
    std::cerr << "Error: Input directory not found: " << opts.input_dir
              << std::endl;
    return 1;
  }

  const auto swaths = core::discover_files(in_dir, opts.pattern);
  if (swaths.empty()) {
    std::cerr << "Error: No swaths matching '" << opts.pattern << "' found in "
              << opts.input_dir << std::endl;
    return 1;
  }

  bool all_read = true;
  for (const auto &path : swaths) {
    const std::string name = path.filename().string();
    core::json data = {{"swath", name}};
    try {
      const Swath swath = io::read_swath_fits(path).first;
      const auto report = sampling::check_completeness(swath, opts.fill_value);
      sampling::report_completeness(report, name, std::cerr);
      data["shape"] = shape_to_string(swath.shape());
      data["completeness"] = completeness_json(report);
    } catch (const IOError &e) {
      data["error"] = e.what();
      all_read = false;
    }
    core::emit_event("completeness", "check", data, std::cout);
  }
  return all_read ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Swath tile sampler"};
  app.require_subcommand(1);

  RunOptions run_opts;
  long long seed = -1;
  int max_swaths = 0;

  auto run_cmd = app.add_subcommand("run", "Extract tiles from every swath");
  run_cmd->add_option("--config", run_opts.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--input-dir", run_opts.input_dir, "Input directory")
      ->required();
  run_cmd->add_option("--runs-dir", run_opts.runs_dir, "Runs directory")
      ->required();
  auto seed_opt = run_cmd->add_option(
      "--seed", seed, "Base seed (overrides sampling.seed, -1 = random)");
  auto max_opt = run_cmd->add_option(
      "--max-swaths", max_swaths, "Limit number of swaths (0 = no limit)");
  run_cmd->add_flag("--dry-run", run_opts.dry_run, "Dry run");

  CheckOptions check_opts;
  float fill_value = 0.0f;
  auto check_cmd =
      app.add_subcommand("check", "Report missing values per swath");
  check_cmd->add_option("--input-dir", check_opts.input_dir, "Input directory")
      ->required();
  check_cmd->add_option("--pattern", check_opts.pattern,
                        "Glob pattern, ';' separates alternatives");
  auto fill_opt = check_cmd->add_option("--fill-value", fill_value,
                                        "Sentinel counted as missing");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    if (seed_opt->count() > 0)
      run_opts.seed = seed;
    if (max_opt->count() > 0)
      run_opts.max_swaths = max_swaths;
    return run_command(run_opts);
  }

  if (check_cmd->parsed()) {
    if (fill_opt->count() > 0)
      check_opts.fill_value = fill_value;
    return check_command(check_opts);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
