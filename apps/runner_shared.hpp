#pragma once

#include <cstdint>
#include <filesystem>
#include <random>
#include <streambuf>
#include <string>
#include <vector>

namespace swath_sampler::runner {

std::string format_bytes(uint64_t bytes);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

// Generator for the swath at `swath_idx`; seed < 0 draws from random_device.
std::mt19937 make_swath_rng(long long seed, size_t swath_idx);

// Per-run swath counters. Failed and quarantined swaths both make the run
// unsuccessful.
struct RunTally {
  int ok = 0;
  int skipped = 0;
  int quarantined = 0;
  int failed = 0;
  bool aborted = false;

  bool succeeded() const;
  // "ok", "partial" or "aborted" for the run_end event.
  std::string status() const;
  int exit_code() const;
};

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace swath_sampler::runner
