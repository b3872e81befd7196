#include "runner_shared.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace swath_sampler::runner {

namespace fs = std::filesystem;

std::string format_bytes(uint64_t bytes) {
  static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < (sizeof(kUnits) / sizeof(kUnits[0]))) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " "
      << kUnits[unit];
  return oss.str();
}

uint64_t estimate_total_file_bytes(const std::vector<fs::path> &paths) {
  uint64_t total = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
      continue;
    }
    if (total <= std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(sz)) {
      total += static_cast<uint64_t>(sz);
    } else {
      total = std::numeric_limits<uint64_t>::max();
      break;
    }
  }
  return total;
}

std::mt19937 make_swath_rng(long long seed, size_t swath_idx) {
  if (seed < 0) {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937(seq);
  }
  std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffLL),
                    static_cast<uint32_t>((seed >> 32) & 0xffffffffLL),
                    static_cast<uint32_t>(swath_idx)};
  return std::mt19937(seq);
}

bool RunTally::succeeded() const {
  return failed == 0 && quarantined == 0 && !aborted;
}

std::string RunTally::status() const {
  if (aborted)
    return "aborted";
  return succeeded() ? "ok" : "partial";
}

int RunTally::exit_code() const { return succeeded() ? 0 : 1; }

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace swath_sampler::runner
