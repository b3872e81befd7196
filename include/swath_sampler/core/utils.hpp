#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace swath_sampler::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern = "*.fits");
void write_text(const fs::path& path, const std::string& text);
void safe_hardlink_or_copy(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_file(const fs::path& path);

// Glob pattern matching ('*' and '?'; ';' separates alternatives)
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace swath_sampler::core
