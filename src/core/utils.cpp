#include "swath_sampler/core/utils.hpp"
#include "swath_sampler/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/evp.h>

namespace swath_sampler::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> files;

    if (!fs::exists(input_dir) || !fs::is_directory(input_dir)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (glob_match(pattern, filename)) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

void safe_hardlink_or_copy(const fs::path& src, const fs::path& dst) {
    fs::create_directories(dst.parent_path());
    std::error_code ec;
    fs::create_hard_link(src, dst, ec);
    if (ec) {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    }
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw IOError("Cannot allocate SHA-256 context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("Cannot initialise SHA-256 digest");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            throw IOError("SHA-256 update failed: " + path.string());
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("SHA-256 finalise failed: " + path.string());
    }
    EVP_MD_CTX_free(ctx);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::istringstream alternatives(pattern);
    std::string alt;
    while (std::getline(alternatives, alt, ';')) {
        if (alt.empty()) continue;
        std::string regex_pattern;
        for (char c : alt) {
            switch (c) {
                case '*': regex_pattern += ".*"; break;
                case '?': regex_pattern += "."; break;
                case '.': regex_pattern += "\\."; break;
                case '+': case '(': case ')': case '{': case '}':
                case '^': case '$': case '|': case '\\':
                    regex_pattern += '\\';
                    regex_pattern += c;
                    break;
                default: regex_pattern += c; break;
            }
        }

        std::regex re(regex_pattern, std::regex::icase);
        if (std::regex_match(str, re)) return true;
    }
    return false;
}

} // namespace swath_sampler::core
