#pragma once

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace nrt_predict::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
std::string random_hex(int n_chars);

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);

// Hash utilities
constexpr size_t kDigestBlockSize = 2 << 15;

std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_stream(std::istream& in, size_t block_size = kDigestBlockSize);

// Memory utilities
std::string format_bytes(uint64_t bytes);
uint64_t current_rss_bytes();

// Raster statistics
size_t count_nan(const Raster& raster);
double nan_fraction(const Raster& raster);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace nrt_predict::core
