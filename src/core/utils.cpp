#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include <openssl/evp.h>
#include <unistd.h>

namespace nrt_predict::core {

namespace {

std::string hex_digest(const unsigned char* hash, unsigned int hash_len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw NrtError("Cannot initialise SHA256 digest");
        }
    }
    ~DigestContext() { EVP_MD_CTX_free(ctx_); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    void update(const void* data, size_t size) {
        if (size == 0) return;
        if (EVP_DigestUpdate(ctx_, data, size) != 1) {
            throw NrtError("SHA256 digest update failed");
        }
    }

    std::string final_hex() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
            throw NrtError("SHA256 digest finalisation failed");
        }
        return hex_digest(hash, hash_len);
    }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace

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

std::string random_hex(int n_chars) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(std::max(0, n_chars)));
    for (int i = 0; i < n_chars; ++i) {
        out.push_back(hex[dis(gen)]);
    }
    return out;
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_' << random_hex(8);
    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    DigestContext ctx;
    ctx.update(data.data(), data.size());
    return ctx.final_hex();
}

std::string sha256_stream(std::istream& in, size_t block_size) {
    DigestContext ctx;
    std::vector<char> buffer(std::max<size_t>(block_size, 1));
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        ctx.update(buffer.data(), static_cast<size_t>(in.gcount()));
    }
    return ctx.final_hex();
}

std::string format_bytes(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < (sizeof(kUnits) / sizeof(kUnits[0]))) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " "
        << kUnits[unit];
    return oss.str();
}

uint64_t current_rss_bytes() {
    std::ifstream statm("/proc/self/statm");
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0;
    }
    const long page = sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<uint64_t>(page > 0 ? page : 4096);
}

size_t count_nan(const Raster& raster) {
    size_t n = 0;
    for (const auto& band : raster.bands) {
        const float* p = band.data();
        for (Eigen::Index i = 0; i < band.size(); ++i) {
            if (std::isnan(p[i])) ++n;
        }
    }
    return n;
}

double nan_fraction(const Raster& raster) {
    size_t total = 0;
    for (const auto& band : raster.bands) {
        total += static_cast<size_t>(band.size());
    }
    if (total == 0) return 0.0;
    return static_cast<double>(count_nan(raster)) / static_cast<double>(total);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

} // namespace nrt_predict::core
