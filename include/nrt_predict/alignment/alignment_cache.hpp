#pragma once

#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/types.hpp"
#include "nrt_predict/io/raster_backend.hpp"

#include <map>
#include <string>
#include <vector>

namespace nrt_predict::alignment {

// Aligned inputs with more no-data than this are reported
inline constexpr double kNodataAdvisoryLimit = 0.9;

inline bool exceeds_nodata_limit(double fraction) {
    return fraction > kNodataAdvisoryLimit;
}

struct AlignedInput {
    std::string source_id;
    Raster data; // observation grid, NaN where the source has no data
    double nodata_fraction = 0.0;
    bool exceeds_nodata_limit = false;
};

/**
 * Distinct input sources of all models in first-appearance order. Inputs
 * naming the output of an earlier model are left out; they are aligned
 * once that model has written them.
 */
std::vector<std::string> unique_sources(const std::vector<config::ModelConfig>& models);

struct AlignmentOptions {
    std::string cutline;  // polygon the sources are cropped to
    std::string tmpdir;   // scratch directory for warped files
    bool nocleanup = false;
};

// Holds one aligned raster per distinct source on the observation grid.
class AlignmentCache {
public:
    AlignmentCache(io::RasterBackend& backend, GridSpec grid, AlignmentOptions options);

    // Align every source not already present
    void build(const std::vector<std::string>& sources);

    // Align `source_id` unless cached, then return it
    const AlignedInput& align(const std::string& source_id);

    bool contains(const std::string& source_id) const;

    // Throws NrtError for unknown ids
    const AlignedInput& get(const std::string& source_id) const;

    // Private copy for a consuming model
    Raster copy(const std::string& source_id) const;

    size_t alignment_count() const { return alignment_count_; }

    // Ids whose no-data fraction is above the limit, in alignment order
    std::vector<std::string> advisories() const;

private:
    AlignedInput warp_and_read(const std::string& source_id, const std::string& scratch);

    io::RasterBackend& backend_;
    GridSpec grid_;
    AlignmentOptions options_;
    std::map<std::string, AlignedInput> entries_;
    std::vector<std::string> order_;
    size_t alignment_count_ = 0;
};

} // namespace nrt_predict::alignment
