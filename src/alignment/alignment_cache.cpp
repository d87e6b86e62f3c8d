#include "nrt_predict/alignment/alignment_cache.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/image/processing.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

namespace nrt_predict::alignment {

namespace {

constexpr int kScratchNameChars = 32;

} // namespace

std::vector<std::string> unique_sources(const std::vector<config::ModelConfig>& models) {
    std::vector<std::string> sources;
    std::set<std::string> seen;
    std::set<std::string> outputs;

    for (const auto& m : models) {
        for (const auto& ip : m.inputs) {
            if (outputs.count(ip.filename) > 0) continue;
            if (seen.insert(ip.filename).second) {
                sources.push_back(ip.filename);
            }
        }
        outputs.insert(m.output);
    }
    return sources;
}

AlignmentCache::AlignmentCache(io::RasterBackend& backend, GridSpec grid,
                               AlignmentOptions options)
    : backend_(backend), grid_(std::move(grid)), options_(std::move(options)) {
    if (grid_.width <= 0 || grid_.height <= 0) {
        throw NrtError("alignment grid must have a positive size");
    }
}

void AlignmentCache::build(const std::vector<std::string>& sources) {
    for (const auto& id : sources) {
        align(id);
    }
}

const AlignedInput& AlignmentCache::align(const std::string& source_id) {
    auto it = entries_.find(source_id);
    if (it != entries_.end()) {
        return it->second;
    }

    std::string dir = options_.tmpdir.empty() ? "." : options_.tmpdir;
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    const std::string scratch = dir + "/" + core::random_hex(kScratchNameChars);

    AlignedInput aligned;
    try {
        aligned = warp_and_read(source_id, scratch);
    } catch (const std::exception&) {
        if (!options_.nocleanup) backend_.remove(scratch);
        throw;
    }
    if (!options_.nocleanup) {
        backend_.remove(scratch);
    }

    ++alignment_count_;
    order_.push_back(source_id);
    return entries_.emplace(source_id, std::move(aligned)).first->second;
}

AlignedInput AlignmentCache::warp_and_read(const std::string& source_id,
                                           const std::string& scratch) {
    const io::RasterInfo info =
        backend_.warp_to_cutline(source_id, scratch, options_.cutline, grid_.projection);

    AlignedInput aligned;
    aligned.source_id = source_id;
    aligned.data = backend_.read_raster(scratch, grid_.width, grid_.height);
    if (aligned.data.empty()) {
        throw RasterError("aligned input '" + source_id + "' has no bands");
    }

    if (info.nodata) {
        const float nd = static_cast<float>(*info.nodata);
        for (auto& band : aligned.data.bands) {
            image::replace_nodata_with_nan(band, nd);
        }
    }
    // Backends may ignore the buffer size
    image::resample_raster(aligned.data, grid_.width, grid_.height);

    aligned.nodata_fraction = core::nan_fraction(aligned.data);
    aligned.exceeds_nodata_limit = exceeds_nodata_limit(aligned.nodata_fraction);
    return aligned;
}

bool AlignmentCache::contains(const std::string& source_id) const {
    return entries_.count(source_id) > 0;
}

const AlignedInput& AlignmentCache::get(const std::string& source_id) const {
    auto it = entries_.find(source_id);
    if (it == entries_.end()) {
        throw NrtError("input '" + source_id + "' has not been aligned");
    }
    return it->second;
}

Raster AlignmentCache::copy(const std::string& source_id) const {
    return get(source_id).data;
}

std::vector<std::string> AlignmentCache::advisories() const {
    std::vector<std::string> ids;
    for (const auto& id : order_) {
        if (entries_.at(id).exceeds_nodata_limit) ids.push_back(id);
    }
    return ids;
}

} // namespace nrt_predict::alignment
