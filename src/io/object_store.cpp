#include "nrt_predict/io/object_store.hpp"
#include "nrt_predict/core/errors.hpp"

#include <cpl_error.h>
#include <cpl_vsi.h>

#include <memory>

namespace nrt_predict::io {

namespace {

constexpr size_t kReadChunk = 1 << 20;

struct VsiCloser {
    void operator()(VSILFILE* fp) const {
        if (fp) VSIFCloseL(fp);
    }
};

std::string bucket_prefix(const std::string& bucket) {
    return "/vsis3/" + bucket + "/";
}

} // namespace

GdalObjectStore::GdalObjectStore(const std::vector<std::string>& buckets)
    : buckets_(buckets.begin(), buckets.end()) {
    for (const auto& bucket : buckets_) {
        VSISetPathSpecificOption(bucket_prefix(bucket).c_str(), "AWS_NO_SIGN_REQUEST", "YES");
    }
}

std::vector<uint8_t> GdalObjectStore::fetch(const std::string& bucket, const std::string& key) {
    if (buckets_.count(bucket) == 0) {
        throw IOError("bucket '" + bucket + "' was not configured for unsigned access");
    }
    const std::string path = bucket_prefix(bucket) + key;

    CPLErrorReset();
    std::unique_ptr<VSILFILE, VsiCloser> fp(VSIFOpenL(path.c_str(), "rb"));
    if (!fp) {
        const char* msg = CPLGetLastErrorMsg();
        throw IOError("cannot fetch s3://" + bucket + "/" + key +
                      (msg && *msg ? std::string(": ") + msg : std::string()));
    }

    std::vector<uint8_t> bytes;
    std::vector<uint8_t> chunk(kReadChunk);
    for (;;) {
        const size_t n = VSIFReadL(chunk.data(), 1, chunk.size(), fp.get());
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        if (n < chunk.size()) {
            if (!VSIFEofL(fp.get())) {
                throw IOError("short read fetching s3://" + bucket + "/" + key);
            }
            break;
        }
    }
    return bytes;
}

} // namespace nrt_predict::io
