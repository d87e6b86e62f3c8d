#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace nrt_predict::io {

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Whole object in memory; throws IOError when it cannot be read
    virtual std::vector<uint8_t> fetch(const std::string& bucket, const std::string& key) = 0;
};

// Anonymous S3 access through GDAL's /vsis3/ file system. Unsigned requests
// are enabled for `buckets` once, on construction; other buckets are refused.
class GdalObjectStore : public ObjectStore {
public:
    explicit GdalObjectStore(const std::vector<std::string>& buckets);

    std::vector<uint8_t> fetch(const std::string& bucket, const std::string& key) override;

private:
    std::set<std::string> buckets_;
};

} // namespace nrt_predict::io
