#pragma once

#include "radbatch/core/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace radbatch::aggregation {

namespace fs = std::filesystem;

class RasterDecoder {
public:
    virtual ~RasterDecoder() = default;
    virtual Matrix2Df decode(const fs::path& path) = 0;
};

// Decodes image files through OpenCV (io::decode_raster).
class FileRasterDecoder : public RasterDecoder {
public:
    Matrix2Df decode(const fs::path& path) override;
};

// Decode-once store for one aggregation pass. Entries are immutable.
class RasterCache {
public:
    explicit RasterCache(RasterDecoder& decoder);

    std::shared_ptr<const Matrix2Df> get(const fs::path& path);

    size_t size() const;
    size_t decode_count() const;
    void clear();

private:
    RasterDecoder& decoder_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const Matrix2Df>> entries_;
    size_t decodes_ = 0;
};

} // namespace radbatch::aggregation
