#include "radbatch/aggregation/raster_cache.hpp"
#include "radbatch/io/raster_io.hpp"

namespace radbatch::aggregation {

Matrix2Df FileRasterDecoder::decode(const fs::path& path) {
    return io::decode_raster(path);
}

RasterCache::RasterCache(RasterDecoder& decoder) : decoder_(decoder) {}

std::shared_ptr<const Matrix2Df> RasterCache::get(const fs::path& path) {
    const std::string key = path.lexically_normal().string();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    ++decodes_;
    auto grid = std::make_shared<const Matrix2Df>(decoder_.decode(path));
    entries_.emplace(key, grid);
    return grid;
}

size_t RasterCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t RasterCache::decode_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decodes_;
}

void RasterCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace radbatch::aggregation
