#pragma once

#include "radbatch/aggregation/polygon.hpp"
#include "radbatch/aggregation/raster_cache.hpp"
#include "radbatch/io/region_io.hpp"
#include "radbatch/io/result_io.hpp"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace radbatch::aggregation {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct AggregationGroup {
    std::string view_id;
    std::vector<io::Region> regions;
    std::vector<fs::path> rasters;
};

struct GroupingResult {
    std::vector<AggregationGroup> groups;  // sorted by view id
    std::vector<fs::path> unmatched_rasters;
};

// True when `view_id` appears in `raster_stem` as a whole underscore-
// delimited token sequence.
bool raster_matches_view(const std::string& raster_stem, const std::string& view_id);

// Partitions regions by view id and assigns each raster to the group with the
// longest matching view id. Groups without rasters are kept (empty).
GroupingResult group_by_view(const std::vector<io::Region>& regions,
                             const std::vector<fs::path>& rasters);

struct GroupOutcome {
    std::string view_id;
    std::vector<io::ResultRecord> records;
    std::vector<std::string> warnings;
    size_t rasters_evaluated = 0;
    size_t results_written = 0;
};

// Evaluates every region of a group against every raster of the group,
// decoding each raster once.
class GroupAggregator {
public:
    GroupAggregator(RasterDecoder& decoder, double threshold);

    GroupOutcome evaluate(const AggregationGroup& group);

    size_t decode_count() const { return cache_.decode_count(); }

private:
    const RegionMask& mask_for(const io::Region& region, int width, int height);

    RasterCache cache_;
    double threshold_;
    std::map<std::tuple<std::string, int, int>, RegionMask> masks_;
};

// In-process aggregation across all groups. Throws AggregationError when
// there is nothing to aggregate.
std::vector<io::ResultRecord> aggregate(const std::vector<fs::path>& rasters,
                                        const std::vector<io::Region>& regions,
                                        double threshold, RasterDecoder& decoder);

// One result file per region; returns the number written.
size_t write_region_results(const fs::path& results_dir,
                            const std::vector<io::ResultRecord>& records);

// Worker messages exchanged with the process pool.
json region_to_json(const io::Region& region);
io::Region region_from_json(const json& j);
json group_to_message(const AggregationGroup& group, double threshold, const fs::path& results_dir);
json outcome_to_json(const GroupOutcome& outcome);
GroupOutcome outcome_from_json(const json& j);

// Worker entry point: evaluates the group with file decoding and writes the
// per-region result files when the message names a results directory.
json process_group_message(const json& message);

} // namespace radbatch::aggregation
