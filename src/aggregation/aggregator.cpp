#include "radbatch/aggregation/aggregator.hpp"
#include "radbatch/core/errors.hpp"

#include <algorithm>

namespace radbatch::aggregation {

bool raster_matches_view(const std::string& raster_stem, const std::string& view_id) {
    if (view_id.empty() || raster_stem.size() < view_id.size()) {
        return false;
    }
    size_t pos = raster_stem.find(view_id);
    while (pos != std::string::npos) {
        const size_t end = pos + view_id.size();
        const bool left_ok = pos == 0 || raster_stem[pos - 1] == '_';
        const bool right_ok = end == raster_stem.size() || raster_stem[end] == '_';
        if (left_ok && right_ok) {
            return true;
        }
        pos = raster_stem.find(view_id, pos + 1);
    }
    return false;
}

GroupingResult group_by_view(const std::vector<io::Region>& regions,
                             const std::vector<fs::path>& rasters) {
    std::map<std::string, AggregationGroup> groups;
    for (const auto& region : regions) {
        auto& g = groups[region.view_id];
        g.view_id = region.view_id;
        g.regions.push_back(region);
    }

    GroupingResult result;
    for (const auto& raster : rasters) {
        const std::string stem = raster.stem().string();
        AggregationGroup* best = nullptr;
        for (auto& [view_id, group] : groups) {
            if (raster_matches_view(stem, view_id) &&
                (!best || view_id.size() > best->view_id.size())) {
                best = &group;
            }
        }
        if (best) {
            best->rasters.push_back(raster);
        } else {
            result.unmatched_rasters.push_back(raster);
        }
    }

    for (auto& [view_id, group] : groups) {
        std::sort(group.rasters.begin(), group.rasters.end());
        result.groups.push_back(std::move(group));
    }
    return result;
}

GroupAggregator::GroupAggregator(RasterDecoder& decoder, double threshold)
    : cache_(decoder), threshold_(threshold) {}

const RegionMask& GroupAggregator::mask_for(const io::Region& region, int width, int height) {
    const auto key = std::make_tuple(region.id, width, height);
    auto it = masks_.find(key);
    if (it == masks_.end()) {
        it = masks_.emplace(key, rasterize_polygon(region.vertices, width, height)).first;
    }
    return it->second;
}

GroupOutcome GroupAggregator::evaluate(const AggregationGroup& group) {
    GroupOutcome outcome;
    outcome.view_id = group.view_id;

    for (const auto& raster_path : group.rasters) {
        std::shared_ptr<const Matrix2Df> raster;
        try {
            raster = cache_.get(raster_path);
        } catch (const RadbatchError& e) {
            outcome.warnings.push_back("skipping raster " + raster_path.string() + ": " + e.what());
            continue;
        }
        ++outcome.rasters_evaluated;

        const int width = static_cast<int>(raster->cols());
        const int height = static_cast<int>(raster->rows());
        const std::string raster_id = raster_path.stem().string();
        for (const auto& region : group.regions) {
            const RegionMask& mask = mask_for(region, width, height);
            io::ResultRecord rec;
            rec.region_id = region.id;
            rec.raster_id = raster_id;
            rec.total_pixels = mask.total;
            rec.passing_pixels = mask.total == 0 ? 0 : count_passing(*raster, mask, threshold_);
            outcome.records.push_back(std::move(rec));
        }
    }
    return outcome;
}

std::vector<io::ResultRecord> aggregate(const std::vector<fs::path>& rasters,
                                        const std::vector<io::Region>& regions,
                                        double threshold, RasterDecoder& decoder) {
    if (rasters.empty()) {
        throw AggregationError("no raster artifacts to aggregate");
    }
    if (regions.empty()) {
        throw AggregationError("no regions to aggregate");
    }

    GroupAggregator aggregator(decoder, threshold);
    std::vector<io::ResultRecord> records;
    for (const auto& group : group_by_view(regions, rasters).groups) {
        auto outcome = aggregator.evaluate(group);
        records.insert(records.end(), outcome.records.begin(), outcome.records.end());
    }
    return records;
}

size_t write_region_results(const fs::path& results_dir,
                            const std::vector<io::ResultRecord>& records) {
    std::map<std::string, io::RegionResultFile> files;
    for (const auto& rec : records) {
        auto [it, inserted] = files.try_emplace(rec.region_id);
        if (inserted) {
            it->second.region_id = rec.region_id;
            it->second.total_pixels = rec.total_pixels;
        }
        it->second.rows.emplace_back(rec.raster_id, rec.passing_pixels);
    }
    for (const auto& [region_id, file] : files) {
        io::write_region_result(io::region_result_path(results_dir, region_id), file);
    }
    return files.size();
}

json region_to_json(const io::Region& region) {
    json verts = json::array();
    for (const auto& p : region.vertices) {
        verts.push_back({p.x, p.y});
    }
    return {
        {"id", region.id},
        {"label", region.label},
        {"view_id", region.view_id},
        {"elevation", region.elevation},
        {"vertices", verts},
        {"source", region.source.string()}
    };
}

io::Region region_from_json(const json& j) {
    io::Region region;
    region.id = j.at("id").get<std::string>();
    region.label = j.value("label", std::string());
    region.view_id = j.at("view_id").get<std::string>();
    region.elevation = j.value("elevation", 0.0);
    region.source = j.value("source", std::string());
    for (const auto& v : j.at("vertices")) {
        region.vertices.push_back({v.at(0).get<double>(), v.at(1).get<double>()});
    }
    return region;
}

json group_to_message(const AggregationGroup& group, double threshold, const fs::path& results_dir) {
    json regions = json::array();
    for (const auto& r : group.regions) {
        regions.push_back(region_to_json(r));
    }
    json rasters = json::array();
    for (const auto& p : group.rasters) {
        rasters.push_back(p.string());
    }
    return {
        {"view_id", group.view_id},
        {"threshold", threshold},
        {"results_dir", results_dir.string()},
        {"regions", regions},
        {"rasters", rasters}
    };
}

json outcome_to_json(const GroupOutcome& outcome) {
    json records = json::array();
    for (const auto& r : outcome.records) {
        records.push_back({r.region_id, r.raster_id, r.total_pixels, r.passing_pixels});
    }
    return {
        {"view_id", outcome.view_id},
        {"records", records},
        {"warnings", outcome.warnings},
        {"rasters_evaluated", outcome.rasters_evaluated},
        {"results_written", outcome.results_written}
    };
}

GroupOutcome outcome_from_json(const json& j) {
    GroupOutcome outcome;
    outcome.view_id = j.value("view_id", std::string());
    for (const auto& r : j.at("records")) {
        io::ResultRecord rec;
        rec.region_id = r.at(0).get<std::string>();
        rec.raster_id = r.at(1).get<std::string>();
        rec.total_pixels = r.at(2).get<long>();
        rec.passing_pixels = r.at(3).get<long>();
        outcome.records.push_back(std::move(rec));
    }
    outcome.warnings = j.value("warnings", std::vector<std::string>());
    outcome.rasters_evaluated = j.value("rasters_evaluated", size_t{0});
    outcome.results_written = j.value("results_written", size_t{0});
    return outcome;
}

json process_group_message(const json& message) {
    AggregationGroup group;
    group.view_id = message.at("view_id").get<std::string>();
    for (const auto& r : message.at("regions")) {
        group.regions.push_back(region_from_json(r));
    }
    for (const auto& p : message.at("rasters")) {
        group.rasters.emplace_back(p.get<std::string>());
    }

    FileRasterDecoder decoder;
    GroupAggregator aggregator(decoder, message.at("threshold").get<double>());
    GroupOutcome outcome = aggregator.evaluate(group);

    const std::string results_dir = message.value("results_dir", std::string());
    if (!results_dir.empty()) {
        outcome.results_written = write_region_results(results_dir, outcome.records);
    }
    return outcome_to_json(outcome);
}

} // namespace radbatch::aggregation
