#include "radbatch/pipeline/orchestrator.hpp"
#include "radbatch/aggregation/aggregator.hpp"
#include "radbatch/aggregation/process_pool.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"
#include "radbatch/io/raster_io.hpp"
#include "radbatch/io/region_io.hpp"

#include <chrono>
#include <iostream>

namespace radbatch::pipeline {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

size_t RenderSummary::failed_total() const {
    size_t n = 0;
    for (const auto& r : reports) {
        n += r.failed;
    }
    return n;
}

Orchestrator::Orchestrator(config::Config cfg, core::EventEmitter& emitter,
                           std::ostream& log_file, std::string run_id)
    : cfg_(std::move(cfg)),
      emitter_(emitter),
      log_file_(log_file),
      run_id_(std::move(run_id)),
      planner_(planning::PlannerOptions::from_config(cfg_)) {}

void Orchestrator::warn(const std::string& tag, const std::string& message) {
    std::cerr << "[" << tag << "] Warning: " << message << std::endl;
    emitter_.warning(run_id_, message, log_file_);
}

std::vector<planning::Job> Orchestrator::plan(const planning::PlanInputs& inputs) const {
    return planner_.plan(inputs);
}

std::vector<fs::path> Orchestrator::stage_condition_inputs(const std::vector<planning::Job>& jobs) {
    std::vector<fs::path> staged;
    for (const auto& job : jobs) {
        const auto* spec = std::get_if<planning::ConditionCompileSpec>(&job.spec);
        if (!spec || !spec->staged_input) {
            continue;
        }
        try {
            fs::create_directories(spec->staged_input->parent_path());
            if (!fs::exists(*spec->staged_input)) {
                core::safe_hardlink_or_copy(spec->base_scene, *spec->staged_input);
            }
            staged.push_back(*spec->staged_input);
        } catch (const fs::filesystem_error& e) {
            warn("CONDITION_COMPILE", "cannot stage " + spec->staged_input->string() + ": " + e.what());
        }
    }
    return staged;
}

void Orchestrator::remove_staged(const std::vector<fs::path>& staged) {
    for (const auto& p : staged) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            warn("CONDITION_COMPILE", "cannot remove " + p.string() + ": " + ec.message());
        }
    }
}

RenderSummary Orchestrator::render(const planning::PlanInputs& inputs,
                                   const execution::JobRunner& runner) {
    RenderSummary summary;
    fs::create_directories(cfg_.paths.octree_dir);
    fs::create_directories(cfg_.paths.image_dir);

    execution::ExecutionEngine engine(runner, emitter_, log_file_, run_id_);

    for (Phase phase : job_phases()) {
        const auto t0 = std::chrono::steady_clock::now();
        const std::string tag = "[" + phase_to_string(phase) + "]";

        const auto planned = planner_.plan_phase(phase, inputs);
        const auto filtered = planning::filter_existing(planned);
        emitter_.phase_start(run_id_, phase,
                             {{"planned", planned.size()}, {"skipped", filtered.skipped}},
                             log_file_);
        std::cout << tag << " " << planned.size() << " planned, " << filtered.skipped
                  << " already present" << std::endl;

        std::vector<fs::path> staged;
        if (phase == Phase::CONDITION_COMPILE) {
            staged = stage_condition_inputs(filtered.jobs);
        }

        execution::PhaseReport report = engine.run(filtered.jobs, cfg_.workers_for(phase));
        report.phase = phase;
        remove_staged(staged);

        PhaseTiming timing;
        timing.phase = phase;
        timing.seconds = seconds_since(t0);
        timing.planned = planned.size();
        timing.skipped = filtered.skipped;
        timing.succeeded = report.succeeded;
        timing.failed = report.failed;
        timings_.push_back(timing);
        summary.timings.push_back(timing);

        emitter_.phase_end(run_id_, phase, report.failed == 0 ? "ok" : "error",
                           {{"planned", planned.size()},
                            {"skipped", filtered.skipped},
                            {"succeeded", report.succeeded},
                            {"failed", report.failed},
                            {"seconds", timing.seconds}},
                           log_file_);

        const bool failed = report.failed > 0;
        summary.reports.push_back(std::move(report));
        if (failed && cfg_.pipeline.abort_on_fail) {
            std::cerr << tag << " Aborting after failed jobs (pipeline.abort_on_fail)" << std::endl;
            summary.aborted = true;
            break;
        }
    }
    return summary;
}

std::vector<fs::path> Orchestrator::discover_rasters() const {
    return core::discover_files(cfg_.paths.image_dir, cfg_.aggregation.raster_pattern);
}

report::PixelScale Orchestrator::resolve_pixel_scale(const std::vector<fs::path>& rasters) {
    const fs::path scale_file = cfg_.paths.pixel_scale_file;
    if (!scale_file.empty() && fs::exists(scale_file)) {
        return report::read_pixel_scale(scale_file);
    }
    for (const auto& raster : rasters) {
        try {
            const auto header = io::read_raster_header(raster);
            const auto scale = report::pixel_scale_from_header(header);
            if (!scale_file.empty()) {
                report::write_pixel_scale(scale_file, scale, header.view_line);
                std::cout << "[REPORT] Wrote pixel scale " << scale_file.string() << std::endl;
            }
            return scale;
        } catch (const ParseError& e) {
            warn("REPORT", e.what());
        }
    }
    throw AggregationError("no pixel scale file and no raster header with a usable VIEW");
}

AggregationSummary Orchestrator::aggregate(const std::vector<fs::path>& rasters) {
    if (rasters.empty()) {
        throw AggregationError("no raster artifacts to aggregate");
    }

    AggregationSummary summary;
    auto t0 = std::chrono::steady_clock::now();
    emitter_.phase_start(run_id_, Phase::AGGREGATE, {{"rasters", rasters.size()}}, log_file_);
    summary.rasters = rasters.size();

    const fs::path results_dir = cfg_.paths.results_dir;
    fs::create_directories(results_dir);

    std::vector<io::Region> regions;
    const auto region_files = core::discover_files(cfg_.paths.regions_dir, cfg_.paths.region_pattern);
    for (const auto& path : region_files) {
        if (cfg_.aggregation.skip_existing_results &&
            fs::exists(io::region_result_path(results_dir, path.stem().string()))) {
            ++summary.regions_skipped;
            continue;
        }
        try {
            regions.push_back(io::read_region_file(path));
        } catch (const ParseError& e) {
            summary.warnings.push_back(e.what());
            warn("AGGREGATE", e.what());
        }
    }
    summary.regions = regions.size();
    if (regions.empty() && summary.regions_skipped == 0) {
        throw AggregationError("no readable regions in " + cfg_.paths.regions_dir);
    }
    std::cout << "[AGGREGATE] " << regions.size() << " regions, " << summary.regions_skipped
              << " with existing results, " << rasters.size() << " rasters" << std::endl;

    const auto grouping = aggregation::group_by_view(regions, rasters);
    if (!grouping.unmatched_rasters.empty()) {
        const std::string msg = std::to_string(grouping.unmatched_rasters.size()) +
                                " rasters match no region view (first: " +
                                grouping.unmatched_rasters.front().filename().string() + ")";
        summary.warnings.push_back(msg);
        warn("AGGREGATE", msg);
    }

    std::vector<aggregation::json> messages;
    std::vector<std::string> message_views;
    for (const auto& group : grouping.groups) {
        if (group.rasters.empty()) {
            const std::string msg = "no rasters for view " + group.view_id;
            summary.warnings.push_back(msg);
            warn("AGGREGATE", msg);
            continue;
        }
        messages.push_back(aggregation::group_to_message(group, cfg_.aggregation.threshold, results_dir));
        message_views.push_back(group.view_id);
    }
    summary.groups = messages.size();

    const int workers = core::compute_worker_count(cfg_.aggregation.workers, messages.size());
    std::cout << "[AGGREGATE] Using " << workers << " worker processes for "
              << messages.size() << " view groups" << std::endl;
    aggregation::ProcessPool pool(workers);
    const auto outcomes = pool.run(messages, aggregation::process_group_message);

    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok) {
            const std::string msg = "group " + message_views[i] + " failed: " + outcomes[i].error;
            summary.warnings.push_back(msg);
            warn("AGGREGATE", msg);
            continue;
        }
        const auto outcome = aggregation::outcome_from_json(outcomes[i].payload);
        summary.records += outcome.records.size();
        summary.results_written += outcome.results_written;
        for (const auto& w : outcome.warnings) {
            summary.warnings.push_back(w);
            warn("AGGREGATE", w);
        }
        emitter_.phase_progress(run_id_, Phase::AGGREGATE, i + 1, outcomes.size(),
                                "view " + outcome.view_id, log_file_);
    }

    PhaseTiming agg_timing;
    agg_timing.phase = Phase::AGGREGATE;
    agg_timing.seconds = seconds_since(t0);
    agg_timing.planned = messages.size();
    agg_timing.skipped = summary.regions_skipped;
    agg_timing.succeeded = summary.results_written;
    timings_.push_back(agg_timing);
    emitter_.phase_end(run_id_, Phase::AGGREGATE, "ok",
                       {{"records", summary.records},
                        {"results_written", summary.results_written},
                        {"warnings", summary.warnings.size()},
                        {"seconds", agg_timing.seconds}},
                       log_file_);
    std::cout << "[AGGREGATE] " << summary.records << " records, " << summary.results_written
              << " result files written" << std::endl;

    t0 = std::chrono::steady_clock::now();
    emitter_.phase_start(run_id_, Phase::REPORT, {}, log_file_);
    const report::PixelScale scale = resolve_pixel_scale(rasters);
    report::ReportOptions options;
    options.timestep_hours = cfg_.report.timestep_hours;
    options.compliance_area_m2 = cfg_.report.compliance_area_m2;

    summary.report = report::merge_results(core::discover_files(results_dir, "*.wpd"),
                                           scale.area_per_pixel(), options);
    for (const auto& w : summary.report.warnings) {
        summary.warnings.push_back(w);
        warn("REPORT", w);
    }

    const std::string base = cfg_.report.output_basename;
    summary.report_files = {results_dir / (base + ".csv"),
                            results_dir / (base + "_pivot.csv"),
                            results_dir / (base + ".json")};
    report::write_flat_csv(summary.report_files[0], summary.report);
    report::write_pivot_csv(summary.report_files[1], summary.report);
    report::write_report_json(summary.report_files[2], summary.report);

    PhaseTiming report_timing;
    report_timing.phase = Phase::REPORT;
    report_timing.seconds = seconds_since(t0);
    report_timing.succeeded = summary.report.rows.size();
    timings_.push_back(report_timing);
    emitter_.phase_end(run_id_, Phase::REPORT, "ok",
                       {{"rows", summary.report.rows.size()},
                        {"regions", summary.report.regions.size()},
                        {"area_per_pixel_m2", scale.area_per_pixel()},
                        {"seconds", report_timing.seconds}},
                       log_file_);
    std::cout << "[REPORT] " << summary.report.rows.size() << " rows, area per pixel "
              << scale.area_per_pixel() << " m2 -> " << summary.report_files[0].string() << std::endl;
    return summary;
}

void Orchestrator::write_timings(const fs::path& path) const {
    core::json doc = core::json::object();
    core::json phases = core::json::array();
    double total = 0.0;
    for (const auto& t : timings_) {
        phases.push_back({{"phase", phase_to_string(t.phase)},
                          {"seconds", t.seconds},
                          {"planned", t.planned},
                          {"skipped", t.skipped},
                          {"succeeded", t.succeeded},
                          {"failed", t.failed}});
        total += t.seconds;
    }
    doc["phases"] = phases;
    doc["total_seconds"] = total;
    core::write_text(path, doc.dump(2) + "\n");
}

} // namespace radbatch::pipeline
