#pragma once

#include "radbatch/config/configuration.hpp"
#include "radbatch/core/events.hpp"
#include "radbatch/execution/engine.hpp"
#include "radbatch/planning/planner.hpp"
#include "radbatch/report/report.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace radbatch::pipeline {

namespace fs = std::filesystem;

struct PhaseTiming {
    Phase phase = Phase::DONE;
    double seconds = 0.0;
    size_t planned = 0;
    size_t skipped = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

struct RenderSummary {
    std::vector<execution::PhaseReport> reports;
    std::vector<PhaseTiming> timings;
    bool aborted = false;

    size_t failed_total() const;
    bool success() const { return !aborted && failed_total() == 0; }
};

struct AggregationSummary {
    size_t regions = 0;
    size_t regions_skipped = 0;
    size_t rasters = 0;
    size_t groups = 0;
    size_t records = 0;
    size_t results_written = 0;
    std::vector<std::string> warnings;
    report::Report report;
    std::vector<fs::path> report_files;
};

// Sequences plan -> filter -> execute per phase, then aggregation and the
// report. Phase k's jobs finish before phase k+1 is planned.
class Orchestrator {
public:
    Orchestrator(config::Config cfg, core::EventEmitter& emitter, std::ostream& log_file,
                 std::string run_id);

    std::vector<planning::Job> plan(const planning::PlanInputs& inputs) const;

    RenderSummary render(const planning::PlanInputs& inputs, const execution::JobRunner& runner);

    // Throws AggregationError when there are no rasters or no regions.
    AggregationSummary aggregate(const std::vector<fs::path>& rasters);

    std::vector<fs::path> discover_rasters() const;

    const std::vector<PhaseTiming>& timings() const { return timings_; }
    void write_timings(const fs::path& path) const;

private:
    std::vector<fs::path> stage_condition_inputs(const std::vector<planning::Job>& jobs);
    void remove_staged(const std::vector<fs::path>& staged);
    report::PixelScale resolve_pixel_scale(const std::vector<fs::path>& rasters);
    void warn(const std::string& tag, const std::string& message);

    config::Config cfg_;
    core::EventEmitter& emitter_;
    std::ostream& log_file_;
    std::string run_id_;
    planning::JobPlanner planner_;
    std::vector<PhaseTiming> timings_;
};

} // namespace radbatch::pipeline
