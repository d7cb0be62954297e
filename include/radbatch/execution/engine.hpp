#pragma once

#include "radbatch/config/configuration.hpp"
#include "radbatch/core/events.hpp"
#include "radbatch/execution/process.hpp"
#include "radbatch/planning/job.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace radbatch::execution {

struct JobResult {
    planning::Job job;
    bool success = false;
    ExitInfo exit_info;
    std::string error;
    double seconds = 0.0;
};

struct PhaseReport {
    Phase phase = Phase::DONE;
    std::vector<JobResult> results;  // completion order
    size_t succeeded = 0;
    size_t failed = 0;
    int workers = 0;
    double seconds = 0.0;
};

// Executes one job to completion. Throws ExecutionError for failures that
// happen before or instead of a process exit status.
using JobRunner = std::function<ExitInfo(const planning::Job&, const LineCallback&)>;

// Runner that checks declared inputs, builds the invocation and spawns it.
JobRunner make_process_runner(const config::ToolchainConfig& toolchain);

class ExecutionEngine {
public:
    ExecutionEngine(JobRunner runner, core::EventEmitter& emitter, std::ostream& log_file,
                    std::string run_id);

    // Runs `jobs` with at most `worker_count` in flight. A failing job is
    // recorded and never stops the others.
    PhaseReport run(const std::vector<planning::Job>& jobs, int worker_count);

private:
    JobRunner runner_;
    core::EventEmitter& emitter_;
    std::ostream& log_file_;
    std::string run_id_;
};

} // namespace radbatch::execution
