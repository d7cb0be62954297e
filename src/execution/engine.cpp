#include "radbatch/execution/engine.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace radbatch::execution {

JobRunner make_process_runner(const config::ToolchainConfig& toolchain) {
    InvocationBuilder builder(toolchain);
    return [builder](const planning::Job& job, const LineCallback& on_line) -> ExitInfo {
        for (const auto& input : job.inputs) {
            std::error_code ec;
            if (!fs::exists(input, ec)) {
                throw ExecutionError("missing input " + input.string() + " for " + job.label);
            }
        }
        return run_invocation(builder.build(job), on_line);
    };
}

ExecutionEngine::ExecutionEngine(JobRunner runner, core::EventEmitter& emitter,
                                 std::ostream& log_file, std::string run_id)
    : runner_(std::move(runner)),
      emitter_(emitter),
      log_file_(log_file),
      run_id_(std::move(run_id)) {}

PhaseReport ExecutionEngine::run(const std::vector<planning::Job>& jobs, int worker_count) {
    PhaseReport report;
    report.phase = jobs.empty() ? Phase::DONE : jobs.front().phase;
    if (jobs.empty()) {
        return report;
    }

    const std::string tag = "[" + phase_to_string(report.phase) + "]";
    // External processes do their own threading, so only the job count caps
    // the pool here.
    const int workers = std::max(1, std::min(worker_count, static_cast<int>(jobs.size())));
    report.workers = workers;
    std::cout << tag << " Running " << jobs.size() << " jobs with " << workers
              << " workers" << std::endl;

    const auto phase_t0 = std::chrono::steady_clock::now();
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::mutex report_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t idx = next.fetch_add(1);
            if (idx >= jobs.size()) {
                break;
            }
            const planning::Job& job = jobs[idx];

            JobResult result;
            result.job = job;
            float last_reported = -10.0f;
            auto on_line = [&](const std::string& line) {
                auto pct = parse_progress_percent(line);
                if (!pct || *pct < last_reported + 10.0f) {
                    return;
                }
                last_reported = *pct;
                std::lock_guard<std::mutex> lock(report_mutex);
                emitter_.job_progress(run_id_, job.phase, job.label, *pct, log_file_);
            };

            const auto t0 = std::chrono::steady_clock::now();
            try {
                result.exit_info = runner_(job, on_line);
                result.success = result.exit_info.ok();
                if (!result.success) {
                    result.error = result.exit_info.describe();
                }
            } catch (const ExecutionError& e) {
                result.success = false;
                result.error = e.what();
            } catch (const std::exception& e) {
                result.success = false;
                result.error = std::string("Execution error: ") + e.what();
            }
            result.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

            const size_t n_done = done.fetch_add(1) + 1;
            std::lock_guard<std::mutex> lock(report_mutex);
            if (result.success) {
                ++report.succeeded;
                std::cout << tag << " ok " << job.label << " -> " << job.output.filename().string()
                          << " (" << std::fixed << std::setprecision(1) << result.seconds << "s)"
                          << std::endl;
                emitter_.job_end(run_id_, job.phase, job.label, true,
                                 {{"output", job.output.string()}, {"seconds", result.seconds}},
                                 log_file_);
            } else {
                ++report.failed;
                std::cerr << tag << " FAILED " << job.label << ": " << result.error << std::endl;
                for (const auto& line : result.exit_info.tail) {
                    std::cerr << tag << "   " << line << std::endl;
                }
                emitter_.job_end(run_id_, job.phase, job.label, false,
                                 {{"output", job.output.string()},
                                  {"seconds", result.seconds},
                                  {"error", result.error},
                                  {"exit_code", result.exit_info.exit_code}},
                                 log_file_);
            }
            emitter_.phase_progress(run_id_, job.phase, n_done, jobs.size(),
                                    std::to_string(n_done) + "/" + std::to_string(jobs.size()) +
                                        " workers=" + std::to_string(workers),
                                    log_file_);
            report.results.push_back(std::move(result));
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - phase_t0).count();
    std::cout << tag << " " << report.succeeded << " succeeded, " << report.failed << " failed"
              << std::endl;
    return report;
}

} // namespace radbatch::execution
