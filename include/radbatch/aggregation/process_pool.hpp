#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace radbatch::aggregation {

using json = nlohmann::json;

struct TaskOutcome {
    bool ok = false;
    json payload;
    std::string error;
};

// Runs each message through `handler` in a forked child process, with at
// most `max_workers` children alive. Results come back as JSON over a pipe.
// With one worker the handler runs in-process.
class ProcessPool {
public:
    using Handler = std::function<json(const json&)>;

    explicit ProcessPool(int max_workers);

    // Outcomes are indexed like `messages`.
    std::vector<TaskOutcome> run(const std::vector<json>& messages, const Handler& handler);

    int max_workers() const { return max_workers_; }

private:
    std::vector<TaskOutcome> run_inline(const std::vector<json>& messages, const Handler& handler);

    int max_workers_;
};

} // namespace radbatch::aggregation
