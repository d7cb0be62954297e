#pragma once

#include "radbatch/execution/invocation.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace radbatch::execution {

struct ExitInfo {
    int exit_code = -1;   // 128 + signal when terminated by a signal
    int signal = 0;
    std::vector<std::string> tail;  // last diagnostic lines

    bool ok() const { return exit_code == 0; }
    std::string describe() const;
};

using LineCallback = std::function<void(const std::string&)>;

// Spawns every stage, streams merged stderr (and unredirected stdout) line by
// line to `on_line`, then waits for all stages. A pipeline fails when any
// stage fails. Throws ExecutionError when a stage cannot be launched or the
// output file cannot be opened.
ExitInfo run_invocation(const Invocation& inv, const LineCallback& on_line);

// Extracts a "NN.N%" progress marker from a diagnostic line.
std::optional<float> parse_progress_percent(const std::string& line);

} // namespace radbatch::execution
