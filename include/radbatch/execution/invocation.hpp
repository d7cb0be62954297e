#pragma once

#include "radbatch/config/configuration.hpp"
#include "radbatch/planning/job.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace radbatch::execution {

namespace fs = std::filesystem;

struct Command {
    std::vector<std::string> argv;
};

// One external process pipeline. Stages are connected stdout -> stdin; the
// final stage's stdout goes to `stdout_path`, is discarded, or is merged
// into the diagnostic stream.
struct Invocation {
    std::vector<Command> stages;
    std::optional<fs::path> stdout_path;
    bool discard_stdout = false;
    std::map<std::string, std::string> env;

    // Human-readable shell rendering for logs.
    std::string to_string() const;
};

class InvocationBuilder {
public:
    explicit InvocationBuilder(config::ToolchainConfig toolchain);

    Invocation build(const planning::Job& job) const;

private:
    Invocation base_invocation() const;
    std::vector<std::string> rpict_args(const fs::path& view, int x_res, int y_res,
                                        const config::RenderParams& params) const;

    config::ToolchainConfig toolchain_;
};

// pcomb expression summing `layers` inputs channel by channel.
std::string composite_expression(size_t layers);

void append_render_params(std::vector<std::string>& argv, const config::RenderParams& params);

} // namespace radbatch::execution
