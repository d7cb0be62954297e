#include "radbatch/execution/invocation.hpp"
#include "radbatch/core/errors.hpp"

#include <sstream>
#include <type_traits>

namespace radbatch::execution {

namespace {

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

template <typename T>
void append_option(std::vector<std::string>& argv, const char* flag, const std::optional<T>& v) {
    if (!v) {
        return;
    }
    argv.emplace_back(flag);
    if constexpr (std::is_integral_v<T>) {
        argv.push_back(std::to_string(*v));
    } else {
        argv.push_back(format_number(*v));
    }
}

std::string shell_quote(const std::string& s) {
    if (!s.empty() && s.find_first_of(" \t'\"$;()|&<>*?") == std::string::npos) {
        return s;
    }
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

} // namespace

std::string Invocation::to_string() const {
    std::ostringstream oss;
    for (size_t i = 0; i < stages.size(); ++i) {
        if (i > 0) oss << " | ";
        for (size_t j = 0; j < stages[i].argv.size(); ++j) {
            if (j > 0) oss << ' ';
            oss << shell_quote(stages[i].argv[j]);
        }
    }
    if (stdout_path) {
        oss << " > " << shell_quote(stdout_path->string());
    } else if (discard_stdout) {
        oss << " > /dev/null";
    }
    return oss.str();
}

std::string composite_expression(size_t layers) {
    std::ostringstream oss;
    const char* channels[] = {"r", "g", "b"};
    for (int c = 0; c < 3; ++c) {
        if (c > 0) oss << ';';
        oss << channels[c] << "o=";
        for (size_t i = 1; i <= layers; ++i) {
            if (i > 1) oss << '+';
            oss << channels[c] << "i(" << i << ")";
        }
    }
    return oss.str();
}

void append_render_params(std::vector<std::string>& argv, const config::RenderParams& params) {
    append_option(argv, "-aa", params.aa);
    append_option(argv, "-ab", params.ab);
    append_option(argv, "-ad", params.ad);
    append_option(argv, "-ar", params.ar);
    append_option(argv, "-as", params.as);
    append_option(argv, "-dj", params.dj);
    append_option(argv, "-lr", params.lr);
    append_option(argv, "-lw", params.lw);
    append_option(argv, "-pj", params.pj);
    append_option(argv, "-ps", params.ps);
    append_option(argv, "-pt", params.pt);
}

InvocationBuilder::InvocationBuilder(config::ToolchainConfig toolchain)
    : toolchain_(std::move(toolchain)) {}

Invocation InvocationBuilder::base_invocation() const {
    Invocation inv;
    if (!toolchain_.raypath.empty()) {
        inv.env["RAYPATH"] = toolchain_.raypath;
    }
    return inv;
}

std::vector<std::string> InvocationBuilder::rpict_args(const fs::path& view, int x_res, int y_res,
                                                       const config::RenderParams& params) const {
    std::vector<std::string> argv = {toolchain_.resolve(toolchain_.rpict), "-w"};
    if (toolchain_.report_interval_s > 0) {
        argv.push_back("-t");
        argv.push_back(std::to_string(toolchain_.report_interval_s));
    }
    argv.push_back("-vf");
    argv.push_back(view.string());
    argv.push_back("-x");
    argv.push_back(std::to_string(x_res));
    argv.push_back("-y");
    argv.push_back(std::to_string(y_res));
    append_render_params(argv, params);
    return argv;
}

Invocation InvocationBuilder::build(const planning::Job& job) const {
    using namespace planning;
    Invocation inv = base_invocation();

    if (const auto* s = std::get_if<SceneCompileSpec>(&job.spec)) {
        inv.stages.push_back({{toolchain_.resolve(toolchain_.oconv), "-i",
                               s->base_scene.string(), s->sky.string()}});
        inv.stdout_path = job.output;
    } else if (const auto* s = std::get_if<ConditionCompileSpec>(&job.spec)) {
        inv.stages.push_back({{toolchain_.resolve(toolchain_.oconv), "-i",
                               s->scene_input().string(), s->condition.string()}});
        inv.stdout_path = job.output;
    } else if (const auto* s = std::get_if<AmbientWarmSpec>(&job.spec)) {
        auto argv = rpict_args(s->view, s->x_res, s->y_res, s->params);
        argv.push_back("-af");
        argv.push_back(s->ambient_file.string());
        argv.push_back(s->octree.string());
        inv.stages.push_back({std::move(argv)});
        inv.discard_stdout = true;
    } else if (const auto* s = std::get_if<RenderSpec>(&job.spec)) {
        auto argv = rpict_args(s->view, s->x_res, s->y_res, s->params);
        if (s->ambient_file) {
            argv.push_back("-af");
            argv.push_back(s->ambient_file->string());
        }
        argv.push_back(s->octree.string());
        inv.stages.push_back({std::move(argv)});
        inv.stdout_path = job.output;
    } else if (const auto* s = std::get_if<CompositeSpec>(&job.spec)) {
        if (s->layers.empty()) {
            throw ExecutionError("composite job without layers: " + job.label);
        }
        std::vector<std::string> argv = {toolchain_.resolve(toolchain_.pcomb), "-e",
                                         composite_expression(s->layers.size())};
        for (const auto& layer : s->layers) {
            argv.push_back(layer.string());
        }
        inv.stages.push_back({std::move(argv)});
        inv.stdout_path = job.output;
    } else if (const auto* s = std::get_if<ConvertSpec>(&job.spec)) {
        const std::string stops = (s->exposure_stops >= 0 ? "+" : "") + std::to_string(s->exposure_stops);
        inv.stages.push_back({{toolchain_.resolve(toolchain_.ra_tiff), "-e", stops,
                               s->source.string(), job.output.string()}});
    }

    return inv;
}

} // namespace radbatch::execution
