#include "radbatch/planning/planner.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <utility>

namespace radbatch::planning {

namespace {

// Preserves per-phase insertion order and merges repeated output paths.
class PlanBuilder {
public:
    // A repeated output is only accepted when it comes from the same job.
    void add(Job job) {
        const std::string key = job.output.lexically_normal().string();
        const auto it = seen_.find(key);
        if (it != seen_.end()) {
            const Job& existing = by_phase_[it->second.first][it->second.second];
            if (existing.phase != job.phase || existing.inputs != job.inputs ||
                !(existing.spec == job.spec)) {
                throw PlanningError("output collision: " + key + " (" + existing.label + " vs " +
                                    job.label + ")");
            }
            return;
        }
        auto& jobs = by_phase_[phase_to_int(job.phase)];
        seen_.emplace(key, std::make_pair(phase_to_int(job.phase), jobs.size()));
        jobs.push_back(std::move(job));
    }

    std::vector<Job> take() {
        std::vector<Job> out;
        for (auto& [phase, jobs] : by_phase_) {
            for (auto& job : jobs) {
                out.push_back(std::move(job));
            }
        }
        return out;
    }

private:
    std::map<std::string, std::pair<int, std::size_t>> seen_;
    std::map<int, std::vector<Job>> by_phase_;
};

template <typename T>
void check_ids(const std::vector<T>& items, const std::string& what) {
    std::set<std::string> ids;
    for (const auto& item : items) {
        if (item.id.empty()) {
            throw PlanningError(what + " with empty id: " + item.path.string());
        }
        if (!ids.insert(item.id).second) {
            throw PlanningError("duplicate " + what + " id: " + item.id);
        }
    }
}

} // namespace

PlannerOptions PlannerOptions::from_config(const config::Config& cfg) {
    PlannerOptions o;
    const fs::path sky(cfg.paths.ambient_sky);
    o.ambient_sky = Condition{sky.stem().string(), sky};
    o.octree_dir = cfg.paths.octree_dir;
    o.image_dir = cfg.paths.image_dir;
    o.x_res = cfg.render.x_res;
    o.y_res = cfg.render.y_res;
    o.warm_x_res = cfg.render.warm_x_res;
    o.warm_y_res = cfg.render.warm_y_res;
    o.convert_exposure = cfg.render.convert_exposure;
    o.isolate_condition_inputs = cfg.render.isolate_condition_inputs;
    o.ambient_params = cfg.render.ambient;
    o.direct_params = cfg.render.direct;
    return o;
}

PlanInputs discover_plan_inputs(const config::Config& cfg) {
    if (cfg.paths.base_scene.empty() || !fs::exists(cfg.paths.base_scene)) {
        throw PlanningError("base scene not found: " + cfg.paths.base_scene);
    }
    if (cfg.paths.ambient_sky.empty() || !fs::exists(cfg.paths.ambient_sky)) {
        throw PlanningError("ambient sky not found: " + cfg.paths.ambient_sky);
    }

    PlanInputs inputs;
    inputs.base_scene = cfg.paths.base_scene;
    for (const auto& p : core::discover_files(cfg.paths.conditions_dir, cfg.paths.condition_pattern)) {
        inputs.conditions.push_back({p.stem().string(), p});
    }
    for (const auto& p : core::discover_files(cfg.paths.viewpoints_dir, cfg.paths.viewpoint_pattern)) {
        inputs.viewpoints.push_back({p.stem().string(), p});
    }
    return inputs;
}

JobPlanner::JobPlanner(PlannerOptions options) : options_(std::move(options)) {}

ArtifactNaming JobPlanner::naming_for(const fs::path& base_scene) const {
    return ArtifactNaming(scene_base_name(base_scene), options_.octree_dir, options_.image_dir);
}

void JobPlanner::check_inputs(const fs::path& base_scene,
                              const std::vector<Condition>& conditions,
                              const std::vector<Viewpoint>& viewpoints) const {
    if (base_scene.empty()) {
        throw PlanningError("base scene path is empty");
    }
    if (scene_base_name(base_scene).empty()) {
        throw PlanningError("base scene has no usable name: " + base_scene.string());
    }
    if (options_.ambient_sky.path.empty() || options_.ambient_sky.id.empty()) {
        throw PlanningError("ambient sky is not configured");
    }
    if (options_.x_res < 1 || options_.y_res < 1 ||
        options_.warm_x_res < 1 || options_.warm_y_res < 1) {
        throw PlanningError("render resolution must be positive");
    }
    check_ids(conditions, "condition");
    check_ids(viewpoints, "viewpoint");
    for (const auto& cond : conditions) {
        if (cond.id == options_.ambient_sky.id) {
            throw PlanningError("condition id matches the ambient sky id: " + cond.id);
        }
    }
}

std::vector<Job> JobPlanner::plan(const fs::path& base_scene,
                                  const std::vector<Condition>& conditions,
                                  const std::vector<Viewpoint>& viewpoints) const {
    check_inputs(base_scene, conditions, viewpoints);
    if (conditions.empty() || viewpoints.empty()) {
        return {};
    }

    const ArtifactNaming naming = naming_for(base_scene);
    const Condition& amb = options_.ambient_sky;
    PlanBuilder builder;

    const fs::path ambient_octree = naming.path_for({Phase::SCENE_COMPILE, amb.id, "", true});
    {
        Job job;
        job.phase = Phase::SCENE_COMPILE;
        job.label = "oconv " + amb.id;
        job.inputs = {base_scene, amb.path};
        job.output = ambient_octree;
        job.spec = SceneCompileSpec{base_scene, amb.path};
        builder.add(std::move(job));
    }

    std::map<std::string, fs::path> ambient_renders;
    for (const auto& view : viewpoints) {
        const fs::path amb_file = naming.path_for({Phase::AMBIENT_WARM, amb.id, view.id, true});

        Job warm;
        warm.phase = Phase::AMBIENT_WARM;
        warm.label = "overture " + view.id;
        warm.inputs = {ambient_octree, view.path};
        warm.output = amb_file;
        warm.spec = AmbientWarmSpec{ambient_octree, view.path, amb_file,
                                    options_.warm_x_res, options_.warm_y_res,
                                    options_.ambient_params};
        builder.add(std::move(warm));

        const fs::path indirect = naming.path_for({Phase::RENDER, amb.id, view.id, true});
        Job render;
        render.phase = Phase::RENDER;
        render.label = "render " + view.id + "__" + amb.id;
        render.inputs = {ambient_octree, view.path, amb_file};
        render.output = indirect;
        render.spec = RenderSpec{ambient_octree, view.path, amb_file,
                                 options_.x_res, options_.y_res, options_.ambient_params};
        builder.add(std::move(render));
        ambient_renders[view.id] = indirect;
    }

    for (const auto& cond : conditions) {
        for (const auto& view : viewpoints) {
            const fs::path octree = naming.path_for({Phase::CONDITION_COMPILE, cond.id, view.id, false});

            Job compile;
            compile.phase = Phase::CONDITION_COMPILE;
            compile.label = "oconv " + cond.id;
            compile.inputs = {base_scene, cond.path};
            compile.output = octree;
            ConditionCompileSpec compile_spec{base_scene, cond.path, std::nullopt};
            if (options_.isolate_condition_inputs) {
                compile_spec.staged_input = naming.staged_scene_for(cond.id);
            }
            compile.spec = compile_spec;
            builder.add(std::move(compile));

            const fs::path direct = naming.path_for({Phase::RENDER, cond.id, view.id, false});
            Job render;
            render.phase = Phase::RENDER;
            render.label = "render " + view.id + "_" + cond.id;
            render.inputs = {octree, view.path};
            render.output = direct;
            render.spec = RenderSpec{octree, view.path, std::nullopt,
                                     options_.x_res, options_.y_res, options_.direct_params};
            builder.add(std::move(render));

            const fs::path combined = naming.path_for({Phase::COMPOSITE, cond.id, view.id, false});
            Job composite;
            composite.phase = Phase::COMPOSITE;
            composite.label = "composite " + view.id + "_" + cond.id;
            composite.inputs = {ambient_renders.at(view.id), direct};
            composite.output = combined;
            composite.spec = CompositeSpec{{ambient_renders.at(view.id), direct}};
            builder.add(std::move(composite));

            Job convert;
            convert.phase = Phase::CONVERT;
            convert.label = "convert " + view.id + "_" + cond.id;
            convert.inputs = {combined};
            convert.output = naming.path_for({Phase::CONVERT, cond.id, view.id, false});
            convert.spec = ConvertSpec{combined, options_.convert_exposure};
            builder.add(std::move(convert));
        }
    }

    return builder.take();
}

std::vector<Job> JobPlanner::plan_phase(Phase phase, const PlanInputs& inputs) const {
    std::vector<Job> all = plan(inputs);
    std::vector<Job> out;
    for (auto& job : all) {
        if (job.phase == phase) {
            out.push_back(std::move(job));
        }
    }
    return out;
}

FilterResult filter_existing(const std::vector<Job>& jobs) {
    return filter_existing(jobs, [](const fs::path& p) {
        std::error_code ec;
        return fs::exists(p, ec);
    });
}

FilterResult filter_existing(const std::vector<Job>& jobs,
                             const std::function<bool(const fs::path&)>& exists) {
    FilterResult result;
    for (const auto& job : jobs) {
        if (exists(job.output)) {
            ++result.skipped;
        } else {
            result.jobs.push_back(job);
        }
    }
    return result;
}

std::vector<fs::path> direct_render_artifacts(const std::vector<Job>& jobs) {
    std::vector<fs::path> out;
    for (const auto& job : jobs) {
        if (job.phase != Phase::RENDER) {
            continue;
        }
        const auto* spec = std::get_if<RenderSpec>(&job.spec);
        if (spec && !spec->ambient_file) {
            out.push_back(job.output);
        }
    }
    return out;
}

} // namespace radbatch::planning
