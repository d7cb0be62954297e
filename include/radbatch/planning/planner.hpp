#pragma once

#include "radbatch/config/configuration.hpp"
#include "radbatch/planning/job.hpp"
#include "radbatch/planning/naming.hpp"

#include <functional>
#include <vector>

namespace radbatch::planning {

struct PlannerOptions {
    Condition ambient_sky;
    fs::path octree_dir;
    fs::path image_dir;
    int x_res = 2048;
    int y_res = 2048;
    int warm_x_res = 512;
    int warm_y_res = 512;
    int convert_exposure = -4;
    bool isolate_condition_inputs = true;
    config::RenderParams ambient_params = config::default_ambient_params();
    config::RenderParams direct_params = config::default_direct_params();

    static PlannerOptions from_config(const config::Config& cfg);
};

struct PlanInputs {
    fs::path base_scene;
    std::vector<Condition> conditions;
    std::vector<Viewpoint> viewpoints;
};

// Scans the configured condition and viewpoint directories (sorted by name).
// Throws PlanningError when the base scene or ambient sky is missing.
PlanInputs discover_plan_inputs(const config::Config& cfg);

class JobPlanner {
public:
    explicit JobPlanner(PlannerOptions options);

    // All jobs, grouped by phase in pipeline order. Jobs sharing an output
    // path are collapsed onto the first occurrence.
    std::vector<Job> plan(const fs::path& base_scene,
                          const std::vector<Condition>& conditions,
                          const std::vector<Viewpoint>& viewpoints) const;

    std::vector<Job> plan(const PlanInputs& inputs) const {
        return plan(inputs.base_scene, inputs.conditions, inputs.viewpoints);
    }

    std::vector<Job> plan_phase(Phase phase, const PlanInputs& inputs) const;

    ArtifactNaming naming_for(const fs::path& base_scene) const;

private:
    void check_inputs(const fs::path& base_scene,
                      const std::vector<Condition>& conditions,
                      const std::vector<Viewpoint>& viewpoints) const;

    PlannerOptions options_;
};

struct FilterResult {
    std::vector<Job> jobs;
    size_t skipped = 0;
};

// Drops jobs whose declared output already exists. Existence alone counts as
// completion.
FilterResult filter_existing(const std::vector<Job>& jobs);
FilterResult filter_existing(const std::vector<Job>& jobs,
                             const std::function<bool(const fs::path&)>& exists);

// Non-ambient RENDER outputs: the rasters that feed aggregation.
std::vector<fs::path> direct_render_artifacts(const std::vector<Job>& jobs);

} // namespace radbatch::planning
