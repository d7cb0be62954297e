#pragma once

#include "radbatch/core/types.hpp"

#include <filesystem>
#include <string>

namespace radbatch::planning {

namespace fs = std::filesystem;

// Identifies one artifact. `ambient` marks the overcast/indirect pass, which
// uses a double underscore between view and condition.
struct ArtifactKey {
    Phase phase = Phase::SCENE_COMPILE;
    std::string condition_id;
    std::string view_id;
    bool ambient = false;
};

// Base scene stem with the "_skyless" marker removed.
std::string scene_base_name(const fs::path& base_scene);

// Pure mapping (base name, condition, view, phase) -> artifact path.
class ArtifactNaming {
public:
    ArtifactNaming(std::string base_name, fs::path octree_dir, fs::path image_dir);

    fs::path path_for(const ArtifactKey& key) const;
    // Isolated copy of the base scene for one condition compile.
    fs::path staged_scene_for(const std::string& condition_id) const;

    const std::string& base_name() const { return base_name_; }

private:
    std::string base_name_;
    fs::path octree_dir_;
    fs::path image_dir_;
};

} // namespace radbatch::planning
