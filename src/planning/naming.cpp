#include "radbatch/planning/naming.hpp"
#include "radbatch/core/errors.hpp"

namespace radbatch::planning {

std::string scene_base_name(const fs::path& base_scene) {
    std::string stem = base_scene.stem().string();
    const std::string marker = "_skyless";
    const size_t pos = stem.find(marker);
    if (pos != std::string::npos) {
        stem.erase(pos, marker.size());
    }
    return stem;
}

ArtifactNaming::ArtifactNaming(std::string base_name, fs::path octree_dir, fs::path image_dir)
    : base_name_(std::move(base_name)),
      octree_dir_(std::move(octree_dir)),
      image_dir_(std::move(image_dir)) {}

fs::path ArtifactNaming::path_for(const ArtifactKey& key) const {
    const std::string sep = key.ambient ? "__" : "_";
    const std::string view_cond = base_name_ + "_" + key.view_id + sep + key.condition_id;

    switch (key.phase) {
        case Phase::SCENE_COMPILE:
        case Phase::CONDITION_COMPILE:
            return octree_dir_ / (base_name_ + "_" + key.condition_id + ".oct");
        case Phase::AMBIENT_WARM:
            return image_dir_ / (base_name_ + "_" + key.view_id + "__" + key.condition_id + ".amb");
        case Phase::RENDER:
            return image_dir_ / (view_cond + ".hdr");
        case Phase::COMPOSITE:
            return image_dir_ / (view_cond + "_combined.hdr");
        case Phase::CONVERT:
            return image_dir_ / (view_cond + "_combined.tiff");
        default:
            throw PlanningError("No artifact naming for phase " + phase_to_string(key.phase));
    }
}

fs::path ArtifactNaming::staged_scene_for(const std::string& condition_id) const {
    return octree_dir_ / (base_name_ + "_" + condition_id + "_temp.oct");
}

} // namespace radbatch::planning
