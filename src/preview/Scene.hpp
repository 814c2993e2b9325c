#pragma once

#include "layout/LayoutChild.hpp"
#include "layout/LayoutConfig.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lintel {

enum class LayoutKind {
    Flow,
    Centered
};

/// A preview scene: which layout to run, its configuration, the proposal and
/// bounds to run it with, and the children to arrange.
struct Scene {
    LayoutKind layout = LayoutKind::Flow;
    FlowWrapConfig flow;
    CenteredDistributionConfig centered;

    ProposedSize proposal;
    std::optional<Rect> bounds;     // nullopt = use the measured size at the origin

    std::vector<std::unique_ptr<ILayoutChild>> children;

    /// Parse a scene document. Logs and returns nullopt on malformed input.
    static std::optional<Scene> fromJson(const nlohmann::json& json);
    static std::optional<Scene> loadFromFile(const std::string& path);
    static std::optional<Scene> loadFromString(const std::string& jsonStr);

    /// Non-owning view of the children, in order
    std::vector<const ILayoutChild*> childPointers() const;
};

/// Output of running a scene
struct SceneResult {
    Size size;
    std::vector<Placement> placements;

    nlohmann::json toJson() const;
};

/// Measure then place the scene's children with its layout
std::optional<SceneResult> runScene(const Scene& scene);

const char* layoutKindName(LayoutKind kind);

} // namespace lintel
