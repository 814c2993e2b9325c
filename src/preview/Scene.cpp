#include "preview/Scene.hpp"
#include "layout/FlowWrapLayout.hpp"
#include "layout/CenteredDistributionLayout.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

#include <fstream>

namespace lintel {

const char* layoutKindName(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Flow:     return "flow";
        case LayoutKind::Centered: return "centered";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static bool readNumber(const nlohmann::json& json, const char* key, float& out) {
    if (!json.contains(key) || !json[key].is_number()) {
        return false;
    }
    out = json[key].get<float>();
    return true;
}

static std::unique_ptr<ILayoutChild> parseChild(const nlohmann::json& json, size_t index) {
    if (!json.is_object()) {
        PREVIEW_LOG_ERROR("Scene: child {} is not an object", index);
        return nullptr;
    }

    bool breakAfter = json.value("break_after", false);

    float width = 0.0f;
    float height = 0.0f;
    if (readNumber(json, "width", width) && readNumber(json, "height", height)) {
        return std::make_unique<FixedChild>(width, height, breakAfter);
    }

    float textWidth = 0.0f;
    float lineHeight = 0.0f;
    if (readNumber(json, "text_width", textWidth) && readNumber(json, "line_height", lineHeight)) {
        return std::make_unique<WrappingChild>(textWidth, lineHeight, breakAfter);
    }

    PREVIEW_LOG_ERROR("Scene: child {} needs 'width'/'height' or 'text_width'/'line_height'", index);
    return nullptr;
}

static std::optional<Scene> parseScene(const nlohmann::json& json) {
    if (!json.is_object()) {
        PREVIEW_LOG_ERROR("Scene: document root must be an object");
        return std::nullopt;
    }

    Scene scene;

    std::string kind = json.value("layout", "flow");
    if (kind == "flow") {
        scene.layout = LayoutKind::Flow;
    } else if (kind == "centered") {
        scene.layout = LayoutKind::Centered;
    } else {
        PREVIEW_LOG_ERROR("Scene: unknown layout '{}'", kind);
        return std::nullopt;
    }

    Config config(json);
    scene.flow = FlowWrapConfig::fromConfig(config, "flow");
    scene.centered = CenteredDistributionConfig::fromConfig(config, "centered");

    if (json.contains("bounds")) {
        const auto& b = json["bounds"];
        Rect rect;
        if (!b.is_object() || !readNumber(b, "width", rect.width) || !readNumber(b, "height", rect.height)) {
            PREVIEW_LOG_ERROR("Scene: 'bounds' needs numeric 'width' and 'height'");
            return std::nullopt;
        }
        readNumber(b, "x", rect.x);
        readNumber(b, "y", rect.y);
        scene.bounds = rect;
    }

    // Without an explicit proposal, measure against the bounds
    if (json.contains("proposal")) {
        const auto& p = json["proposal"];
        if (!p.is_object()) {
            PREVIEW_LOG_ERROR("Scene: 'proposal' must be an object");
            return std::nullopt;
        }
        float value = 0.0f;
        if (readNumber(p, "width", value)) scene.proposal.width = value;
        if (readNumber(p, "height", value)) scene.proposal.height = value;
    } else if (scene.bounds) {
        scene.proposal = ProposedSize::exactly(scene.bounds->width, scene.bounds->height);
    }

    if (json.contains("children")) {
        if (!json["children"].is_array()) {
            PREVIEW_LOG_ERROR("Scene: 'children' must be an array");
            return std::nullopt;
        }
        size_t index = 0;
        for (const auto& entry : json["children"]) {
            auto child = parseChild(entry, index++);
            if (!child) {
                return std::nullopt;
            }
            scene.children.push_back(std::move(child));
        }
    }

    PREVIEW_LOG_DEBUG("Scene: {} layout with {} children", kind, scene.children.size());
    return scene;
}

std::optional<Scene> Scene::fromJson(const nlohmann::json& json) {
    // json::value() throws when a present key has the wrong type
    try {
        return parseScene(json);
    } catch (const nlohmann::json::type_error& e) {
        PREVIEW_LOG_ERROR("Scene: invalid value type: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Scene> Scene::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        PREVIEW_LOG_ERROR("Scene: cannot open '{}'", path);
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        PREVIEW_LOG_ERROR("Scene: failed to parse '{}': {}", path, e.what());
        return std::nullopt;
    }
    return fromJson(json);
}

std::optional<Scene> Scene::loadFromString(const std::string& jsonStr) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        PREVIEW_LOG_ERROR("Scene: failed to parse string: {}", e.what());
        return std::nullopt;
    }
    return fromJson(json);
}

std::vector<const ILayoutChild*> Scene::childPointers() const {
    std::vector<const ILayoutChild*> result;
    result.reserve(children.size());
    for (const auto& child : children) {
        result.push_back(child.get());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Running
// ---------------------------------------------------------------------------

nlohmann::json SceneResult::toJson() const {
    nlohmann::json out;
    out["size"] = {{"width", size.width}, {"height", size.height}};
    out["placements"] = nlohmann::json::array();
    for (const auto& p : placements) {
        out["placements"].push_back({
            {"index", p.index},
            {"x", p.x},
            {"y", p.y},
            {"width", p.width},
            {"height", p.height}
        });
    }
    return out;
}

template <typename LayoutT>
static std::optional<SceneResult> runLayout(const LayoutT& layout, const Scene& scene) {
    auto pointers = scene.childPointers();
    ChildList children(pointers);

    auto size = layout.measure(children, scene.proposal);
    if (!size) {
        return std::nullopt;
    }

    Rect bounds = scene.bounds.value_or(Rect(0.0f, 0.0f, size->width, size->height));
    auto placements = layout.place(children, bounds);
    if (!placements) {
        return std::nullopt;
    }

    return SceneResult{*size, std::move(*placements)};
}

std::optional<SceneResult> runScene(const Scene& scene) {
    switch (scene.layout) {
        case LayoutKind::Flow: {
            auto layout = FlowWrapLayout::create(scene.flow);
            if (!layout) return std::nullopt;
            return runLayout(*layout, scene);
        }
        case LayoutKind::Centered: {
            auto layout = CenteredDistributionLayout::create(scene.centered);
            if (!layout) return std::nullopt;
            return runLayout(*layout, scene);
        }
    }
    return std::nullopt;
}

} // namespace lintel
