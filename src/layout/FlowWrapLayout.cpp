#include "layout/FlowWrapLayout.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace lintel {

std::optional<FlowWrapLayout> FlowWrapLayout::create(const FlowWrapConfig& config) {
    if (!config.validate()) {
        return std::nullopt;
    }
    return FlowWrapLayout(config);
}

std::vector<FlowRow> FlowWrapLayout::computeRows(ChildList children, float maxWidth) const {
    if (containsNullChild(children, "FlowWrapLayout::computeRows")) {
        return {};
    }

    std::vector<Size> sizes;
    sizes.reserve(children.size());
    for (const auto* child : children) {
        sizes.push_back(sanitizeSize(child->sizeThatFits(ProposedSize::unspecified())));
    }
    return partition(children, sizes, maxWidth);
}

std::vector<FlowRow> FlowWrapLayout::partition(ChildList children, const std::vector<Size>& sizes,
                                               float maxWidth) const {
    std::vector<FlowRow> rows;
    FlowRow current;

    // The row under construction is the last one allowed once maxRows - 1 rows are closed
    auto onLastRow = [&]() {
        return m_config.maxRows && static_cast<int>(rows.size()) + 1 >= *m_config.maxRows;
    };

    auto closeRow = [&]() {
        rows.push_back(std::move(current));
        current = FlowRow{};
    };

    for (size_t i = 0; i < sizes.size(); ++i) {
        const Size& size = sizes[i];
        float requiredWidth = current.indices.empty()
            ? size.width
            : current.width + m_config.horizontalSpacing + size.width;

        if (requiredWidth <= maxWidth || current.indices.empty() || onLastRow()) {
            current.indices.push_back(i);
            current.width = requiredWidth;
            current.height = std::max(current.height, size.height);
        } else {
            closeRow();
            current.indices.push_back(i);
            current.width = size.width;
            current.height = size.height;
        }

        if (children[i]->forcedBreakAfter() && !onLastRow()) {
            closeRow();
        }
    }

    if (!current.indices.empty()) {
        closeRow();
    }

    LOG_TRACE("FlowWrapLayout: {} children in {} rows (max width {})",
              sizes.size(), rows.size(), maxWidth);
    return rows;
}

std::optional<Size> FlowWrapLayout::measure(ChildList children, const ProposedSize& proposal) const {
    if (proposal.width && (std::isnan(*proposal.width) || *proposal.width < 0.0f)) {
        LOG_ERROR("FlowWrapLayout::measure: invalid proposed width {}", *proposal.width);
        return std::nullopt;
    }
    if (containsNullChild(children, "FlowWrapLayout::measure")) {
        return std::nullopt;
    }

    auto rows = computeRows(children, proposal.widthOrInfinity());

    float totalHeight = 0.0f;
    float widestRow = 0.0f;
    for (const auto& row : rows) {
        totalHeight += row.height;
        widestRow = std::max(widestRow, row.width);
    }
    if (rows.size() > 1) {
        totalHeight += m_config.verticalSpacing * static_cast<float>(rows.size() - 1);
    }

    // Unconstrained (or infinite) proposals report the content width instead
    bool constrained = proposal.width && std::isfinite(*proposal.width);
    return Size(constrained ? *proposal.width : widestRow, totalHeight);
}

std::optional<std::vector<Placement>> FlowWrapLayout::place(ChildList children,
                                                            const Rect& bounds) const {
    if (!std::isfinite(bounds.x) || !std::isfinite(bounds.y) ||
        std::isnan(bounds.width) || bounds.width < 0.0f ||
        std::isnan(bounds.height) || bounds.height < 0.0f) {
        LOG_ERROR("FlowWrapLayout::place: invalid bounds ({}, {}, {}, {})",
                  bounds.x, bounds.y, bounds.width, bounds.height);
        return std::nullopt;
    }
    if (containsNullChild(children, "FlowWrapLayout::place")) {
        return std::nullopt;
    }

    std::vector<Size> sizes;
    sizes.reserve(children.size());
    for (const auto* child : children) {
        sizes.push_back(sanitizeSize(child->sizeThatFits(ProposedSize::unspecified())));
    }

    auto rows = partition(children, sizes, bounds.width);

    std::vector<Placement> placements(children.size());
    float y = bounds.minY();
    for (const auto& row : rows) {
        float x = bounds.minX();
        for (size_t index : row.indices) {
            const Size& size = sizes[index];
            placements[index] = Placement{index, x, y, size.width, size.height};
            x += size.width + m_config.horizontalSpacing;
        }
        y += row.height + m_config.verticalSpacing;
    }
    return placements;
}

} // namespace lintel
