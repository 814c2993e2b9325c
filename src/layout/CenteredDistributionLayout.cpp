#include "layout/CenteredDistributionLayout.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cmath>

namespace lintel {

std::optional<CenteredDistributionLayout> CenteredDistributionLayout::create(
    const CenteredDistributionConfig& config) {
    if (!config.validate()) {
        return std::nullopt;
    }
    return CenteredDistributionLayout(config);
}

float CenteredDistributionLayout::sideWidth(const Rect& bounds, float centerWidth) const {
    return (bounds.width - centerWidth) / 2.0f - m_config.spacing;
}

std::optional<Size> CenteredDistributionLayout::measure(ChildList children,
                                                        const ProposedSize& proposal) const {
    if (proposal.width && (std::isnan(*proposal.width) || *proposal.width < 0.0f)) {
        LOG_ERROR("CenteredDistributionLayout::measure: invalid proposed width {}", *proposal.width);
        return std::nullopt;
    }
    if (containsNullChild(children, "CenteredDistributionLayout::measure")) {
        return std::nullopt;
    }
    if (children.empty()) {
        return Size();
    }

    float maxHeight = 0.0f;
    float naturalWidth = m_config.spacing * static_cast<float>(children.size() - 1);
    for (const auto* child : children) {
        Size size = sanitizeSize(child->sizeThatFits(ProposedSize::unspecified()));
        maxHeight = std::max(maxHeight, size.height);
        naturalWidth += size.width;
    }

    bool constrained = proposal.width && std::isfinite(*proposal.width);
    return Size(constrained ? *proposal.width : naturalWidth, maxHeight);
}

std::optional<std::vector<Placement>> CenteredDistributionLayout::place(ChildList children,
                                                                        const Rect& bounds) const {
    if (!std::isfinite(bounds.x) || !std::isfinite(bounds.y) ||
        !std::isfinite(bounds.width) || !std::isfinite(bounds.height) ||
        bounds.width < 0.0f || bounds.height < 0.0f) {
        LOG_ERROR("CenteredDistributionLayout::place: invalid bounds ({}, {}, {}, {})",
                  bounds.x, bounds.y, bounds.width, bounds.height);
        return std::nullopt;
    }
    if (containsNullChild(children, "CenteredDistributionLayout::place")) {
        return std::nullopt;
    }

    std::vector<Placement> placements(children.size());
    if (children.empty()) {
        return placements;
    }

    const size_t center = centerIndex(children.size());

    // Center child: intrinsic size, pinned to the midpoint
    Size centerSize = sanitizeSize(children[center]->sizeThatFits(ProposedSize::unspecified()));
    placements[center] = Placement{center,
                                   bounds.midX() - centerSize.width / 2.0f,
                                   bounds.midY() - centerSize.height / 2.0f,
                                   centerSize.width, centerSize.height};

    float side = sideWidth(bounds, centerSize.width);

    // Left side, laid out from minX
    const size_t leftCount = center;
    if (leftCount > 0) {
        float widthPerItem = std::max(side / static_cast<float>(leftCount), 0.0f);
        float x = bounds.minX();
        for (size_t i = 0; i < leftCount; ++i) {
            Size size = sanitizeSize(children[i]->sizeThatFits(ProposedSize::fixedWidth(widthPerItem)));
            placements[i] = Placement{i, x, bounds.midY() - size.height / 2.0f, size.width, size.height};
            x += size.width + m_config.spacing;
        }
    }

    // Right side, laid out backwards from maxX
    const size_t rightCount = children.size() - center - 1;
    if (rightCount > 0) {
        float widthPerItem = std::max(side / static_cast<float>(rightCount), 0.0f);
        float x = bounds.maxX();
        for (size_t i = children.size() - 1; i > center; --i) {
            Size size = sanitizeSize(children[i]->sizeThatFits(ProposedSize::fixedWidth(widthPerItem)));
            x -= size.width;
            placements[i] = Placement{i, x, bounds.midY() - size.height / 2.0f, size.width, size.height};
            x -= m_config.spacing;
        }
    }

    LOG_TRACE("CenteredDistributionLayout: center {} of {}, side width {}", center, children.size(), side);
    return placements;
}

} // namespace lintel
