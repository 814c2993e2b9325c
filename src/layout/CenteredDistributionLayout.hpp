#pragma once

#include "layout/LayoutChild.hpp"
#include "layout/LayoutConfig.hpp"

#include <optional>
#include <vector>

namespace lintel {

/// Three-section layout: the middle child (index count / 2) is pinned at the
/// horizontal midpoint at its intrinsic size. Children before it fill the left
/// side from minX, children after it fill the right side back from maxX. Both
/// sides are offered the same nominal width, split evenly between their items.
///
/// The nominal side width reserves a single spacing unit per side, while
/// placement inserts spacing between every pair of side items, so a side with
/// several items may consume more than its nominal width.
class CenteredDistributionLayout {
public:
    static std::optional<CenteredDistributionLayout> create(const CenteredDistributionConfig& config = {});

    /// Index of the pinned center child for a given child count
    static size_t centerIndex(size_t count) { return count / 2; }

    /// Width nominally available to each side: (bounds.width - centerWidth) / 2 - spacing
    float sideWidth(const Rect& bounds, float centerWidth) const;

    /// Height is the tallest unconstrained child; width is the proposed width,
    /// or the natural single-line width when unconstrained. Empty input is zero size.
    std::optional<Size> measure(ChildList children, const ProposedSize& proposal) const;

    /// Placements in child index order. Empty input yields no placements.
    std::optional<std::vector<Placement>> place(ChildList children, const Rect& bounds) const;

    const CenteredDistributionConfig& getConfig() const { return m_config; }

private:
    explicit CenteredDistributionLayout(const CenteredDistributionConfig& config) : m_config(config) {}

    CenteredDistributionConfig m_config;
};

} // namespace lintel
