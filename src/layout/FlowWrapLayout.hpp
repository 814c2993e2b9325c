#pragma once

#include "layout/LayoutChild.hpp"
#include "layout/LayoutConfig.hpp"

#include <optional>
#include <vector>

namespace lintel {

/// One visual line of a flow layout
struct FlowRow {
    std::vector<size_t> indices;
    float width = 0.0f;     // Member widths plus internal horizontal spacing
    float height = 0.0f;    // Tallest member
};

/// Greedy left-to-right row packing.
/// Children keep their intrinsic (unconstrained) size. A child that does not fit
/// in the remaining width starts a new row; a child wider than the container gets
/// a row of its own. Children reporting forcedBreakAfter() end their row. With
/// maxRows set, the last permitted row absorbs everything left over (forced
/// breaks included) instead of opening more rows.
class FlowWrapLayout {
public:
    /// Validate the configuration; returns nullopt (logged) when it is invalid
    static std::optional<FlowWrapLayout> create(const FlowWrapConfig& config = {});

    /// Total size for a proposal. Height is the stacked row heights; width is the
    /// proposed width, or the widest row when the proposal is unconstrained.
    /// Returns nullopt for a negative/NaN proposed width or a null child.
    std::optional<Size> measure(ChildList children, const ProposedSize& proposal) const;

    /// Place every child inside bounds, wrapping at bounds.width.
    /// Placements are returned in child index order.
    std::optional<std::vector<Placement>> place(ChildList children, const Rect& bounds) const;

    /// Row partition for a given available width (+infinity = never wrap).
    /// Each child's size is queried exactly once.
    std::vector<FlowRow> computeRows(ChildList children, float maxWidth) const;

    const FlowWrapConfig& getConfig() const { return m_config; }

private:
    explicit FlowWrapLayout(const FlowWrapConfig& config) : m_config(config) {}

    /// Partition already-measured sizes into rows
    std::vector<FlowRow> partition(ChildList children, const std::vector<Size>& sizes,
                                   float maxWidth) const;

    FlowWrapConfig m_config;
};

} // namespace lintel
