#pragma once

#include "layout/LayoutTypes.hpp"

#include <span>

namespace lintel {

/// Host-side participant in a layout pass.
/// The layouts only ever query a child; they never mutate or retain it.
/// sizeThatFits must be a pure function of the child's content and the
/// proposal for the duration of one pass.
class ILayoutChild {
public:
    virtual ~ILayoutChild() = default;

    /// Preferred size given a proposal. Unconstrained axes report the intrinsic size.
    virtual Size sizeThatFits(const ProposedSize& proposal) const = 0;

    /// End the flow row after this child (ignored by non-flow layouts)
    virtual bool forcedBreakAfter() const { return false; }
};

/// Ordered child collection handed to a layout call
using ChildList = std::span<const ILayoutChild* const>;

/// Child with a fixed intrinsic size that ignores proposals
class FixedChild : public ILayoutChild {
public:
    FixedChild() = default;
    FixedChild(float width, float height, bool breakAfter = false)
        : m_size(width, height), m_breakAfter(breakAfter) {}

    Size sizeThatFits(const ProposedSize& proposal) const override;
    bool forcedBreakAfter() const override { return m_breakAfter; }

    const Size& getSize() const { return m_size; }

private:
    Size m_size;
    bool m_breakAfter = false;
};

/// Text-like child: a single line of naturalWidth when unconstrained, wrapping
/// onto more lines of lineHeight when proposed a narrower width.
class WrappingChild : public ILayoutChild {
public:
    WrappingChild(float naturalWidth, float lineHeight, bool breakAfter = false)
        : m_naturalWidth(naturalWidth), m_lineHeight(lineHeight), m_breakAfter(breakAfter) {}

    Size sizeThatFits(const ProposedSize& proposal) const override;
    bool forcedBreakAfter() const override { return m_breakAfter; }

private:
    float m_naturalWidth;
    float m_lineHeight;
    bool m_breakAfter;
};

/// Clamp a host-reported size to non-negative components (NaN becomes 0)
Size sanitizeSize(const Size& size);

/// True if any entry is null (logged with the caller's name)
bool containsNullChild(ChildList children, const char* caller);

} // namespace lintel
