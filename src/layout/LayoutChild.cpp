#include "layout/LayoutChild.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cmath>

namespace lintel {

Size sanitizeSize(const Size& size) {
    // std::max(0, NaN) yields 0
    return Size(std::max(0.0f, size.width), std::max(0.0f, size.height));
}

bool containsNullChild(ChildList children, const char* caller) {
    for (size_t i = 0; i < children.size(); ++i) {
        if (!children[i]) {
            LOG_ERROR("{}: child {} is null", caller, i);
            return true;
        }
    }
    return false;
}

Size FixedChild::sizeThatFits(const ProposedSize& /*proposal*/) const {
    return m_size;
}

Size WrappingChild::sizeThatFits(const ProposedSize& proposal) const {
    if (!proposal.width || !std::isfinite(*proposal.width)) {
        return Size(m_naturalWidth, m_lineHeight);
    }

    float width = std::min(m_naturalWidth, std::max(*proposal.width, 0.0f));
    if (width <= 0.0f) {
        return Size(0.0f, m_lineHeight);
    }

    float lines = std::ceil(m_naturalWidth / width);
    return Size(width, m_lineHeight * std::max(lines, 1.0f));
}

} // namespace lintel
