#include "layout/LayoutConfig.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

#include <cmath>

namespace lintel {

static bool isValidSpacing(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

bool FlowWrapConfig::validate() const {
    if (!isValidSpacing(horizontalSpacing)) {
        LOG_ERROR("FlowWrapConfig: invalid horizontal spacing {}", horizontalSpacing);
        return false;
    }
    if (!isValidSpacing(verticalSpacing)) {
        LOG_ERROR("FlowWrapConfig: invalid vertical spacing {}", verticalSpacing);
        return false;
    }
    if (maxRows && *maxRows < 1) {
        LOG_ERROR("FlowWrapConfig: maxRows must be at least 1 (got {})", *maxRows);
        return false;
    }
    return true;
}

FlowWrapConfig FlowWrapConfig::fromConfig(const Config& config, const std::string& prefix) {
    FlowWrapConfig result;
    result.horizontalSpacing = config.getFloat(prefix + ".horizontal_spacing", result.horizontalSpacing);
    result.verticalSpacing = config.getFloat(prefix + ".vertical_spacing", result.verticalSpacing);

    int maxRows = config.getInt(prefix + ".max_rows", 0);
    if (maxRows != 0) {
        result.maxRows = maxRows;
    }
    return result;
}

bool CenteredDistributionConfig::validate() const {
    if (!isValidSpacing(spacing)) {
        LOG_ERROR("CenteredDistributionConfig: invalid spacing {}", spacing);
        return false;
    }
    return true;
}

CenteredDistributionConfig CenteredDistributionConfig::fromConfig(const Config& config,
                                                                  const std::string& prefix) {
    CenteredDistributionConfig result;
    result.spacing = config.getFloat(prefix + ".spacing", result.spacing);
    return result;
}

} // namespace lintel
