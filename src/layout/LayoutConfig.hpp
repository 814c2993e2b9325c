#pragma once

#include <optional>
#include <string>

namespace lintel {

class Config;

/// Spacing and row cap for FlowWrapLayout
struct FlowWrapConfig {
    float horizontalSpacing = 8.0f;
    float verticalSpacing = 8.0f;
    std::optional<int> maxRows;     // nullopt = unlimited rows

    /// Returns false (and logs why) for negative/non-finite spacing or maxRows < 1
    bool validate() const;

    /// Read "<prefix>.horizontal_spacing", "<prefix>.vertical_spacing" and
    /// "<prefix>.max_rows" (absent or 0 = no cap). Missing keys keep defaults.
    static FlowWrapConfig fromConfig(const Config& config, const std::string& prefix = "flow");
};

/// Spacing for CenteredDistributionLayout
struct CenteredDistributionConfig {
    float spacing = 0.0f;

    bool validate() const;

    /// Read "<prefix>.spacing"
    static CenteredDistributionConfig fromConfig(const Config& config,
                                                 const std::string& prefix = "centered");
};

} // namespace lintel
