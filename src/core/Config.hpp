#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace lintel {

/// Read-only JSON configuration document addressed with dot-notation key paths
/// (e.g. "flow.max_rows"). Missing or mistyped keys fall back to the given default.
class Config {
public:
    Config() = default;
    explicit Config(nlohmann::json data) : m_data(std::move(data)) {}

    /// Load from a JSON file. Returns false (config unchanged) if the file
    /// cannot be read or parsed.
    bool loadFromFile(const std::string& path);

    /// Load from a JSON string (useful for testing)
    bool loadFromString(const std::string& jsonStr);

    /// Integers outside the range of int are logged and read as the default
    int   getInt(const std::string& key, int defaultVal = 0) const;
    float getFloat(const std::string& key, float defaultVal = 0.0f) const;

private:
    /// Walk a dot-separated key path; nullptr if any segment is missing
    const nlohmann::json* resolve(const std::string& key) const;

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace lintel
