#include "core/Config.hpp"
#include "core/Log.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace lintel {

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config: cannot open '{}'", path);
        return false;
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: failed to parse '{}': {}", path, e.what());
        return false;
    }
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    try {
        m_data = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: failed to parse string: {}", e.what());
        return false;
    }
    return true;
}

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = resolve(key);
    if (!val || !val->is_number_integer()) {
        return defaultVal;
    }

    constexpr auto minInt = static_cast<int64_t>(std::numeric_limits<int>::min());
    constexpr auto maxInt = static_cast<int64_t>(std::numeric_limits<int>::max());
    if (val->is_number_unsigned()) {
        if (val->get<uint64_t>() > static_cast<uint64_t>(maxInt)) {
            LOG_ERROR("Config: '{}' is out of range ({})", key, val->get<uint64_t>());
            return defaultVal;
        }
    } else {
        auto wide = val->get<int64_t>();
        if (wide < minInt || wide > maxInt) {
            LOG_ERROR("Config: '{}' is out of range ({})", key, wide);
            return defaultVal;
        }
    }
    return val->get<int>();
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number()) {
        return val->get<float>();
    }
    return defaultVal;
}

} // namespace lintel
