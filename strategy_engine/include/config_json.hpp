#pragma once

#include "exceptions.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits> // For std::numeric_limits
#include <string>

// Typed readers for optional keys of a JSON configuration object.
// An absent key leaves `target` untouched; a key of the wrong JSON type
// throws core::ConfigException.
namespace strategy_engine {
namespace config_json {

    using json = nlohmann::json;

    inline void requireObject(const json& node, const std::string& what) {
        if (!node.is_object()) {
            throw core::ConfigException(what + " must be a JSON object.");
        }
    }

    inline void readInt(const json& node, const char* key, int& target) {
        auto it = node.find(key);
        if (it == node.end()) return;
        if (!it->is_number_integer()) {
            throw core::ConfigException(std::string("'") + key + "' must be an integer.");
        }
        // get<int>() narrows with a plain cast, so check the range first
        const bool in_range = it->is_number_unsigned()
            ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              it->get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw core::ConfigException(std::string("'") + key + "' is out of range for an integer: " + it->dump());
        }
        target = it->get<int>();
    }

    inline void readDouble(const json& node, const char* key, double& target) {
        auto it = node.find(key);
        if (it == node.end()) return;
        if (!it->is_number()) {
            throw core::ConfigException(std::string("'") + key + "' must be a number.");
        }
        target = it->get<double>();
    }

    inline void readString(const json& node, const char* key, std::string& target) {
        auto it = node.find(key);
        if (it == node.end()) return;
        if (!it->is_string()) {
            throw core::ConfigException(std::string("'") + key + "' must be a string.");
        }
        target = it->get<std::string>();
    }

    inline void readBool(const json& node, const char* key, bool& target) {
        auto it = node.find(key);
        if (it == node.end()) return;
        if (!it->is_boolean()) {
            throw core::ConfigException(std::string("'") + key + "' must be a boolean.");
        }
        target = it->get<bool>();
    }

} // namespace config_json
} // namespace strategy_engine
