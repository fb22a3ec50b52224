/**
 * remcp - JSON configuration file helpers shared by both executables.
 */
#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace remcp::config
{

    // Parses a JSON object from disk; throws std::runtime_error with the path
    // in the message when the file is unreadable or not an object.
    nlohmann::json load_json_object(const std::filesystem::path &path);

    // Looks up `key` and converts it, throwing std::runtime_error naming the
    // key when the stored value has the wrong type.
    template <typename T>
    std::optional<T> optional_value(const nlohmann::json &object, const std::string &key)
    {
        const auto it = object.find(key);
        if (it == object.end() || it->is_null())
        {
            return std::nullopt;
        }
        try
        {
            return it->template get<T>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value for '" + key + "': " + ex.what());
        }
    }

} // namespace remcp::config
