#include "remcp/config_file.hpp"

#include <fstream>
#include <stdexcept>

namespace remcp::config
{

    nlohmann::json load_json_object(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Malformed config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file " + path.string() + " must contain a JSON object");
        }
        return json;
    }

} // namespace remcp::config
