#include "remcp/server/config.hpp"

#include <stdexcept>

#include "remcp/config_file.hpp"

namespace remcp::server
{

    void apply_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        const auto json = remcp::config::load_json_object(path);

        if (auto value = remcp::config::optional_value<std::string>(json, "address"))
        {
            config.address = *value;
        }
        if (auto value = remcp::config::optional_value<std::uint16_t>(json, "port"))
        {
            config.port = *value;
        }
        if (auto value = remcp::config::optional_value<std::string>(json, "root"))
        {
            config.root = std::filesystem::path(*value);
        }
        if (auto value = remcp::config::optional_value<std::size_t>(json, "max_clients"))
        {
            config.max_clients = *value;
        }
        if (auto value = remcp::config::optional_value<std::uint64_t>(json, "transfer_rate"))
        {
            config.transfer_rate = *value;
        }
        if (auto value = remcp::config::optional_value<std::string>(json, "log_file"))
        {
            config.log_file = std::filesystem::path(*value);
        }
        if (auto value = remcp::config::optional_value<bool>(json, "debug"))
        {
            config.debug = *value;
        }
    }

    void validate(const ServerConfig &config)
    {
        if (config.address.empty())
        {
            throw std::invalid_argument("Listen address must not be empty");
        }
        if (config.max_clients == 0)
        {
            throw std::invalid_argument("Maximum number of clients must be at least 1");
        }
        if (config.transfer_rate == 0)
        {
            throw std::invalid_argument("Transfer rate must be at least 1 byte per second");
        }
    }

} // namespace remcp::server
