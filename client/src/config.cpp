#include "remcp/client/config.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "remcp/config_file.hpp"

namespace remcp::client
{

    namespace
    {
        constexpr auto kUsage = "Usage: remcp [--port <PORT>] [--retries <N>] [--retry-delay <MS>] [--config <FILE>] "
                                "[--log <FILE>] [--debug] <source> <destination>";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;

        // Config file first so that explicit flags override it.
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(std::filesystem::path(argv[i + 1]), config);
            }
        }

        std::vector<std::string> positional;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--debug")
            {
                config.debug = true;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--retries")
            {
                config.max_attempts = static_cast<std::size_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--retry-delay")
            {
                config.retry_delay = std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--config")
            {
                require_value(index, argc, argv, arg);
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (positional.size() != 2)
        {
            throw std::runtime_error(kUsage);
        }
        if (config.max_attempts == 0)
        {
            throw std::runtime_error("--retries must be at least 1");
        }
        if (config.retry_delay.count() < 0)
        {
            throw std::runtime_error("--retry-delay must not be negative");
        }
        config.source = positional[0];
        config.destination = positional[1];
        return config;
    }

    void apply_config_file(const std::filesystem::path &path, ClientConfig &config)
    {
        const auto json = remcp::config::load_json_object(path);

        if (auto value = remcp::config::optional_value<std::uint16_t>(json, "port"))
        {
            config.port = *value;
        }
        if (auto value = remcp::config::optional_value<std::size_t>(json, "max_attempts"))
        {
            config.max_attempts = *value;
        }
        if (auto value = remcp::config::optional_value<std::int64_t>(json, "retry_delay_ms"))
        {
            config.retry_delay = std::chrono::milliseconds(*value);
        }
        if (auto value = remcp::config::optional_value<std::string>(json, "log_file"))
        {
            config.log_path = std::filesystem::path(*value);
        }
        if (auto value = remcp::config::optional_value<bool>(json, "debug"))
        {
            config.debug = *value;
        }
    }

    std::optional<RemoteEndpoint> parse_remote(std::string_view endpoint)
    {
        const auto colon = endpoint.find(':');
        if (colon == std::string_view::npos || colon == 0)
        {
            return std::nullopt;
        }
        return RemoteEndpoint{
            .host = std::string(endpoint.substr(0, colon)),
            .path = std::string(endpoint.substr(colon + 1)),
        };
    }

    TransferPlan plan_transfer(const ClientConfig &config)
    {
        const auto remote_source = parse_remote(config.source);
        const auto remote_destination = parse_remote(config.destination);

        if (remote_source && remote_destination)
        {
            throw std::invalid_argument("Both source and destination cannot be remote");
        }
        if (!remote_source && !remote_destination)
        {
            throw std::invalid_argument("Both source and destination cannot be local");
        }

        const auto &remote = remote_source ? *remote_source : *remote_destination;
        if (remote.path.empty())
        {
            throw std::invalid_argument("Remote endpoint " + remote.host + ": has no path");
        }
        if (remote.path.find_first_of(" \t\r\n") != std::string::npos)
        {
            throw std::invalid_argument("Remote paths cannot contain whitespace");
        }

        TransferPlan plan;
        plan.direction = remote_source ? Direction::Download : Direction::Upload;
        plan.remote = remote;
        plan.local_path = std::filesystem::path(remote_source ? config.destination : config.source);
        return plan;
    }

} // namespace remcp::client
