#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "remcp/protocol.hpp"

namespace remcp::client
{

    struct ClientConfig
    {
        std::string source;
        std::string destination;
        std::uint16_t port{remcp::protocol::kDefaultPort};
        std::size_t max_attempts{5};
        std::chrono::milliseconds retry_delay{std::chrono::seconds{1}};
        std::optional<std::filesystem::path> log_path;
        bool debug{false};
    };

    enum class Direction : std::uint8_t
    {
        Download,
        Upload
    };

    struct RemoteEndpoint
    {
        std::string host;
        std::string path;
    };

    struct TransferPlan
    {
        Direction direction{Direction::Download};
        RemoteEndpoint remote;
        std::filesystem::path local_path;
    };

    // Throws std::runtime_error on unknown flags, missing values or a wrong
    // number of positional arguments.
    ClientConfig parse_arguments(int argc, char *argv[]);

    void apply_config_file(const std::filesystem::path &path, ClientConfig &config);

    // "host:path" split at the first colon; std::nullopt for local paths.
    std::optional<RemoteEndpoint> parse_remote(std::string_view endpoint);

    // Exactly one of source/destination must be remote. Throws
    // std::invalid_argument otherwise.
    TransferPlan plan_transfer(const ClientConfig &config);

} // namespace remcp::client
