#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "remcp/protocol.hpp"

namespace remcp::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{remcp::protocol::kDefaultPort};
        std::filesystem::path root{"."};
        std::size_t max_clients{5};
        std::uint64_t transfer_rate{256};
        std::optional<std::filesystem::path> log_file;
        bool debug{false};
    };

    // Applies the keys present in a JSON config file on top of `config`.
    void apply_config_file(const std::filesystem::path &path, ServerConfig &config);

    // Throws std::invalid_argument describing the first invalid setting.
    void validate(const ServerConfig &config);

} // namespace remcp::server
