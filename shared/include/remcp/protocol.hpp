/**
 * remcp - Line protocol schema and text codec.
 *
 * One command or response per line, fields separated by whitespace:
 *
 *   C->S  GET <path> <offset>
 *   C->S  PUT <path> <offset> <total_size>
 *   S->C  OK [<remaining>]
 *   S->C  NEXT <n>          followed by up to n raw payload bytes
 *   S->C  ERR <message>
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "remcp/error_codes.hpp"

namespace remcp::protocol
{

    constexpr std::uint16_t kDefaultPort = 7878;

    enum class Command : std::uint8_t
    {
        Get,
        Put
    };

    std::string_view to_string(Command command) noexcept;

    // Case-insensitive.
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    struct TransferRequest
    {
        Command command{Command::Get};
        std::string path;
        std::uint64_t offset{};
        std::uint64_t total_size{};

        bool operator==(const TransferRequest &) const = default;
    };

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Next = 1,
        Error = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;

    struct ServerResponse
    {
        ResponseKind kind{ResponseKind::Ok};
        std::optional<std::uint64_t> remaining{};
        std::uint64_t chunk_size{};
        ErrorKind error{ErrorKind::Other};
        std::string detail{};

        bool operator==(const ServerResponse &) const = default;
    };

    ServerResponse make_ok(std::optional<std::uint64_t> remaining = std::nullopt);
    ServerResponse make_next(std::uint64_t chunk_size);
    ServerResponse make_error(ErrorKind kind, std::string detail = {});

    std::string encode_request(const TransferRequest &request);

    // Returns std::nullopt and sets `error` when the line is not a valid request.
    std::optional<TransferRequest> decode_request(std::string_view line, ErrorKind &error);

    std::string encode_response(const ServerResponse &response);

    // Total: every line maps to exactly one response, malformed input decodes
    // to an Other error carrying the raw line.
    ServerResponse decode_response(std::string_view line);

} // namespace remcp::protocol
