/**
 * remcp - Shared error taxonomy used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace remcp
{

    enum class ErrorKind : std::uint8_t
    {
        InvalidCommand = 0,
        MissingArguments = 1,
        UnknownCommand = 2,
        ServerBusy = 3,
        FileError = 4,
        Other = 5
    };

    std::string_view to_string(ErrorKind kind) noexcept;

    // Text carried after "ERR " on the wire.
    std::string wire_message(ErrorKind kind, std::string_view detail);

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorKind kind, std::string message, std::error_code transport = {});

        ErrorKind kind() const noexcept { return kind_; }
        const std::error_code &transport_error() const noexcept { return transport_; }

    private:
        ErrorKind kind_;
        std::error_code transport_;
    };

} // namespace remcp
