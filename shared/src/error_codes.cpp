#include "remcp/error_codes.hpp"

#include <array>

namespace remcp
{

    namespace
    {
        struct ErrorKindDescription
        {
            ErrorKind kind;
            std::string_view description;
        };

        constexpr std::array<ErrorKindDescription, 6> kDescriptions{{
            {ErrorKind::InvalidCommand, "invalid_command"},
            {ErrorKind::MissingArguments, "missing_arguments"},
            {ErrorKind::UnknownCommand, "unknown_command"},
            {ErrorKind::ServerBusy, "server_busy"},
            {ErrorKind::FileError, "file_error"},
            {ErrorKind::Other, "other"},
        }};

        constexpr std::string_view kFileErrorPrefix = "FileError:";
    } // namespace

    std::string_view to_string(ErrorKind kind) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.kind == kind)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string wire_message(ErrorKind kind, std::string_view detail)
    {
        switch (kind)
        {
        case ErrorKind::InvalidCommand:
            return "Invalid command";
        case ErrorKind::MissingArguments:
            return "Missing arguments";
        case ErrorKind::UnknownCommand:
            return "Unknown command";
        case ErrorKind::ServerBusy:
            return "Server is busy";
        case ErrorKind::FileError:
            return std::string(kFileErrorPrefix) + std::string(detail);
        case ErrorKind::Other:
            break;
        }
        return std::string(detail);
    }

    TransferError::TransferError(ErrorKind kind, std::string message, std::error_code transport)
        : std::runtime_error(std::move(message)), kind_(kind), transport_(transport)
    {
    }

} // namespace remcp
