#include "remcp/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <vector>

namespace remcp::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 2> kCommandMappings{{
            {Command::Get, "GET"},
            {Command::Put, "PUT"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Next, "NEXT"},
            {ResponseKind::Error, "ERR"},
        }};

        struct KnownError
        {
            std::string_view message;
            ErrorKind kind;
        };

        // "Server busy" is what older servers sent before the message was fixed.
        constexpr std::array<KnownError, 5> kKnownErrors{{
            {"Invalid command", ErrorKind::InvalidCommand},
            {"Missing arguments", ErrorKind::MissingArguments},
            {"Unknown command", ErrorKind::UnknownCommand},
            {"Server is busy", ErrorKind::ServerBusy},
            {"Server busy", ErrorKind::ServerBusy},
        }};

        constexpr std::string_view kFileErrorPrefix = "FileError:";
        constexpr std::string_view kErrorPrefix = "ERR ";

        bool is_space(char ch)
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        std::vector<std::string_view> split_tokens(std::string_view input)
        {
            std::vector<std::string_view> tokens;
            std::size_t pos = 0;
            while (pos < input.size())
            {
                while (pos < input.size() && is_space(input[pos]))
                {
                    ++pos;
                }
                const auto begin = pos;
                while (pos < input.size() && !is_space(input[pos]))
                {
                    ++pos;
                }
                if (pos > begin)
                {
                    tokens.push_back(input.substr(begin, pos - begin));
                }
            }
            return tokens;
        }

        std::optional<std::uint64_t> parse_u64(std::string_view text)
        {
            std::uint64_t value = 0;
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || text.empty())
            {
                return std::nullopt;
            }
            return value;
        }

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::toupper(static_cast<unsigned char>(a)) ==
                                       std::toupper(static_cast<unsigned char>(b)); });
        }

        std::string_view strip_line_ending(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            {
                line.remove_suffix(1);
            }
            return line;
        }

        ServerResponse decode_error(std::string_view message)
        {
            for (const auto &known : kKnownErrors)
            {
                if (known.message == message)
                {
                    return make_error(known.kind);
                }
            }
            if (message.starts_with(kFileErrorPrefix))
            {
                return make_error(ErrorKind::FileError, std::string(message.substr(kFileErrorPrefix.size())));
            }
            return make_error(ErrorKind::Other, std::string(message));
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (iequals(mapping.label, value))
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    ServerResponse make_ok(std::optional<std::uint64_t> remaining)
    {
        ServerResponse response;
        response.kind = ResponseKind::Ok;
        response.remaining = remaining;
        return response;
    }

    ServerResponse make_next(std::uint64_t chunk_size)
    {
        ServerResponse response;
        response.kind = ResponseKind::Next;
        response.chunk_size = chunk_size;
        return response;
    }

    ServerResponse make_error(ErrorKind kind, std::string detail)
    {
        ServerResponse response;
        response.kind = ResponseKind::Error;
        response.error = kind;
        response.detail = std::move(detail);
        return response;
    }

    std::string encode_request(const TransferRequest &request)
    {
        std::string line(to_string(request.command));
        line += ' ';
        line += request.path;
        line += ' ';
        line += std::to_string(request.offset);
        if (request.command == Command::Put)
        {
            line += ' ';
            line += std::to_string(request.total_size);
        }
        line += '\n';
        return line;
    }

    std::optional<TransferRequest> decode_request(std::string_view line, ErrorKind &error)
    {
        const auto tokens = split_tokens(strip_line_ending(line));
        if (tokens.empty())
        {
            error = ErrorKind::InvalidCommand;
            return std::nullopt;
        }

        const auto command = command_from_string(tokens[0]);
        if (!command)
        {
            error = ErrorKind::UnknownCommand;
            return std::nullopt;
        }

        const std::size_t required = *command == Command::Put ? 4 : 3;
        if (tokens.size() < required)
        {
            error = ErrorKind::MissingArguments;
            return std::nullopt;
        }

        TransferRequest request;
        request.command = *command;
        request.path = std::string(tokens[1]);

        const auto offset = parse_u64(tokens[2]);
        if (!offset)
        {
            error = ErrorKind::InvalidCommand;
            return std::nullopt;
        }
        request.offset = *offset;

        if (*command == Command::Put)
        {
            const auto total = parse_u64(tokens[3]);
            if (!total)
            {
                error = ErrorKind::InvalidCommand;
                return std::nullopt;
            }
            request.total_size = *total;
        }
        return request;
    }

    std::string encode_response(const ServerResponse &response)
    {
        std::string line(to_string(response.kind));
        switch (response.kind)
        {
        case ResponseKind::Ok:
            if (response.remaining)
            {
                line += ' ';
                line += std::to_string(*response.remaining);
            }
            break;
        case ResponseKind::Next:
            line += ' ';
            line += std::to_string(response.chunk_size);
            break;
        case ResponseKind::Error:
            line += ' ';
            line += wire_message(response.error, response.detail);
            break;
        }
        line += '\n';
        return line;
    }

    ServerResponse decode_response(std::string_view raw)
    {
        const auto line = strip_line_ending(raw);

        if (line.starts_with(kErrorPrefix))
        {
            return decode_error(line.substr(kErrorPrefix.size()));
        }

        const auto tokens = split_tokens(line);
        if (!tokens.empty() && tokens[0] == "OK")
        {
            if (tokens.size() == 1)
            {
                return make_ok();
            }
            if (tokens.size() == 2)
            {
                if (const auto remaining = parse_u64(tokens[1]))
                {
                    return make_ok(*remaining);
                }
            }
        }
        else if (tokens.size() == 2 && tokens[0] == "NEXT")
        {
            if (const auto chunk = parse_u64(tokens[1]))
            {
                return make_next(*chunk);
            }
        }

        return make_error(ErrorKind::Other, std::string(line));
    }

} // namespace remcp::protocol
