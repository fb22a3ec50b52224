#include "remcp/server/session.hpp"

#include <asio/error.hpp>

#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace remcp::server
{

    Session::Session(asio::ip::tcp::socket socket, ClientSlot slot, ServerServices services)
        : socket_(std::move(socket)),
          channel_(socket_),
          slot_(std::move(slot)),
          services_(std::move(services)),
          peer_(remote_endpoint()) {}

    Session::~Session()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void Session::run()
    {
        spdlog::info("Client connected from {}", peer_);
        try
        {
            std::optional<std::string> line;
            try
            {
                line = channel_.read_line();
            }
            catch (const std::system_error &ex)
            {
                if (ex.code() != asio::error::not_found)
                {
                    throw;
                }
                spdlog::warn("Command line from {} exceeds {} bytes", peer_, remcp::protocol::kMaxLineLength);
                send_error(remcp::ErrorKind::InvalidCommand);
                return;
            }

            if (!line)
            {
                spdlog::debug("No command received from {}", peer_);
                send_error(remcp::ErrorKind::InvalidCommand);
                return;
            }
            spdlog::debug("{} -> {}", peer_, *line);

            remcp::ErrorKind error{};
            const auto request = remcp::protocol::decode_request(*line, error);
            if (!request)
            {
                spdlog::warn("Rejecting command from {}: {}", peer_, remcp::wire_message(error, {}));
                send_error(error);
                return;
            }
            dispatch(*request);
        }
        catch (const std::system_error &ex)
        {
            spdlog::warn("Connection {} failed: {}", peer_, ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unexpected failure while serving {}: {}", peer_, ex.what());
        }
        spdlog::info("Finished handling client {}", peer_);
    }

    void Session::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }

    void Session::dispatch(const remcp::protocol::TransferRequest &request)
    {
        switch (request.command)
        {
        case remcp::protocol::Command::Get:
            handle_get(request);
            break;
        case remcp::protocol::Command::Put:
            handle_put(request);
            break;
        }
    }

    void Session::send_response(const remcp::protocol::ServerResponse &response)
    {
        channel_.write_line(remcp::protocol::encode_response(response));
    }

    void Session::send_error(remcp::ErrorKind kind, std::string detail)
    {
        const auto response = remcp::protocol::make_error(kind, std::move(detail));
        spdlog::debug("{} <- ERR {}", peer_, remcp::wire_message(response.error, response.detail));
        try
        {
            send_response(response);
        }
        catch (const std::system_error &ex)
        {
            spdlog::debug("Could not deliver error to {}: {}", peer_, ex.what());
        }
    }

    std::filesystem::path Session::resolve(const std::string &requested) const
    {
        std::filesystem::path path(requested);
        if (path.is_relative() && !services_.root.empty())
        {
            path = services_.root / path;
        }
        return path.lexically_normal();
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace remcp::server
