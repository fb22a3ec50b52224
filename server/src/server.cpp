#include "remcp/server/server.hpp"

#include <asio/error.hpp>
#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>

#include <csignal>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "remcp/protocol.hpp"
#include "remcp/server/session.hpp"

namespace remcp::server
{

    Server::Server(ServerConfig config, SleepFunction sleep)
        : config_(std::move(config)),
          io_context_(1),
          acceptor_(io_context_),
          signals_(io_context_),
          gate_(registry_, config_.max_clients),
          rate_(registry_, config_.transfer_rate),
          sleep_(std::move(sleep))
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {} (max clients {}, rate {} B/s)", config_.address, port(),
                     config_.root.string(), config_.max_clients, config_.transfer_rate);

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        io_context_.run();

        session_manager_.stop_all();
        session_manager_.wait_idle();
        spdlog::info("All connections closed");
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::uint16_t Server::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
            return;
        }

        if (auto slot = gate_.try_admit())
        {
            spawn_worker(std::move(socket), std::move(*slot));
            spdlog::info("Client admitted. Active clients: {}", registry_.active());
        }
        else
        {
            reject_busy(std::move(socket));
        }
        accept_next();
    }

    void Server::reject_busy(asio::ip::tcp::socket socket)
    {
        spdlog::warn("Maximum clients ({}) reached. Rejecting new connection.", gate_.max_clients());
        const auto line = remcp::protocol::encode_response(remcp::protocol::make_error(remcp::ErrorKind::ServerBusy));
        std::error_code ec;
        asio::write(socket, asio::buffer(line), ec);
        if (ec)
        {
            spdlog::debug("Could not deliver busy response: {}", ec.message());
        }
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    void Server::spawn_worker(asio::ip::tcp::socket socket, ClientSlot slot)
    {
        auto session = std::make_shared<Session>(std::move(socket), std::move(slot),
                                                 ServerServices{rate_, config_.root, sleep_});
        session_manager_.add(session);
        try
        {
            std::thread([manager = &session_manager_, session]() mutable
                        {
                session->run();
                const auto *key = session.get();
                // Release the slot before the manager reports idle.
                session.reset();
                manager->remove(key); })
                .detach();
        }
        catch (const std::system_error &ex)
        {
            spdlog::error("Could not start connection worker: {}", ex.what());
            session_manager_.remove(session.get());
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
        spdlog::info("Shutting down, waiting for {} active connection(s)", registry_.active());
    }

} // namespace remcp::server
