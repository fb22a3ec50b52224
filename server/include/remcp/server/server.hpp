#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>

#include "remcp/server/admission.hpp"
#include "remcp/server/config.hpp"
#include "remcp/server/rate_controller.hpp"
#include "remcp/server/session_manager.hpp"
#include "remcp/timing.hpp"

namespace remcp::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config, SleepFunction sleep = remcp::blocking_sleep);

        // Accepts connections until shutdown() or SIGINT/SIGTERM, then waits for
        // every connection worker to finish.
        void run();

        // Thread-safe.
        void shutdown();

        // Actual listening port, useful when the configured port is 0.
        std::uint16_t port() const;

        const ActiveClientRegistry &registry() const noexcept { return registry_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void reject_busy(asio::ip::tcp::socket socket);
        void spawn_worker(asio::ip::tcp::socket socket, ClientSlot slot);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        ActiveClientRegistry registry_;
        AdmissionGate gate_;
        RateController rate_;
        SessionManager session_manager_;
        SleepFunction sleep_;
    };

} // namespace remcp::server
