#pragma once

#include <asio/ip/tcp.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "remcp/error_codes.hpp"
#include "remcp/framing.hpp"
#include "remcp/protocol.hpp"
#include "remcp/server/admission.hpp"
#include "remcp/server/rate_controller.hpp"
#include "remcp/timing.hpp"

namespace remcp::server
{

    struct ServerServices
    {
        const RateController &rate;
        std::filesystem::path root;
        SleepFunction sleep;
    };

    // One accepted connection. run() blocks the calling worker thread for the
    // whole request: it reads a single command line and drives GET or PUT to
    // completion.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ClientSlot slot, ServerServices services);
        ~Session();

        void run();

        // Safe to call from another thread; unblocks pending socket I/O.
        void stop();

    private:
        void dispatch(const remcp::protocol::TransferRequest &request);
        void handle_get(const remcp::protocol::TransferRequest &request);
        void handle_put(const remcp::protocol::TransferRequest &request);

        void send_response(const remcp::protocol::ServerResponse &response);
        void send_error(remcp::ErrorKind kind, std::string detail = {});

        std::filesystem::path resolve(const std::string &requested) const;
        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        remcp::protocol::LineChannel channel_;
        ClientSlot slot_;
        ServerServices services_;
        std::string peer_;
    };

} // namespace remcp::server
