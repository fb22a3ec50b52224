#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include "remcp/client/config.hpp"
#include "remcp/client/logger.hpp"
#include "remcp/client/retry.hpp"
#include "remcp/framing.hpp"
#include "remcp/protocol.hpp"
#include "remcp/timing.hpp"

namespace remcp::client
{

    struct TransferSummary
    {
        std::uint64_t offset{};
        std::uint64_t bytes_transferred{};
        std::size_t attempts{};
        bool nothing_to_do{false};
    };

    // Drives one GET or PUT against a remote server, resuming from the local
    // ".part" marker and retrying transient failures.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger, SleepFunction sleep = remcp::blocking_sleep);

        // Plans and performs the transfer named by the configuration. Returns
        // the process exit status.
        int run();

        // Throws remcp::TransferError once the retry policy gives up.
        TransferSummary transfer(const TransferPlan &plan);

    private:
        TransferSummary attempt(const TransferPlan &plan);
        TransferSummary perform_download(const TransferPlan &plan);
        TransferSummary perform_upload(const TransferPlan &plan);

        void connect(asio::ip::tcp::socket &socket, const std::string &host);
        remcp::protocol::ServerResponse expect_response(remcp::protocol::LineChannel &channel);

        RetryPolicy retry_policy() const;

        ClientConfig config_;
        Logger logger_;
        SleepFunction sleep_;
        asio::io_context io_context_;
    };

} // namespace remcp::client
