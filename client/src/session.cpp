#include "remcp/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/error.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "remcp/error_codes.hpp"

namespace remcp::client
{

    namespace
    {

        std::string describe(const TransferPlan &plan)
        {
            const auto remote = plan.remote.host + ":" + plan.remote.path;
            if (plan.direction == Direction::Download)
            {
                return remote + " -> " + plan.local_path.string();
            }
            return plan.local_path.string() + " -> " + remote;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger, SleepFunction sleep)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          sleep_(std::move(sleep)) {}

    int ClientSession::run()
    {
        TransferPlan plan;
        try
        {
            plan = plan_transfer(config_);
        }
        catch (const std::invalid_argument &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "usage: ", ex.what());
            return 1;
        }

        logger_.log("info", "transfer ", describe(plan));
        try
        {
            const auto summary = transfer(plan);
            if (summary.nothing_to_do)
            {
                std::cout << "Nothing to transfer, " << plan.local_path.string() << " is up to date" << std::endl;
            }
            else if (summary.offset > 0)
            {
                std::cout << "Resumed at byte " << summary.offset << ", transferred " << summary.bytes_transferred
                          << " bytes" << std::endl;
            }
            else
            {
                std::cout << "Transferred " << summary.bytes_transferred << " bytes" << std::endl;
            }
            logger_.log("info", "done after ", summary.attempts, " attempt(s), ", summary.bytes_transferred,
                        " bytes from offset ", summary.offset);
            return 0;
        }
        catch (const TransferError &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", to_string(ex.kind()), ": ", ex.what());
            return 1;
        }
    }

    TransferSummary ClientSession::transfer(const TransferPlan &plan)
    {
        return attempt_with_retry(
            retry_policy(), sleep_,
            [&](std::size_t attempt_number)
            {
                logger_.debug("attempt", attempt_number, " of ", config_.max_attempts);
                auto summary = attempt(plan);
                summary.attempts = attempt_number;
                return summary;
            },
            [&](std::size_t attempt_number, const TransferError &error)
            {
                std::cerr << "Attempt " << attempt_number << " failed: " << error.what() << ", retrying in "
                          << config_.retry_delay.count() << " ms" << std::endl;
                logger_.log("retry", "attempt ", attempt_number, " failed: ", error.what());
            });
    }

    // Normalizes everything an attempt can throw into TransferError so the
    // retry policy sees a single type.
    TransferSummary ClientSession::attempt(const TransferPlan &plan)
    {
        try
        {
            return plan.direction == Direction::Download ? perform_download(plan) : perform_upload(plan);
        }
        catch (const TransferError &)
        {
            throw;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw TransferError(ErrorKind::FileError, ex.what(), ex.code());
        }
        catch (const std::system_error &ex)
        {
            throw TransferError(ErrorKind::Other, ex.what(), ex.code());
        }
    }

    void ClientSession::connect(asio::ip::tcp::socket &socket, const std::string &host)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(config_.port));
        asio::connect(socket, results);
        logger_.log("info", "connected to ", host, ':', config_.port);
    }

    remcp::protocol::ServerResponse ClientSession::expect_response(remcp::protocol::LineChannel &channel)
    {
        const auto line = channel.read_line();
        if (!line)
        {
            throw TransferError(ErrorKind::Other, "Connection closed by server",
                                asio::error::make_error_code(asio::error::eof));
        }
        logger_.debug("recv", *line);
        auto response = remcp::protocol::decode_response(*line);
        if (response.kind == remcp::protocol::ResponseKind::Error)
        {
            throw TransferError(response.error, "Server error: " + wire_message(response.error, response.detail));
        }
        return response;
    }

    RetryPolicy ClientSession::retry_policy() const
    {
        RetryPolicy policy;
        policy.max_attempts = config_.max_attempts;
        policy.backoff = config_.retry_delay;
        return policy;
    }

} // namespace remcp::client
