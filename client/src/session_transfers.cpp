#include "remcp/client/session.hpp"

#include <asio/error.hpp>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <span>
#include <string_view>
#include <vector>

#include "remcp/error_codes.hpp"
#include "remcp/resume.hpp"

namespace remcp::client
{

    namespace
    {

        TransferError protocol_violation(std::string_view expected, const remcp::protocol::ServerResponse &got)
        {
            auto line = remcp::protocol::encode_response(got);
            line.pop_back();
            return TransferError(ErrorKind::Other,
                                 "Protocol violation: expected " + std::string(expected) + ", got " + line);
        }

        TransferError connection_lost(std::uint64_t done, std::uint64_t expected, std::error_code ec)
        {
            if (!ec)
            {
                ec = asio::error::eof;
            }
            return TransferError(ErrorKind::Other,
                                 "Connection lost after " + std::to_string(done) + " of " + std::to_string(expected) +
                                     " bytes: " + ec.message(),
                                 ec);
        }

        TransferError file_error(const std::string &what, const std::filesystem::path &path)
        {
            const std::error_code ec(errno, std::generic_category());
            return TransferError(ErrorKind::FileError, what + " " + path.string() + ": " + ec.message(), ec);
        }

    } // namespace

    TransferSummary ClientSession::perform_download(const TransferPlan &plan)
    {
        const auto &target = plan.local_path;
        const auto parent = target.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }

        const auto resume_point = remcp::resume::locate(target);
        if (resume_point.offset > 0)
        {
            logger_.log("info", "resuming download of ", target.string(), " at byte ", resume_point.offset);
        }

        asio::ip::tcp::socket socket(io_context_);
        connect(socket, plan.remote.host);
        remcp::protocol::LineChannel channel(socket);

        const remcp::protocol::TransferRequest request{
            .command = remcp::protocol::Command::Get,
            .path = plan.remote.path,
            .offset = resume_point.offset,
        };
        channel.write_line(remcp::protocol::encode_request(request));
        logger_.debug("send", remcp::protocol::encode_request(request));

        const auto first = expect_response(channel);
        if (first.kind != remcp::protocol::ResponseKind::Ok || !first.remaining)
        {
            throw protocol_violation("OK <remaining>", first);
        }

        TransferSummary summary;
        summary.offset = resume_point.offset;

        const auto remaining = *first.remaining;
        if (remaining == 0)
        {
            summary.nothing_to_do = true;
            if (std::filesystem::exists(resume_point.partial_path))
            {
                remcp::resume::finalize(resume_point.partial_path, target);
            }
            else
            {
                std::ofstream empty(target, std::ios::binary | std::ios::trunc);
                if (!empty.is_open())
                {
                    throw file_error("Cannot create", target);
                }
            }
            logger_.log("info", "server has nothing past byte ", resume_point.offset, " for ", plan.remote.path);
            return summary;
        }

        std::ofstream out(resume_point.partial_path, std::ios::binary | std::ios::app);
        if (!out.is_open())
        {
            throw file_error("Cannot open", resume_point.partial_path);
        }

        std::vector<std::byte> buffer;
        std::uint64_t received = 0;
        while (received < remaining)
        {
            const auto next = expect_response(channel);
            if (next.kind != remcp::protocol::ResponseKind::Next || next.chunk_size == 0)
            {
                throw protocol_violation("NEXT <n>", next);
            }

            const auto wanted = static_cast<std::size_t>(std::min(next.chunk_size, remaining - received));
            buffer.resize(wanted);
            std::error_code read_error;
            const auto count = channel.read_up_to(std::span<std::byte>(buffer.data(), wanted), read_error);

            if (count > 0)
            {
                out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(count));
                out.flush();
                if (!out)
                {
                    throw file_error("Cannot write", resume_point.partial_path);
                }
                received += count;
            }
            if (count < wanted)
            {
                throw connection_lost(resume_point.offset + received, resume_point.offset + remaining, read_error);
            }
        }
        out.close();

        remcp::resume::finalize(resume_point.partial_path, target);
        summary.bytes_transferred = received;
        logger_.log("info", "downloaded ", received, " bytes into ", target.string());
        return summary;
    }

    TransferSummary ClientSession::perform_upload(const TransferPlan &plan)
    {
        const auto &source = plan.local_path;
        if (!std::filesystem::is_regular_file(source))
        {
            throw TransferError(ErrorKind::FileError, "Not a regular file: " + source.string());
        }
        const auto total = std::filesystem::file_size(source);

        auto resume_point = remcp::resume::locate(source);
        if (resume_point.offset > total)
        {
            logger_.log("warn", "marker ", resume_point.partial_path.string(), " is longer than ", source.string(),
                        ", restarting upload");
            remcp::resume::discard(resume_point.partial_path);
            resume_point.offset = 0;
        }
        else if (resume_point.offset > 0)
        {
            logger_.log("info", "resuming upload of ", source.string(), " at byte ", resume_point.offset);
        }

        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            throw file_error("Cannot open", source);
        }
        in.seekg(static_cast<std::streamoff>(resume_point.offset));

        asio::ip::tcp::socket socket(io_context_);
        connect(socket, plan.remote.host);
        remcp::protocol::LineChannel channel(socket);

        const remcp::protocol::TransferRequest request{
            .command = remcp::protocol::Command::Put,
            .path = plan.remote.path,
            .offset = resume_point.offset,
            .total_size = total,
        };
        channel.write_line(remcp::protocol::encode_request(request));
        logger_.debug("send", remcp::protocol::encode_request(request));

        const auto first = expect_response(channel);
        if (first.kind != remcp::protocol::ResponseKind::Ok || first.remaining)
        {
            throw protocol_violation("OK", first);
        }

        std::ofstream marker(resume_point.partial_path, std::ios::binary | std::ios::app);
        if (!marker.is_open())
        {
            throw file_error("Cannot open", resume_point.partial_path);
        }

        TransferSummary summary;
        summary.offset = resume_point.offset;
        summary.nothing_to_do = resume_point.offset == total;

        std::vector<char> buffer;
        std::uint64_t sent = resume_point.offset;
        while (sent < total)
        {
            const auto next = expect_response(channel);
            if (next.kind == remcp::protocol::ResponseKind::Ok)
            {
                break;
            }
            if (next.kind != remcp::protocol::ResponseKind::Next || next.chunk_size == 0)
            {
                throw protocol_violation("NEXT <n>", next);
            }

            const auto wanted = static_cast<std::size_t>(std::min(next.chunk_size, total - sent));
            buffer.resize(wanted);
            in.read(buffer.data(), static_cast<std::streamsize>(wanted));
            const auto count = static_cast<std::size_t>(in.gcount());
            if (count == 0)
            {
                break;
            }

            channel.write_bytes(std::as_bytes(std::span<const char>(buffer.data(), count)));
            marker.write(buffer.data(), static_cast<std::streamsize>(count));
            marker.flush();
            if (!marker)
            {
                throw file_error("Cannot write", resume_point.partial_path);
            }
            sent += count;
            if (count < wanted)
            {
                break;
            }
        }
        marker.close();

        if (sent != total)
        {
            throw TransferError(ErrorKind::Other, "Upload incomplete: sent " + std::to_string(sent) + " of " +
                                                      std::to_string(total) + " bytes");
        }

        remcp::resume::discard(resume_point.partial_path);
        summary.bytes_transferred = sent - resume_point.offset;
        logger_.log("info", "uploaded ", summary.bytes_transferred, " bytes of ", source.string());
        return summary;
    }

} // namespace remcp::client
