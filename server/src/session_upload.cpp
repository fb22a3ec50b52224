#include "remcp/server/session.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

namespace remcp::server
{

    void Session::handle_put(const remcp::protocol::TransferRequest &request)
    {
        const auto path = resolve(request.path);
        spdlog::debug("PUT {} from {} at offset {} of {}", path.string(), peer_, request.offset, request.total_size);

        std::error_code ec;
        const auto parent = path.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent, ec))
        {
            spdlog::debug("Creating directory {}", parent.string());
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                spdlog::warn("PUT {} failed for {}: {}", path.string(), peer_, ec.message());
                send_error(remcp::ErrorKind::FileError, ec.message());
                return;
            }
        }

        const bool fresh = request.offset == 0 || !std::filesystem::exists(path, ec);
        std::fstream file;
        if (fresh)
        {
            file.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
        }
        else
        {
            file.open(path, std::ios::binary | std::ios::in | std::ios::out);
        }
        if (!file.is_open())
        {
            const std::error_code open_error(errno, std::generic_category());
            spdlog::warn("PUT {} failed for {}: {}", path.string(), peer_, open_error.message());
            send_error(remcp::ErrorKind::FileError, open_error.message());
            return;
        }
        file.seekp(static_cast<std::streamoff>(request.offset));

        send_response(remcp::protocol::make_ok());
        spdlog::debug("Acknowledged PUT {}; ready to receive", path.string());

        std::vector<std::byte> buffer;
        std::uint64_t received = request.offset;
        while (received < request.total_size)
        {
            const auto chunk_size = services_.rate.chunk_size();
            send_response(remcp::protocol::make_next(chunk_size));

            const auto to_read = static_cast<std::size_t>(std::min(chunk_size, request.total_size - received));
            buffer.resize(to_read);
            std::error_code read_error;
            const auto read_count = channel_.read_up_to(std::span<std::byte>(buffer.data(), to_read), read_error);

            if (read_count > 0)
            {
                file.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(read_count));
                file.flush();
                if (!file)
                {
                    spdlog::error("Writing {} failed after {} bytes", path.string(), received);
                    send_error(remcp::ErrorKind::FileError, "Write failed");
                    return;
                }
                received += read_count;
            }
            spdlog::debug("PUT {}: received {} bytes, {} / {}", path.string(), read_count, received,
                          request.total_size);

            if (read_count < to_read)
            {
                if (read_error)
                {
                    spdlog::warn("Connection {} failed during PUT: {}", peer_, read_error.message());
                }
                break;
            }
            services_.sleep(services_.rate.delay(read_count));
        }
        file.close();

        if (received != request.total_size)
        {
            spdlog::warn("Upload incomplete for {}: received {} of {} bytes", path.string(), received,
                         request.total_size);
            return;
        }

        // A resumed upload may land on a longer stale file.
        const auto final_size = std::filesystem::file_size(path, ec);
        if (!ec && final_size > request.total_size)
        {
            std::filesystem::resize_file(path, request.total_size, ec);
            if (ec)
            {
                spdlog::warn("Could not trim {} to {} bytes: {}", path.string(), request.total_size, ec.message());
            }
        }
        spdlog::info("PUT {} complete for {} ({} bytes)", path.string(), peer_, request.total_size);
    }

} // namespace remcp::server
