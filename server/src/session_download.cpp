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

    void Session::handle_get(const remcp::protocol::TransferRequest &request)
    {
        const auto path = resolve(request.path);
        spdlog::debug("GET {} from {} at offset {}", path.string(), peer_, request.offset);

        std::error_code ec;
        if (std::filesystem::is_directory(path, ec))
        {
            send_error(remcp::ErrorKind::FileError, "Is a directory");
            return;
        }
        const auto file_size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            spdlog::warn("GET {} failed for {}: {}", path.string(), peer_, ec.message());
            send_error(remcp::ErrorKind::FileError, ec.message());
            return;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            const std::error_code open_error(errno, std::generic_category());
            spdlog::warn("GET {} failed for {}: {}", path.string(), peer_, open_error.message());
            send_error(remcp::ErrorKind::FileError, open_error.message());
            return;
        }

        if (request.offset >= file_size)
        {
            spdlog::debug("Offset {} is at or past the end of {} ({} bytes)", request.offset, path.string(), file_size);
            send_response(remcp::protocol::make_ok(0));
            return;
        }

        file.seekg(static_cast<std::streamoff>(request.offset));
        const std::uint64_t remaining = file_size - request.offset;
        send_response(remcp::protocol::make_ok(remaining));

        std::vector<std::byte> buffer;
        std::uint64_t sent = 0;
        while (sent < remaining)
        {
            const auto chunk_size = services_.rate.chunk_size();
            send_response(remcp::protocol::make_next(chunk_size));

            const auto to_read = static_cast<std::size_t>(std::min(chunk_size, remaining - sent));
            buffer.resize(to_read);
            file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(to_read));
            const auto read_count = static_cast<std::size_t>(file.gcount());

            if (read_count > 0)
            {
                channel_.write_bytes(std::span<const std::byte>(buffer.data(), read_count));
                sent += read_count;
            }
            spdlog::debug("GET {}: sent {} bytes, {} / {}", path.string(), read_count, sent, remaining);

            if (read_count < to_read)
            {
                spdlog::warn("{} shrank during GET from {}: sent {} of {} bytes", path.string(), peer_, sent,
                             remaining);
                return;
            }
            services_.sleep(services_.rate.delay(read_count));
        }

        spdlog::info("GET {} complete for {} ({} bytes from offset {})", path.string(), peer_, sent, request.offset);
    }

} // namespace remcp::server
