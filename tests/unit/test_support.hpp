#pragma once

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace remcp::test
{

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / name)
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Connects `client` to `server` over loopback.
    inline void connect_pair(asio::io_context &io_context, asio::ip::tcp::socket &client,
                             asio::ip::tcp::socket &server)
    {
        asio::ip::tcp::acceptor acceptor(io_context,
                                         asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        client.connect(acceptor.local_endpoint());
        acceptor.accept(server);
    }

    // Reads everything until the peer closes.
    inline std::string read_all(asio::ip::tcp::socket &socket)
    {
        std::string data;
        char chunk[1024];
        for (;;)
        {
            std::error_code ec;
            const auto count = socket.read_some(asio::buffer(chunk), ec);
            data.append(chunk, count);
            if (ec)
            {
                break;
            }
        }
        return data;
    }

} // namespace remcp::test
