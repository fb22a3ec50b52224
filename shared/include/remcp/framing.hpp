/**
 * remcp - Newline-framed control lines interleaved with raw payload bytes.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

namespace remcp::protocol
{

    constexpr std::size_t kMaxLineLength = 4096;

    // Blocking reader/writer over a connected socket. Bytes that arrive after a
    // control line are kept in the internal buffer and handed out by
    // read_up_to() before touching the socket again.
    class LineChannel
    {
    public:
        explicit LineChannel(asio::ip::tcp::socket &socket);

        // std::nullopt on orderly shutdown with nothing buffered. Throws
        // std::system_error on transport errors, asio::error::not_found when a
        // line exceeds kMaxLineLength.
        std::optional<std::string> read_line();

        // Reads until `out` is full or the stream ends. A short count with a
        // set `ec` means the transport failed, a short count with a clear `ec`
        // means the peer closed.
        std::size_t read_up_to(std::span<std::byte> out, std::error_code &ec);

        void write_line(std::string_view line);
        void write_bytes(std::span<const std::byte> data);

    private:
        asio::ip::tcp::socket &socket_;
        asio::streambuf buffer_;
    };

} // namespace remcp::protocol
