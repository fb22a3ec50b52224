#include "remcp/framing.hpp"

#include <algorithm>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

namespace remcp::protocol
{

    namespace
    {
        std::string take_buffered(asio::streambuf &buffer, std::size_t count)
        {
            const auto data = buffer.data();
            std::string text(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(count));
            buffer.consume(count);
            return text;
        }

        std::string strip_line_ending(std::string line)
        {
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            {
                line.pop_back();
            }
            return line;
        }
    } // namespace

    LineChannel::LineChannel(asio::ip::tcp::socket &socket)
        : socket_(socket), buffer_(kMaxLineLength) {}

    std::optional<std::string> LineChannel::read_line()
    {
        std::error_code ec;
        const auto length = asio::read_until(socket_, buffer_, '\n', ec);
        if (ec == asio::error::eof)
        {
            if (buffer_.size() == 0)
            {
                return std::nullopt;
            }
            // Unterminated last line.
            return strip_line_ending(take_buffered(buffer_, buffer_.size()));
        }
        if (ec)
        {
            throw std::system_error(ec);
        }
        return strip_line_ending(take_buffered(buffer_, length));
    }

    std::size_t LineChannel::read_up_to(std::span<std::byte> out, std::error_code &ec)
    {
        ec.clear();
        std::size_t filled = 0;

        const auto buffered = std::min(buffer_.size(), out.size());
        if (buffered > 0)
        {
            asio::buffer_copy(asio::buffer(out.data(), buffered), buffer_.data());
            buffer_.consume(buffered);
            filled = buffered;
        }

        if (filled < out.size())
        {
            filled += asio::read(socket_, asio::buffer(out.data() + filled, out.size() - filled), ec);
            if (ec == asio::error::eof)
            {
                ec.clear();
            }
        }
        return filled;
    }

    void LineChannel::write_line(std::string_view line)
    {
        if (!line.empty() && line.back() == '\n')
        {
            asio::write(socket_, asio::buffer(line.data(), line.size()));
            return;
        }
        std::string terminated(line);
        terminated.push_back('\n');
        asio::write(socket_, asio::buffer(terminated));
    }

    void LineChannel::write_bytes(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        asio::write(socket_, asio::buffer(data.data(), data.size()));
    }

} // namespace remcp::protocol
