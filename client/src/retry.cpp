#include "remcp/client/retry.hpp"

#include <asio/error.hpp>

namespace remcp::client
{

    bool is_retryable(const TransferError &error) noexcept
    {
        if (error.kind() == ErrorKind::ServerBusy)
        {
            return true;
        }
        const auto &ec = error.transport_error();
        return ec == asio::error::connection_reset || ec == asio::error::timed_out;
    }

} // namespace remcp::client
