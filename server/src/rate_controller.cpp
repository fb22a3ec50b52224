#include "remcp/server/rate_controller.hpp"

#include <algorithm>

namespace remcp::server
{

    RateController::RateController(const ActiveClientRegistry &registry, std::uint64_t budget_bytes_per_second)
        : registry_(registry), budget_(budget_bytes_per_second) {}

    std::uint64_t RateController::per_client_rate() const noexcept
    {
        const auto active = std::max<std::uint64_t>(1, registry_.active());
        return std::max<std::uint64_t>(1, budget_ / active);
    }

    std::uint64_t RateController::chunk_size() const noexcept
    {
        return per_client_rate();
    }

    std::chrono::milliseconds RateController::delay(std::uint64_t bytes) const noexcept
    {
        const auto millis = (bytes * 1000) / per_client_rate();
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(millis));
    }

} // namespace remcp::server
