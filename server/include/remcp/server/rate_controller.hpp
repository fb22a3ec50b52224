#pragma once

#include <chrono>
#include <cstdint>

#include "remcp/server/admission.hpp"

namespace remcp::server
{

    // Splits a nominal byte budget evenly between the currently connected
    // clients. Every query reads the live client count, so joins and departures
    // only affect chunks that have not been announced yet.
    class RateController
    {
    public:
        RateController(const ActiveClientRegistry &registry, std::uint64_t budget_bytes_per_second);

        std::uint64_t budget() const noexcept { return budget_; }

        // max(1, budget / max(1, active clients)), truncating.
        std::uint64_t per_client_rate() const noexcept;

        std::uint64_t chunk_size() const noexcept;

        // Pause after moving `bytes` so that the connection averages
        // per_client_rate() bytes per second.
        std::chrono::milliseconds delay(std::uint64_t bytes) const noexcept;

    private:
        const ActiveClientRegistry &registry_;
        std::uint64_t budget_;
    };

} // namespace remcp::server
