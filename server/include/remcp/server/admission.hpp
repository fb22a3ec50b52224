#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace remcp::server
{

    // Process-wide count of connected clients. Owned by the server and shared
    // by reference with the admission gate and the rate controller.
    class ActiveClientRegistry
    {
    public:
        std::size_t active() const noexcept;

        // Increments the count unless it already reached `limit`.
        bool try_acquire(std::size_t limit) noexcept;

        // Never drops below zero.
        void release() noexcept;

    private:
        std::atomic<std::size_t> count_{0};
    };

    // Holds one unit of the registry for the lifetime of a connection.
    class ClientSlot
    {
    public:
        explicit ClientSlot(ActiveClientRegistry &registry) noexcept;
        ClientSlot(ClientSlot &&other) noexcept;
        ClientSlot &operator=(ClientSlot &&other) noexcept;
        ClientSlot(const ClientSlot &) = delete;
        ClientSlot &operator=(const ClientSlot &) = delete;
        ~ClientSlot();

    private:
        void reset() noexcept;

        ActiveClientRegistry *registry_;
    };

    class AdmissionGate
    {
    public:
        AdmissionGate(ActiveClientRegistry &registry, std::size_t max_clients);

        std::optional<ClientSlot> try_admit();

        std::size_t max_clients() const noexcept { return max_clients_; }

    private:
        ActiveClientRegistry &registry_;
        std::size_t max_clients_;
    };

} // namespace remcp::server
