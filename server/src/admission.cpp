#include "remcp/server/admission.hpp"

#include <utility>

namespace remcp::server
{

    std::size_t ActiveClientRegistry::active() const noexcept
    {
        return count_.load(std::memory_order_acquire);
    }

    bool ActiveClientRegistry::try_acquire(std::size_t limit) noexcept
    {
        auto current = count_.load(std::memory_order_acquire);
        while (current < limit)
        {
            if (count_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel))
            {
                return true;
            }
        }
        return false;
    }

    void ActiveClientRegistry::release() noexcept
    {
        auto current = count_.load(std::memory_order_acquire);
        while (current > 0)
        {
            if (count_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel))
            {
                return;
            }
        }
    }

    ClientSlot::ClientSlot(ActiveClientRegistry &registry) noexcept
        : registry_(&registry) {}

    ClientSlot::ClientSlot(ClientSlot &&other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)) {}

    ClientSlot &ClientSlot::operator=(ClientSlot &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            registry_ = std::exchange(other.registry_, nullptr);
        }
        return *this;
    }

    ClientSlot::~ClientSlot()
    {
        reset();
    }

    void ClientSlot::reset() noexcept
    {
        if (registry_ != nullptr)
        {
            registry_->release();
            registry_ = nullptr;
        }
    }

    AdmissionGate::AdmissionGate(ActiveClientRegistry &registry, std::size_t max_clients)
        : registry_(registry), max_clients_(max_clients) {}

    std::optional<ClientSlot> AdmissionGate::try_admit()
    {
        if (!registry_.try_acquire(max_clients_))
        {
            return std::nullopt;
        }
        return ClientSlot(registry_);
    }

} // namespace remcp::server
