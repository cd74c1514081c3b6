#pragma once

#include <cstddef>
#include <mutex>
#include <optional>

namespace authrelay::service {

// Bounded semaphore in front of the orchestrator. Holding a Ticket means
// holding one of the capacity() slots.
class AdmissionGate {
public:
    class Ticket {
    public:
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        ~Ticket();

    private:
        friend class AdmissionGate;
        explicit Ticket(AdmissionGate* gate) noexcept : gate_(gate) {}
        void release() noexcept;

        AdmissionGate* gate_;
    };

    explicit AdmissionGate(std::size_t capacity);

    std::optional<Ticket> tryEnter();

    [[nodiscard]] std::size_t inFlight() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void leave() noexcept;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::size_t inFlight_{0};
};

} // namespace authrelay::service
