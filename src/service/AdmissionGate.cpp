#include "authrelay/service/AdmissionGate.hpp"

#include <algorithm>
#include <utility>

namespace authrelay::service {

AdmissionGate::Ticket::Ticket(Ticket&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)) {}

AdmissionGate::Ticket& AdmissionGate::Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
    }
    return *this;
}

AdmissionGate::Ticket::~Ticket() {
    release();
}

void AdmissionGate::Ticket::release() noexcept {
    if (gate_) {
        gate_->leave();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

std::optional<AdmissionGate::Ticket> AdmissionGate::tryEnter() {
    std::scoped_lock lock(mutex_);
    if (inFlight_ >= capacity_) {
        return std::nullopt;
    }
    ++inFlight_;
    return Ticket{this};
}

std::size_t AdmissionGate::inFlight() const {
    std::scoped_lock lock(mutex_);
    return inFlight_;
}

void AdmissionGate::leave() noexcept {
    std::scoped_lock lock(mutex_);
    if (inFlight_ > 0) {
        --inFlight_;
    }
}

} // namespace authrelay::service
