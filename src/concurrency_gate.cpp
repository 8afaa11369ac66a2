#include "fontbridge/concurrency_gate.hpp"

#include <algorithm>

#include "fontbridge/types.hpp"

namespace fontbridge {

GateSlot &GateSlot::operator=(GateSlot &&other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    other.gate_ = nullptr;
  }
  return *this;
}

GateSlot::~GateSlot() { release(); }

void GateSlot::release() {
  if (gate_) {
    gate_->release_one();
    gate_ = nullptr;
  }
}

ConcurrencyGate::ConcurrencyGate(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0)
    throw ConfigError("concurrency gate capacity must be at least 1");
}

GateSlot ConcurrencyGate::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  const uint64_t ticket = next_ticket_++;
  if (ticket != now_serving_ || in_flight_ >= capacity_)
    ++contention_;
  cv_.wait(lk, [&] { return ticket == now_serving_ && in_flight_ < capacity_; });
  ++now_serving_;
  ++in_flight_;
  ++acquired_;
  peak_ = std::max(peak_, in_flight_);
  lk.unlock();
  // The next ticket may also fit under the cap.
  cv_.notify_all();
  return GateSlot(this);
}

void ConcurrencyGate::release_one() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    --in_flight_;
  }
  cv_.notify_all();
}

std::size_t ConcurrencyGate::in_flight() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_flight_;
}

std::size_t ConcurrencyGate::waiting() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::size_t>(next_ticket_ - now_serving_);
}

std::size_t ConcurrencyGate::peak() const {
  std::lock_guard<std::mutex> lk(mu_);
  return peak_;
}

uint64_t ConcurrencyGate::contention_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return contention_;
}

uint64_t ConcurrencyGate::total_acquired() const {
  std::lock_guard<std::mutex> lk(mu_);
  return acquired_;
}

} // namespace fontbridge
