#pragma once

// fontbridge/concurrency_gate.hpp — Counting gate that caps concurrent host
// processes.
//
// Owned by one ExecutionBridge; capacity fixed at construction. Waiters are
// admitted strictly in arrival order (ticket queue), so a call that arrives
// while the gate is full is queued, never rejected and never run over capacity.
//
// THREAD SAFETY: all members may be called concurrently.

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace fontbridge {

class ConcurrencyGate;

// RAII slot. Releases on destruction, including during stack unwinding.
class GateSlot {
public:
  GateSlot(GateSlot &&other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
  GateSlot &operator=(GateSlot &&other) noexcept;
  GateSlot(const GateSlot &) = delete;
  GateSlot &operator=(const GateSlot &) = delete;
  ~GateSlot();

  bool held() const { return gate_ != nullptr; }
  void release();

private:
  explicit GateSlot(ConcurrencyGate *gate) : gate_(gate) {}
  ConcurrencyGate *gate_;

  friend class ConcurrencyGate;
};

class ConcurrencyGate {
public:
  // Throws ConfigError when capacity is 0.
  explicit ConcurrencyGate(std::size_t capacity = 3);
  ConcurrencyGate(const ConcurrencyGate &) = delete;
  ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

  // Blocks until a slot is free and every earlier arrival has been admitted.
  GateSlot acquire();

  std::size_t capacity() const { return capacity_; }
  std::size_t in_flight() const;
  std::size_t waiting() const;
  std::size_t peak() const;
  uint64_t contention_count() const;   // acquisitions that had to wait
  uint64_t total_acquired() const;

private:
  void release_one();

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t in_flight_{0};
  std::size_t peak_{0};
  uint64_t next_ticket_{0};
  uint64_t now_serving_{0};
  uint64_t contention_{0};
  uint64_t acquired_{0};

  friend class GateSlot;
};

} // namespace fontbridge
