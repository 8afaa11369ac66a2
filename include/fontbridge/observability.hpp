#pragma once

// fontbridge/observability.hpp — Per-execution events and aggregated stats.
//
// BridgeEvent is the observable unit: ExecutionBridge::execute() emits exactly
// one per call, after the gate slot is released and the work area is gone.
// Events carry digests and sizes only, never script text or host output.
//
// Sinks:
//   - BridgeStats (always): atomic counters plus a latency histogram, exposed
//     by `fontbridge doctor` and the fontbridge://server/stats resource.
//   - JSONL file (optional): one line per event when FONTBRIDGE_EVENT_LOG is
//     set.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "fontbridge/jsonlite.hpp"
#include "fontbridge/types.hpp"

namespace fontbridge {

struct BridgeEvent {
  std::string execution_id;
  std::string operation;         // tool/resource name, or "exec"
  bool ok{false};
  std::string error_code;
  std::string final_state;
  int exit_code{0};
  uint64_t queue_wait_ns{0};
  uint64_t run_ns{0};
  uint64_t total_ns{0};
  size_t script_bytes{0};
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};
  bool used_fallback{false};     // host wrote no output file
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
public:
  static constexpr size_t kBuckets = 40;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// BridgeStats — aggregated counters. Thread-safe.
// ---------------------------------------------------------------------------
class BridgeStats {
public:
  void record_execution(const BridgeEvent &ev);
  void record_validation_rejection();
  void record_request_too_large();

  jsonlite::Value to_value() const;
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> executions{0};
  alignas(64) std::atomic<uint64_t> successes{0};
  alignas(64) std::atomic<uint64_t> failures{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> host_failures{0};
  std::atomic<uint64_t> malformed_results{0};
  std::atomic<uint64_t> spawn_failures{0};
  std::atomic<uint64_t> work_area_failures{0};
  std::atomic<uint64_t> leaked_processes{0};
  std::atomic<uint64_t> fallback_results{0};
  std::atomic<uint64_t> validation_rejections{0};
  std::atomic<uint64_t> oversized_requests{0};
  std::atomic<uint64_t> queue_wait_ns_total{0};

  LatencyHistogram run_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<BridgeEvent> recent_events_snapshot() const;

private:
  mutable std::mutex ring_mu_;
  std::vector<BridgeEvent> ring_buffer_;
  size_t ring_head_{0};
};

// Records into stats and, when FONTBRIDGE_EVENT_LOG is set, appends one JSON
// line to that file. Never throws.
void emit_bridge_event(BridgeStats &stats, const BridgeEvent &ev);

jsonlite::Value event_to_value(const BridgeEvent &ev);

} // namespace fontbridge
