#include "fontbridge/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace fontbridge {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0)
    return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

uint64_t load(const std::atomic<uint64_t> &a) {
  return a.load(std::memory_order_relaxed);
}

} // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count();
  if (n == 0)
    return 0.0;
  return static_cast<double>(sum_us()) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count();
  if (n == 0)
    return 0.0;
  uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  if (target == 0)
    target = 1;
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// BridgeStats
// ---------------------------------------------------------------------------

void BridgeStats::record_execution(const BridgeEvent &ev) {
  executions.fetch_add(1, std::memory_order_relaxed);
  (ev.ok ? successes : failures).fetch_add(1, std::memory_order_relaxed);
  if (ev.error_code == "timeout")
    timeouts.fetch_add(1, std::memory_order_relaxed);
  else if (ev.error_code == "host_execution_failed")
    host_failures.fetch_add(1, std::memory_order_relaxed);
  else if (ev.error_code == "malformed_result")
    malformed_results.fetch_add(1, std::memory_order_relaxed);
  else if (ev.error_code == "spawn_failed")
    spawn_failures.fetch_add(1, std::memory_order_relaxed);
  else if (ev.error_code == "work_area_failed")
    work_area_failures.fetch_add(1, std::memory_order_relaxed);
  if (ev.final_state == "leaked")
    leaked_processes.fetch_add(1, std::memory_order_relaxed);
  if (ev.used_fallback)
    fallback_results.fetch_add(1, std::memory_order_relaxed);
  queue_wait_ns_total.fetch_add(ev.queue_wait_ns, std::memory_order_relaxed);
  run_latency.record(ev.run_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

void BridgeStats::record_validation_rejection() {
  validation_rejections.fetch_add(1, std::memory_order_relaxed);
}

void BridgeStats::record_request_too_large() {
  oversized_requests.fetch_add(1, std::memory_order_relaxed);
}

std::vector<BridgeEvent> BridgeStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents)
    return ring_buffer_;
  std::vector<BridgeEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i)
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  return out;
}

jsonlite::Value BridgeStats::to_value() const {
  jsonlite::Object o;
  o["executions"] = load(executions);
  o["successes"] = load(successes);
  o["failures"] = load(failures);
  o["timeouts"] = load(timeouts);
  o["host_failures"] = load(host_failures);
  o["malformed_results"] = load(malformed_results);
  o["spawn_failures"] = load(spawn_failures);
  o["work_area_failures"] = load(work_area_failures);
  o["leaked_processes"] = load(leaked_processes);
  o["fallback_results"] = load(fallback_results);
  o["validation_rejections"] = load(validation_rejections);
  o["oversized_requests"] = load(oversized_requests);
  const uint64_t n = load(executions);
  o["avg_queue_wait_ms"] =
      n > 0 ? static_cast<double>(load(queue_wait_ns_total)) / 1e6 /
                  static_cast<double>(n)
            : 0.0;
  std::optional<jsonlite::JsonError> err;
  o["run_latency"] = jsonlite::parse_value(run_latency.to_json(), &err);
  return jsonlite::Value{std::move(o)};
}

std::string BridgeStats::to_json() const { return jsonlite::to_json(to_value()); }

jsonlite::Value event_to_value(const BridgeEvent &ev) {
  jsonlite::Object o;
  o["execution_id"] = ev.execution_id;
  o["operation"] = ev.operation;
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["final_state"] = ev.final_state;
  o["exit_code"] = ev.exit_code;
  o["queue_wait_ns"] = ev.queue_wait_ns;
  o["run_ns"] = ev.run_ns;
  o["total_ns"] = ev.total_ns;
  o["script_bytes"] = ev.script_bytes;
  o["bytes_stdout"] = ev.bytes_stdout;
  o["bytes_stderr"] = ev.bytes_stderr;
  o["used_fallback"] = ev.used_fallback;
  return jsonlite::Value{std::move(o)};
}

void emit_bridge_event(BridgeStats &stats, const BridgeEvent &ev) {
  stats.record_execution(ev);

  const char *log_path = std::getenv("FONTBRIDGE_EVENT_LOG");
  if (!log_path || !log_path[0])
    return;
  std::string line = jsonlite::to_json(event_to_value(ev));
  line += '\n';
  // O_APPEND writes under PIPE_BUF do not interleave.
  if (FILE *f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

} // namespace fontbridge
