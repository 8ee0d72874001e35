#pragma once

#include <atomic>
#include <cstdint>

namespace autofile_core {
namespace async {

// Statistics snapshot for observability
struct WatcherStats {
  uint64_t events_seen = 0;
  uint64_t events_ignored = 0;
  uint64_t checks_scheduled = 0;
  uint64_t arrivals_dispatched = 0;
  uint64_t settle_timeouts = 0;
  uint64_t claim_conflicts = 0;
  uint64_t overflows = 0;
  uint64_t files_seeded = 0;
};

// Live counters, updated from the backend thread and the workers.
struct WatcherCounters {
  std::atomic<uint64_t> events_seen{0};
  std::atomic<uint64_t> events_ignored{0};
  std::atomic<uint64_t> checks_scheduled{0};
  std::atomic<uint64_t> arrivals_dispatched{0};
  std::atomic<uint64_t> settle_timeouts{0};
  std::atomic<uint64_t> claim_conflicts{0};
  std::atomic<uint64_t> overflows{0};
  std::atomic<uint64_t> files_seeded{0};

  WatcherStats snapshot() const {
    WatcherStats s;
    s.events_seen = events_seen.load();
    s.events_ignored = events_ignored.load();
    s.checks_scheduled = checks_scheduled.load();
    s.arrivals_dispatched = arrivals_dispatched.load();
    s.settle_timeouts = settle_timeouts.load();
    s.claim_conflicts = claim_conflicts.load();
    s.overflows = overflows.load();
    s.files_seeded = files_seeded.load();
    return s;
  }
};

}  // namespace async
}  // namespace autofile_core
