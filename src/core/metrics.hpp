#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace lotledger::core {

class Metrics {
public:
    static Metrics& instance() {
        static Metrics m;
        return m;
    }

    // Counters
    std::atomic<uint64_t> transactions_received{0};
    std::atomic<uint64_t> transactions_applied{0};
    std::atomic<uint64_t> transactions_replayed{0};
    std::atomic<uint64_t> transactions_rejected{0};
    std::atomic<uint64_t> insufficient_lot_rejects{0};
    std::atomic<uint64_t> snapshots_written{0};
    std::atomic<uint64_t> stale_snapshots{0};
    std::atomic<uint64_t> messages_in{0};
    std::atomic<uint64_t> messages_out{0};
    std::atomic<int64_t> realized_pnl_x100{0};  // signed cents, kept integral for atomicity

    void add_realized_pnl(double pnl) {
        realized_pnl_x100.fetch_add(
            static_cast<int64_t>(pnl * 100.0), std::memory_order_relaxed);
    }

    double get_realized_pnl() const {
        return static_cast<double>(realized_pnl_x100.load(std::memory_order_relaxed)) / 100.0;
    }

    // Latency tracking (ring buffer)
    void record_latency_us(uint64_t micros) {
        std::lock_guard<std::mutex> lock(latency_mutex_);
        latency_samples_[latency_idx_ % kMaxSamples] = micros;
        ++latency_idx_;
    }

    struct LatencyStats {
        uint64_t avg_us = 0;
        uint64_t p99_us = 0;
        size_t count = 0;
    };

    LatencyStats latency_stats() const {
        std::lock_guard<std::mutex> lock(latency_mutex_);
        LatencyStats stats;
        size_t n = std::min(latency_idx_, kMaxSamples);
        if (n == 0) return stats;

        std::vector<uint64_t> sorted(latency_samples_, latency_samples_ + n);
        std::sort(sorted.begin(), sorted.end());

        uint64_t sum = 0;
        for (auto v : sorted) sum += v;
        stats.avg_us = sum / n;
        stats.p99_us = sorted[static_cast<size_t>(n * 0.99)];
        stats.count = n;

        return stats;
    }

    std::string to_string() const {
        auto lat = latency_stats();
        std::ostringstream ss;
        ss << "Metrics {"
           << " transactions_received=" << transactions_received.load()
           << " transactions_applied=" << transactions_applied.load()
           << " transactions_replayed=" << transactions_replayed.load()
           << " transactions_rejected=" << transactions_rejected.load()
           << " insufficient_lot_rejects=" << insufficient_lot_rejects.load()
           << " snapshots_written=" << snapshots_written.load()
           << " stale_snapshots=" << stale_snapshots.load()
           << " messages_in=" << messages_in.load()
           << " messages_out=" << messages_out.load()
           << " realized_pnl=$" << get_realized_pnl()
           << " latency_avg=" << lat.avg_us << "us"
           << " latency_p99=" << lat.p99_us << "us"
           << " latency_samples=" << lat.count
           << " }";
        return ss.str();
    }

    void reset() {
        transactions_received = 0;
        transactions_applied = 0;
        transactions_replayed = 0;
        transactions_rejected = 0;
        insufficient_lot_rejects = 0;
        snapshots_written = 0;
        stale_snapshots = 0;
        messages_in = 0;
        messages_out = 0;
        realized_pnl_x100 = 0;
        std::lock_guard<std::mutex> lock(latency_mutex_);
        latency_idx_ = 0;
    }

private:
    Metrics() = default;

    static constexpr size_t kMaxSamples = 10000;
    mutable std::mutex latency_mutex_;
    uint64_t latency_samples_[kMaxSamples] = {};
    size_t latency_idx_ = 0;
};

/// RAII timer that records elapsed time to Metrics on destruction.
class ScopedTimer {
public:
    ScopedTimer() : start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        Metrics::instance().record_latency_us(static_cast<uint64_t>(us));
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace lotledger::core
