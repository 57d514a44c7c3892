#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace chatty {

struct TelemetryData {
    // System
    size_t ram_usage_mb = 0;
    size_t ram_total_mb = 0;

    // Backend latency
    double llm_generation_ms = 0.0;
    double synth_request_ms = 0.0;

    // Counters
    long long synth_requests = 0;
    long long helper_failures = 0;
    long long backend_failures = 0;
};

class SystemMonitor {
public:
    // Global Atomic Metrics
    inline static std::atomic<double> global_llm_generation_ms{0.0};
    inline static std::atomic<double> global_synth_request_ms{0.0};
    inline static std::atomic<long long> global_synth_requests{0};
    inline static std::atomic<long long> global_helper_failures{0};
    inline static std::atomic<long long> global_backend_failures{0};

    SystemMonitor() : stop_thread_(false) {
        monitor_thread_ = std::thread(&SystemMonitor::poll_routine, this);
    }

    ~SystemMonitor() {
        stop_thread_ = true;
        if (monitor_thread_.joinable()) monitor_thread_.join();
    }

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    TelemetryData get_latest_snapshot() {
        std::lock_guard<std::mutex> lock(data_mutex_);
        return current_data_;
    }

private:
    TelemetryData current_data_;
    std::mutex data_mutex_;
    std::thread monitor_thread_;
    std::atomic<bool> stop_thread_;

    static size_t read_rss_mb() {
        std::ifstream statm("/proc/self/statm");
        size_t pages_total = 0, pages_resident = 0;
        if (!(statm >> pages_total >> pages_resident)) return 0;
        long page_size = sysconf(_SC_PAGESIZE);
        if (page_size <= 0) return 0;
        return pages_resident * static_cast<size_t>(page_size) / 1024 / 1024;
    }

    static size_t read_total_mb() {
        long pages = sysconf(_SC_PHYS_PAGES);
        long page_size = sysconf(_SC_PAGESIZE);
        if (pages <= 0 || page_size <= 0) return 0;
        return static_cast<size_t>(pages) / 1024 * static_cast<size_t>(page_size) / 1024;
    }

    void poll_routine() {
        while (!stop_thread_) {
            TelemetryData snapshot;

            // 1. OS Metrics
            snapshot.ram_usage_mb = read_rss_mb();
            snapshot.ram_total_mb = read_total_mb();

            // 2. Read Global Atomics
            snapshot.llm_generation_ms = global_llm_generation_ms.load();
            snapshot.synth_request_ms = global_synth_request_ms.load();
            snapshot.synth_requests = global_synth_requests.load();
            snapshot.helper_failures = global_helper_failures.load();
            snapshot.backend_failures = global_backend_failures.load();

            {
                std::lock_guard<std::mutex> lock(data_mutex_);
                current_data_ = snapshot;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    }
};
}
