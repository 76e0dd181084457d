#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobup {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports blobup metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Serialize the registry now.
    bool write_file();

    // --- Counters ---
    prometheus::Counter& sessions_created() { return *sessions_created_; }
    prometheus::Counter& sessions_completed() { return *sessions_completed_; }
    prometheus::Counter& sessions_cancelled() { return *sessions_cancelled_; }
    prometheus::Counter& sessions_expired() { return *sessions_expired_; }
    prometheus::Counter& chunks_staged() { return *chunks_staged_; }
    prometheus::Counter& chunks_failed() { return *chunks_failed_; }
    prometheus::Counter& staged_bytes() { return *staged_bytes_; }
    prometheus::Counter& stage_retries() { return *stage_retries_; }
    prometheus::Counter& commits_success() { return *commits_success_; }
    prometheus::Counter& commits_failure() { return *commits_failure_; }
    prometheus::Counter& cas_conflicts() { return *cas_conflicts_; }

    /// Count one protocol request by command and outcome.
    void record_request(const std::string& command, bool ok);

    // --- Gauges ---
    void set_active_sessions(size_t count) { active_sessions_->Set(static_cast<double>(count)); }
    prometheus::Gauge& connections_active() { return *connections_active_; }

    // --- Histograms ---
    prometheus::Histogram& stage_duration() { return *stage_duration_; }
    prometheus::Histogram& commit_duration() { return *commit_duration_; }
    prometheus::Histogram& request_duration() { return *request_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* sessions_created_;
    prometheus::Counter* sessions_completed_;
    prometheus::Counter* sessions_cancelled_;
    prometheus::Counter* sessions_expired_;
    prometheus::Counter* chunks_staged_;
    prometheus::Counter* chunks_failed_;
    prometheus::Counter* staged_bytes_;
    prometheus::Counter* stage_retries_;
    prometheus::Counter* commits_success_;
    prometheus::Counter* commits_failure_;
    prometheus::Counter* cas_conflicts_;
    prometheus::Family<prometheus::Counter>* requests_family_;

    prometheus::Gauge* active_sessions_;
    prometheus::Gauge* connections_active_;

    prometheus::Histogram* stage_duration_;
    prometheus::Histogram* commit_duration_;
    prometheus::Histogram* request_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::mutex write_mutex_;
};

}  // namespace blobup
