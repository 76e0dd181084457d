#include "blobup/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobup {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& sessions_family = prometheus::BuildCounter()
        .Name("blobup_sessions_total")
        .Help("Upload session lifecycle events")
        .Labels(labels)
        .Register(*registry_);
    sessions_created_ = &sessions_family.Add({{"event", "created"}});
    sessions_completed_ = &sessions_family.Add({{"event", "completed"}});
    sessions_cancelled_ = &sessions_family.Add({{"event", "cancelled"}});
    sessions_expired_ = &sessions_family.Add({{"event", "expired"}});

    auto& chunks_family = prometheus::BuildCounter()
        .Name("blobup_chunks_staged_total")
        .Help("Chunks staged against the blob backend")
        .Labels(labels)
        .Register(*registry_);
    chunks_staged_ = &chunks_family.Add({{"result", "success"}});
    chunks_failed_ = &chunks_family.Add({{"result", "failure"}});

    staged_bytes_ = &prometheus::BuildCounter()
        .Name("blobup_staged_bytes_total")
        .Help("Total chunk bytes staged")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    stage_retries_ = &prometheus::BuildCounter()
        .Name("blobup_stage_retries_total")
        .Help("Stage attempts retried after a backend failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& commits_family = prometheus::BuildCounter()
        .Name("blobup_commits_total")
        .Help("Block list commits")
        .Labels(labels)
        .Register(*registry_);
    commits_success_ = &commits_family.Add({{"result", "success"}});
    commits_failure_ = &commits_family.Add({{"result", "failure"}});

    cas_conflicts_ = &prometheus::BuildCounter()
        .Name("blobup_cas_conflicts_total")
        .Help("Conditional session writes that lost a race")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    requests_family_ = &prometheus::BuildCounter()
        .Name("blobup_requests_total")
        .Help("Protocol requests by command and result")
        .Labels(labels)
        .Register(*registry_);

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    active_sessions_ = &gauge_reg("blobup_active_sessions", "Sessions in the store at last sweep");
    connections_active_ = &gauge_reg("blobup_connections_active", "Open client connections");

    // --- Histograms ---

    stage_duration_ = &prometheus::BuildHistogram()
        .Name("blobup_stage_duration_seconds")
        .Help("Single stage call duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    commit_duration_ = &prometheus::BuildHistogram()
        .Name("blobup_commit_duration_seconds")
        .Help("Single commit call duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});

    request_duration_ = &prometheus::BuildHistogram()
        .Name("blobup_request_duration_seconds")
        .Help("Protocol request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::record_request(const std::string& command, bool ok) {
    // Family::Add returns the existing child for a known label set
    requests_family_->Add({{"command", command}, {"result", ok ? "ok" : "error"}}).Increment();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        write_file();
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace blobup
