#pragma once

#include "blobup/service_config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <thread>

namespace blobup {

class BlobBackend;
class MetricsExporter;
class SessionStore;
class UploadCoordinator;
class WorkerPool;

/// The blobup daemon.
///
/// Builds the session store and blob backend from config, hosts the
/// UploadCoordinator, and serves the line protocol on a Unix socket:
///
///   INIT <declared_size> <filename...>
///   CHUNK <upload_id> <chunk_index> <length>\n<length payload bytes>
///   COMPLETE <upload_id>
///   STATUS <upload_id>
///   RESUME <upload_id>
///   CANCEL <upload_id>
///   CONFIG
///
/// Each request gets one response line: "OK <json>" or
/// "ERROR {"error": <code>, "message": <text>, "retryable": <bool>}".
/// A connection may carry any number of requests.
///
/// Also runs the retention sweeper and the periodic stats reporter.
class UploadService {
public:
    explicit UploadService(const ServiceConfig& config);
    ~UploadService();

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    /// Create store, backend and coordinator, bind the socket, start threads.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Close the socket, drain in-flight connections, stop threads.
    void stop();

    /// Block until stop() is called (for daemon mode).
    void wait();

    /// Execute one request. `payload` carries the CHUNK body and is empty
    /// otherwise. Returns the response line without the trailing newline.
    std::string handle_request(const std::string& line, std::span<const uint8_t> payload = {});

    /// Remove sessions whose updated_at is older than session_ttl_secs
    /// relative to `now`. Returns the number removed.
    size_t sweep_expired(int64_t now);

    UploadCoordinator& coordinator() { return *coordinator_; }
    SessionStore& store() { return *store_; }
    BlobBackend& backend() { return *backend_; }

    struct Stats {
        uint64_t connections = 0;
        uint64_t requests = 0;
        uint64_t request_errors = 0;
        uint64_t sessions_expired = 0;
        uint64_t active_sessions = 0;   // as of the last sweep
    };
    Stats get_stats() const;

private:
    void server_loop();
    void serve_connection(int client_fd);
    void sweeper_loop();
    void stats_reporter_loop();

    // Sleep up to `secs`, returning early when stopping
    void interruptible_sleep(int64_t secs);

    ServiceConfig config_;

    std::unique_ptr<SessionStore> store_;
    std::unique_ptr<BlobBackend> backend_;
    std::unique_ptr<UploadCoordinator> coordinator_;
    std::unique_ptr<MetricsExporter> metrics_;
    std::unique_ptr<WorkerPool> workers_;

    std::thread server_thread_;
    std::thread sweeper_thread_;
    std::thread stats_thread_;

    std::atomic<bool> running_{false};
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    std::condition_variable wait_cv_;
    std::mutex wait_mutex_;

    int server_fd_ = -1;

    // Open client sockets, shut down on stop() to unblock idle reads
    std::mutex clients_mutex_;
    std::set<int> client_fds_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace blobup
