#pragma once

#include "blobup/upload_session.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace blobup {

class BlobBackend;
class MetricsExporter;
class SessionStore;

enum class UploadError {
    None,
    SizeExceeded,
    SessionNotFound,
    AlreadyCompleted,
    StagingFailed,
    CommitFailed,
    StoreUnavailable,
    InvalidArgument
};

/// Machine-readable code, e.g. "session_not_found".
const char* error_code_name(UploadError error);

/// True for failures a client may retry unchanged.
bool is_retryable(UploadError error);

/// Bounded retry with exponential backoff for blob backend calls.
/// After a failed attempt n (1-based, n < max_attempts) the caller sleeps
/// base_delay * 2^(n-1).
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};

    // Replaceable for tests; defaults to std::this_thread::sleep_for
    std::function<void(std::chrono::milliseconds)> sleep;

    std::chrono::milliseconds delay_after(int attempt) const;
    void wait(std::chrono::milliseconds delay) const;
};

struct CoordinatorConfig {
    uint64_t chunk_size = 0;
    uint64_t max_file_size = 0;
    RetryPolicy retry;
    int cas_max_attempts = 32;
    bool order_blocks_by_index = false;
};

struct InitResult {
    UploadError error = UploadError::None;
    std::string message;
    std::string upload_id;
    std::string object_name;
    uint64_t chunk_size = 0;

    bool ok() const { return error == UploadError::None; }
};

struct StageResult {
    UploadError error = UploadError::None;
    std::string message;
    std::string block_id;
    double progress = 0.0;
    bool newly_recorded = false;    // false when the block id was already present
    int attempts = 0;               // stage calls made against the backend

    bool ok() const { return error == UploadError::None; }
};

struct CompleteResult {
    UploadError error = UploadError::None;
    std::string message;
    std::string upload_id;
    std::string filename;
    std::string object_name;
    uint64_t file_size = 0;
    size_t block_count = 0;

    bool ok() const { return error == UploadError::None; }
};

/// Read projection for status and resume requests.
struct SessionView {
    UploadError error = UploadError::None;
    std::string message;
    UploadSession session;
    double progress = 0.0;
    std::vector<uint32_t> missing_chunks;   // filled for resume only

    bool ok() const { return error == UploadError::None; }
};

struct CancelResult {
    UploadError error = UploadError::None;
    std::string message;

    bool ok() const { return error == UploadError::None; }
};

struct UploadLimits {
    uint64_t chunk_size = 0;
    uint64_t max_file_size = 0;
};

/// Upload session lifecycle and block staging.
///
/// Stateless between requests: every operation reads the session from the
/// store, talks to the blob backend, and writes back through the store's
/// conditional write. Safe to call from any number of threads; no per-session
/// locks are held. Concurrent appends to one session are serialized by
/// compare-and-swap with retry.
///
/// A completion is linearized at the conditional write that sets `completed`.
/// If a stage recorded another block between the completion's read and that
/// write, the completion re-reads and commits the longer list.
class UploadCoordinator {
public:
    UploadCoordinator(SessionStore& store, BlobBackend& backend, CoordinatorConfig config);

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /// Optional; counters and histograms are updated when set.
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    InitResult init_upload(const std::string& filename, uint64_t declared_size);

    StageResult stage_chunk(const std::string& upload_id, int64_t chunk_index,
                            std::span<const uint8_t> data);

    CompleteResult complete_upload(const std::string& upload_id);

    SessionView get_status(const std::string& upload_id);

    SessionView resume_upload(const std::string& upload_id);

    CancelResult cancel_upload(const std::string& upload_id);

    UploadLimits limits() const;

    const CoordinatorConfig& config() const { return config_; }

    struct Stats {
        uint64_t sessions_created = 0;
        uint64_t sessions_completed = 0;
        uint64_t sessions_cancelled = 0;
        uint64_t chunks_staged = 0;
        uint64_t chunks_failed = 0;
        uint64_t bytes_staged = 0;
        uint64_t stage_retries = 0;
        uint64_t commits_failed = 0;
        uint64_t cas_conflicts = 0;
    };
    Stats get_stats() const;

private:
    // Commit block ids in recorded or index order, with retries
    bool commit_with_retry(const UploadSession& session, std::string& error);

    SessionView load_view(const std::string& upload_id, bool with_missing);

    SessionStore& store_;
    BlobBackend& backend_;
    CoordinatorConfig config_;
    MetricsExporter* metrics_ = nullptr;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace blobup
