#include "blobup/upload_coordinator.hpp"

#include "blobup/blob_backend.hpp"
#include "blobup/constants.hpp"
#include "blobup/log.hpp"
#include "blobup/metrics.hpp"
#include "blobup/session_store.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>

namespace blobup {

const char* error_code_name(UploadError error) {
    switch (error) {
        case UploadError::None: return "none";
        case UploadError::SizeExceeded: return "size_exceeded";
        case UploadError::SessionNotFound: return "session_not_found";
        case UploadError::AlreadyCompleted: return "already_completed";
        case UploadError::StagingFailed: return "staging_failed";
        case UploadError::CommitFailed: return "commit_failed";
        case UploadError::StoreUnavailable: return "store_unavailable";
        case UploadError::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

bool is_retryable(UploadError error) {
    switch (error) {
        case UploadError::StagingFailed:
        case UploadError::CommitFailed:
        case UploadError::StoreUnavailable:
            return true;
        default:
            return false;
    }
}

// --- RetryPolicy ---

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (attempt < 1) attempt = 1;
    int shift = std::min(attempt - 1, 20);
    return base_delay * (int64_t(1) << shift);
}

void RetryPolicy::wait(std::chrono::milliseconds delay) const {
    if (sleep) {
        sleep(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
}

// --- UploadCoordinator ---

UploadCoordinator::UploadCoordinator(SessionStore& store, BlobBackend& backend,
                                     CoordinatorConfig config)
    : store_(store), backend_(backend), config_(std::move(config)) {
    if (config_.retry.max_attempts < 1) config_.retry.max_attempts = 1;
    if (config_.cas_max_attempts < 1) config_.cas_max_attempts = 1;
}

UploadLimits UploadCoordinator::limits() const {
    return {config_.chunk_size, config_.max_file_size};
}

InitResult UploadCoordinator::init_upload(const std::string& filename, uint64_t declared_size) {
    InitResult result;

    if (declared_size > config_.max_file_size) {
        result.error = UploadError::SizeExceeded;
        result.message = "File size " + std::to_string(declared_size) +
                         " exceeds maximum allowed size of " +
                         std::to_string(config_.max_file_size) + " bytes";
        return result;
    }

    // Every chunk must map to a block id the backend will accept in one commit
    uint64_t max_blocks = std::min(constants::MAX_BLOCKS_PER_UPLOAD, backend_.max_block_count());
    uint64_t chunks = chunk_count(declared_size, config_.chunk_size);
    if (chunks > max_blocks) {
        result.error = UploadError::SizeExceeded;
        result.message = "File size " + std::to_string(declared_size) + " needs " +
                         std::to_string(chunks) + " chunks of " +
                         std::to_string(config_.chunk_size) + " bytes; at most " +
                         std::to_string(max_blocks) + " are allowed";
        return result;
    }

    std::string object_name = sanitize_blob_name(filename);
    if (object_name.empty()) {
        result.error = UploadError::InvalidArgument;
        result.message = "Filename does not yield a valid object name";
        return result;
    }

    UploadSession session;
    session.filename = filename;
    session.object_name = object_name;
    session.file_size = declared_size;
    session.chunk_size = config_.chunk_size;
    session.created_at = now_epoch();
    session.updated_at = session.created_at;

    // A collision is astronomically unlikely; ids are still never reused
    for (int attempt = 0; attempt < 3; ++attempt) {
        try {
            session.upload_id = make_upload_id();
        } catch (const std::runtime_error& e) {
            result.error = UploadError::StoreUnavailable;
            result.message = e.what();
            return result;
        }

        auto write = store_.create(session);
        if (write.status == WriteStatus::Exists) continue;
        if (!write.ok()) {
            log_error("Failed to persist new session: %s", write.error_message.c_str());
            result.error = UploadError::StoreUnavailable;
            result.message = "Session store unavailable: " + write.error_message;
            return result;
        }

        {
            std::lock_guard lock(stats_mutex_);
            stats_.sessions_created++;
        }
        if (metrics_) metrics_->sessions_created().Increment();

        log_info("Initialized upload %s for %s (%llu bytes, chunk %llu)",
                 session.upload_id.c_str(), object_name.c_str(),
                 static_cast<unsigned long long>(declared_size),
                 static_cast<unsigned long long>(config_.chunk_size));

        result.upload_id = session.upload_id;
        result.object_name = object_name;
        result.chunk_size = config_.chunk_size;
        return result;
    }

    result.error = UploadError::StoreUnavailable;
    result.message = "Could not allocate a unique upload id";
    return result;
}

StageResult UploadCoordinator::stage_chunk(const std::string& upload_id, int64_t chunk_index,
                                           std::span<const uint8_t> data) {
    StageResult result;

    if (!is_valid_chunk_index(chunk_index)) {
        result.error = UploadError::InvalidArgument;
        result.message = "Chunk index " + std::to_string(chunk_index) + " out of range";
        return result;
    }

    auto lookup = store_.get(upload_id);
    if (!lookup.success) {
        result.error = UploadError::StoreUnavailable;
        result.message = "Session store unavailable: " + lookup.error_message;
        return result;
    }
    if (!lookup.session) {
        result.error = UploadError::SessionNotFound;
        result.message = "Upload not found";
        return result;
    }
    const UploadSession& session = *lookup.session;
    if (session.completed) {
        result.error = UploadError::AlreadyCompleted;
        result.message = "Upload already completed";
        return result;
    }
    if (data.size() > session.chunk_size) {
        result.error = UploadError::InvalidArgument;
        result.message = "Chunk of " + std::to_string(data.size()) +
                         " bytes exceeds chunk size " + std::to_string(session.chunk_size);
        return result;
    }

    result.block_id = make_block_id(upload_id, static_cast<uint32_t>(chunk_index));

    // Stage with retry; the session is untouched until the block is durable
    std::string last_error;
    bool staged = false;
    const int max_attempts = config_.retry.max_attempts;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;
        BlobResult put;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->stage_duration());
            put = backend_.stage_block(session.object_name, result.block_id, data);
        }
        if (put.success) {
            staged = true;
            break;
        }

        last_error = put.error_message;
        log_warn("Stage attempt %d/%d failed for upload %s chunk %lld: %s",
                 attempt, max_attempts, upload_id.c_str(),
                 static_cast<long long>(chunk_index), last_error.c_str());
        if (attempt < max_attempts) {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.stage_retries++;
            }
            if (metrics_) metrics_->stage_retries().Increment();
            config_.retry.wait(config_.retry.delay_after(attempt));
        }
    }

    if (!staged) {
        log_error("Staging failed for upload %s chunk %lld after %d attempts: %s",
                  upload_id.c_str(), static_cast<long long>(chunk_index),
                  max_attempts, last_error.c_str());
        {
            std::lock_guard lock(stats_mutex_);
            stats_.chunks_failed++;
        }
        if (metrics_) metrics_->chunks_failed().Increment();
        result.error = UploadError::StagingFailed;
        result.message = last_error;
        return result;
    }

    // Record the block id; conflicts mean another writer got there first
    for (int attempt = 0; attempt < config_.cas_max_attempts; ++attempt) {
        auto m = store_.append_block_id(upload_id, result.block_id);
        switch (m.status) {
            case MutationStatus::Applied:
            case MutationStatus::Unchanged: {
                result.newly_recorded = m.status == MutationStatus::Applied;
                result.progress = m.session.progress_percentage();
                {
                    std::lock_guard lock(stats_mutex_);
                    stats_.chunks_staged++;
                    stats_.bytes_staged += data.size();
                }
                if (metrics_) {
                    metrics_->chunks_staged().Increment();
                    metrics_->staged_bytes().Increment(static_cast<double>(data.size()));
                }
                log_debug("Staged chunk %lld of upload %s (%.1f%%)",
                          static_cast<long long>(chunk_index), upload_id.c_str(), result.progress);
                return result;
            }
            case MutationStatus::Completed:
                result.error = UploadError::AlreadyCompleted;
                result.message = "Upload completed while chunk was staging";
                return result;
            case MutationStatus::NotFound:
                result.error = UploadError::SessionNotFound;
                result.message = "Upload was cancelled while chunk was staging";
                return result;
            case MutationStatus::Error:
                log_error("Failed to record block for upload %s: %s",
                          upload_id.c_str(), m.error_message.c_str());
                result.error = UploadError::StoreUnavailable;
                result.message = "Session store unavailable: " + m.error_message;
                return result;
            case MutationStatus::Conflict:
                {
                    std::lock_guard lock(stats_mutex_);
                    stats_.cas_conflicts++;
                }
                if (metrics_) metrics_->cas_conflicts().Increment();
                break;
        }
    }

    log_error("Gave up recording block for upload %s after %d conflicting writes",
              upload_id.c_str(), config_.cas_max_attempts);
    result.error = UploadError::StoreUnavailable;
    result.message = "Too many concurrent updates to session";
    return result;
}

bool UploadCoordinator::commit_with_retry(const UploadSession& session, std::string& error) {
    std::vector<std::string> block_ids = session.block_ids;
    if (config_.order_blocks_by_index) {
        // Unparseable ids sort last, keeping their recorded order
        std::stable_sort(block_ids.begin(), block_ids.end(),
            [&](const std::string& a, const std::string& b) {
                auto ia = parse_block_index(session.upload_id, a);
                auto ib = parse_block_index(session.upload_id, b);
                if (!ia || !ib) return ia.has_value() && !ib.has_value();
                return *ia < *ib;
            });
    }

    const int max_attempts = config_.retry.max_attempts;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        BlobResult commit;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->commit_duration());
            commit = backend_.commit_block_list(session.object_name, block_ids);
        }
        if (commit.success) {
            if (metrics_) metrics_->commits_success().Increment();
            return true;
        }

        error = commit.error_message;
        log_warn("Commit attempt %d/%d failed for upload %s: %s",
                 attempt, max_attempts, session.upload_id.c_str(), error.c_str());
        if (attempt < max_attempts) {
            config_.retry.wait(config_.retry.delay_after(attempt));
        }
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.commits_failed++;
    }
    if (metrics_) metrics_->commits_failure().Increment();
    return false;
}

CompleteResult UploadCoordinator::complete_upload(const std::string& upload_id) {
    CompleteResult result;
    result.upload_id = upload_id;

    for (int attempt = 0; attempt < config_.cas_max_attempts; ++attempt) {
        auto lookup = store_.get(upload_id);
        if (!lookup.success) {
            result.error = UploadError::StoreUnavailable;
            result.message = "Session store unavailable: " + lookup.error_message;
            return result;
        }
        if (!lookup.session) {
            result.error = UploadError::SessionNotFound;
            result.message = "Upload not found";
            return result;
        }
        const UploadSession& session = *lookup.session;
        if (session.completed) {
            result.error = UploadError::AlreadyCompleted;
            result.message = "Upload already completed";
            return result;
        }

        std::string commit_error;
        if (!commit_with_retry(session, commit_error)) {
            log_error("Commit failed for upload %s after %d attempts: %s",
                      upload_id.c_str(), config_.retry.max_attempts, commit_error.c_str());
            result.error = UploadError::CommitFailed;
            result.message = commit_error;
            return result;
        }

        auto m = store_.mark_completed(upload_id, session.version);
        switch (m.status) {
            case MutationStatus::Applied:
            case MutationStatus::Unchanged:
                {
                    std::lock_guard lock(stats_mutex_);
                    stats_.sessions_completed++;
                }
                if (metrics_) metrics_->sessions_completed().Increment();
                log_info("Completed upload %s -> %s (%zu blocks, %llu bytes)",
                         upload_id.c_str(), session.object_name.c_str(),
                         session.block_ids.size(),
                         static_cast<unsigned long long>(session.file_size));
                result.filename = session.filename;
                result.object_name = session.object_name;
                result.file_size = session.file_size;
                result.block_count = session.block_ids.size();
                return result;
            case MutationStatus::Completed:
                result.error = UploadError::AlreadyCompleted;
                result.message = "Upload already completed";
                return result;
            case MutationStatus::NotFound:
                result.error = UploadError::SessionNotFound;
                result.message = "Upload was cancelled during commit";
                return result;
            case MutationStatus::Error:
                log_error("Failed to mark upload %s completed: %s",
                          upload_id.c_str(), m.error_message.c_str());
                result.error = UploadError::StoreUnavailable;
                result.message = "Session store unavailable: " + m.error_message;
                return result;
            case MutationStatus::Conflict:
                // A stage recorded another block since the read; commit again
                {
                    std::lock_guard lock(stats_mutex_);
                    stats_.cas_conflicts++;
                }
                if (metrics_) metrics_->cas_conflicts().Increment();
                log_debug("Upload %s changed during commit, recommitting", upload_id.c_str());
                break;
        }
    }

    log_error("Gave up completing upload %s after %d conflicting writes",
              upload_id.c_str(), config_.cas_max_attempts);
    result.error = UploadError::StoreUnavailable;
    result.message = "Too many concurrent updates to session";
    return result;
}

SessionView UploadCoordinator::load_view(const std::string& upload_id, bool with_missing) {
    SessionView view;
    auto lookup = store_.get(upload_id);
    if (!lookup.success) {
        view.error = UploadError::StoreUnavailable;
        view.message = "Session store unavailable: " + lookup.error_message;
        return view;
    }
    if (!lookup.session) {
        view.error = UploadError::SessionNotFound;
        view.message = "Upload not found";
        return view;
    }
    view.session = std::move(*lookup.session);
    view.progress = view.session.progress_percentage();
    if (with_missing) view.missing_chunks = view.session.missing_chunks();
    return view;
}

SessionView UploadCoordinator::get_status(const std::string& upload_id) {
    return load_view(upload_id, false);
}

SessionView UploadCoordinator::resume_upload(const std::string& upload_id) {
    return load_view(upload_id, true);
}

CancelResult UploadCoordinator::cancel_upload(const std::string& upload_id) {
    CancelResult result;
    auto lookup = store_.get(upload_id);
    if (!lookup.success) {
        result.error = UploadError::StoreUnavailable;
        result.message = "Session store unavailable: " + lookup.error_message;
        return result;
    }
    if (!lookup.session) {
        result.error = UploadError::SessionNotFound;
        result.message = "Upload not found";
        return result;
    }

    auto write = store_.remove(upload_id);
    if (write.status == WriteStatus::NotFound) {
        result.error = UploadError::SessionNotFound;
        result.message = "Upload not found";
        return result;
    }
    if (!write.ok()) {
        result.error = UploadError::StoreUnavailable;
        result.message = "Session store unavailable: " + write.error_message;
        return result;
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.sessions_cancelled++;
    }
    if (metrics_) metrics_->sessions_cancelled().Increment();
    log_info("Cancelled upload %s (%zu blocks staged)",
             upload_id.c_str(), lookup.session->block_ids.size());
    return result;
}

UploadCoordinator::Stats UploadCoordinator::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

}  // namespace blobup
