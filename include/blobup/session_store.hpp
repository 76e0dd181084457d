#pragma once

#include "blobup/upload_session.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobup {

enum class WriteStatus {
    Ok,
    Conflict,   // stored version differs from the expected one
    NotFound,
    Exists,     // create() on an id already present
    Error
};

const char* write_status_name(WriteStatus status);

struct WriteResult {
    WriteStatus status = WriteStatus::Error;
    uint64_t version = 0;       // version now stored, on Ok
    std::string error_message;

    bool ok() const { return status == WriteStatus::Ok; }
};

// Result of get(): an absent session is success with no value
struct SessionLookup {
    bool success = false;
    std::optional<UploadSession> session;
    std::string error_message;
};

struct SessionList {
    bool success = false;
    std::vector<UploadSession> sessions;
    std::string error_message;
};

// Outcome of a single read/modify/write attempt
enum class MutationStatus {
    Applied,        // a new version was written
    Unchanged,      // nothing to write (block already recorded)
    Completed,      // session is terminal, nothing written
    NotFound,
    Conflict,       // lost a race with another writer; caller may retry
    Error
};

const char* mutation_status_name(MutationStatus status);

struct MutationResult {
    MutationStatus status = MutationStatus::Error;
    UploadSession session;      // state after the attempt, when known
    std::string error_message;
};

/// Durable map from upload id to session state.
///
/// Every write carries a version stamp: create() stores version 1 and each
/// successful compare_and_swap() stores expected_version + 1. Implementations
/// must make individual writes atomic per key and must be safe to call from
/// many threads.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::string type_name() const = 0;

    /// Persist a new session. Exists if the id is already present.
    virtual WriteResult create(const UploadSession& session) = 0;

    /// Unknown or malformed ids return success with no session.
    virtual SessionLookup get(const std::string& upload_id) const = 0;

    /// Removing an unknown id is Ok.
    virtual WriteResult remove(const std::string& upload_id) = 0;

    /// Remove the session iff its stored version equals `expected_version`.
    /// Conflict leaves the record in place; NotFound if it is already gone.
    virtual WriteResult remove_if_version(const std::string& upload_id,
                                          uint64_t expected_version) = 0;

    /// Replace the stored record iff its version equals `expected_version`.
    /// NotFound if the session no longer exists; it is never recreated.
    virtual WriteResult compare_and_swap(const UploadSession& session,
                                         uint64_t expected_version) = 0;

    virtual SessionList list() const = 0;

    virtual bool is_healthy() const = 0;

    /// One attempt at appending `block_id`: read, skip if present or completed,
    /// write back conditioned on the version read.
    MutationResult append_block_id(const std::string& upload_id, const std::string& block_id);

    /// One attempt at setting `completed`, conditioned on `expected_version`.
    MutationResult mark_completed(const std::string& upload_id, uint64_t expected_version);
};

struct SweepResult {
    bool success = false;
    size_t removed = 0;
    size_t remaining = 0;       // sessions left after the pass
    std::string error_message;
};

/// Remove every session last updated before `cutoff`, completed or not.
/// Each removal is conditioned on the version seen in the listing, so a
/// session written after the listing survives the pass.
SweepResult remove_idle_sessions(SessionStore& store, int64_t cutoff);

// Factory for creating session stores from configuration
class SessionStoreFactory {
public:
    /// type "file":   path
    /// type "kv":     endpoint, prefix, token, timeout, verify_ssl, ca_bundle
    /// type "sqlite": path
    /// Throws std::runtime_error on unknown type, missing parameter or an
    /// unopenable database.
    static std::unique_ptr<SessionStore> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);
};

}  // namespace blobup
