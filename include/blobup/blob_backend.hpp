#pragma once

#include "blobup/constants.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace blobup {

// Result of a stage, commit or delete call
struct BlobResult {
    bool success = false;
    int status_code = 0;        // HTTP status for remote backends, 0 otherwise
    std::string error_message;
};

struct ObjectProperties {
    uint64_t size = 0;
    int64_t created_at = 0;     // epoch seconds, 0 if unknown
    int64_t modified_at = 0;
    std::string etag;
};

struct PropertiesResult {
    bool success = false;
    bool found = false;
    ObjectProperties properties;
    std::string error_message;
};

/// Remote blob store speaking the stage/commit block protocol.
///
/// Blocks are staged under an opaque block id against a target object and stay
/// invisible until a commit names them. A commit replaces the object's content
/// with the concatenation of the listed blocks, in list order. Staging the same
/// block id twice overwrites the earlier payload.
///
/// Implementations must be safe to call from many threads at once. They do not
/// retry; retry policy belongs to the caller.
class BlobBackend {
public:
    virtual ~BlobBackend() = default;

    virtual std::string type_name() const = 0;

    virtual BlobResult stage_block(const std::string& object_name,
                                   const std::string& block_id,
                                   std::span<const uint8_t> data) = 0;

    /// An empty list commits a zero-length object.
    virtual BlobResult commit_block_list(const std::string& object_name,
                                         const std::vector<std::string>& block_ids) = 0;

    /// Deleting a missing object succeeds.
    virtual BlobResult delete_object(const std::string& object_name) = 0;

    virtual PropertiesResult get_object_properties(const std::string& object_name) const = 0;

    virtual bool is_healthy() const = 0;

    /// Create the destination container if it does not exist yet. Backends
    /// without one succeed trivially.
    virtual BlobResult ensure_container() { return {true, 0, {}}; }

    /// Longest block list a single commit accepts.
    virtual uint64_t max_block_count() const { return constants::MAX_BLOCKS_PER_UPLOAD; }
};

/// Block limit for a backend type, before one is constructed.
uint64_t max_block_count_for(const std::string& backend_type);

// Factory for creating blob backends from configuration
class BlobBackendFactory {
public:
    /// type "azure": container, account_name, account_key | sas_token,
    ///               endpoint, path_prefix, verify_ssl, ca_bundle,
    ///               connect_timeout, request_timeout
    /// type "local": path
    /// Throws std::runtime_error on unknown type or missing required parameter.
    static std::unique_ptr<BlobBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);
};

/// Map a client filename onto a valid blob name. Returns empty if nothing
/// usable remains.
std::string sanitize_blob_name(const std::string& filename);

}  // namespace blobup
