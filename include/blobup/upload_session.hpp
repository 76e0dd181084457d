#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blobup {

/// Durable record of one chunked upload.
///
/// Sessions are owned by the SessionStore. The coordinator reads a fresh copy
/// on every request and writes it back through a conditional write keyed on
/// `version`.
struct UploadSession {
    std::string upload_id;
    std::string filename;       // as sent by the client
    std::string object_name;    // sanitized blob name
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    std::vector<std::string> block_ids;  // arrival order, no duplicates
    bool completed = false;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    uint64_t version = 0;

    /// min(100, blocks * chunk_size / file_size * 100), 0 when file_size is 0.
    double progress_percentage() const;

    bool has_block(const std::string& block_id) const;

    /// ceil(file_size / chunk_size); 0 when either is 0.
    uint64_t expected_chunks() const;

    /// Chunk indices below expected_chunks() with no recorded block id.
    std::vector<uint32_t> missing_chunks() const;

    /// Logical JSON record shared by every store strategy.
    std::string to_json() const;

    /// Parse a record written by to_json(). Returns nullopt on malformed input.
    static std::optional<UploadSession> from_json(const std::string& text);
};

double compute_progress(size_t block_count, uint64_t chunk_size, uint64_t file_size);

/// ceil(file_size / chunk_size); 0 when either is 0.
uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size);

/// Random RFC 4122 version 4 UUID (lowercase, hyphenated).
/// Throws std::runtime_error if the system RNG fails.
std::string make_upload_id();

/// base64("<upload_id>_<6-digit index>"). All ids of one upload share a length.
std::string make_block_id(const std::string& upload_id, uint32_t chunk_index);

/// Recover the chunk index from a block id minted for `upload_id`.
std::optional<uint32_t> parse_block_index(const std::string& upload_id,
                                          const std::string& block_id);

bool is_valid_chunk_index(int64_t chunk_index);

/// Ids are [0-9A-Za-z-], at most 64 characters. Stores treat anything else as
/// unknown so client input never reaches a path or key unchecked.
bool is_valid_upload_id(const std::string& upload_id);

int64_t now_epoch();

/// "2026-01-31 12:00:00" (UTC). "-" for 0.
std::string format_timestamp(int64_t epoch);

}  // namespace blobup
