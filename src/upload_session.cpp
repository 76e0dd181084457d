#include "blobup/upload_session.hpp"

#include "blobup/constants.hpp"
#include "blobup/http.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unordered_set>

namespace blobup {

double compute_progress(size_t block_count, uint64_t chunk_size, uint64_t file_size) {
    if (file_size == 0) return 0.0;
    double pct = static_cast<double>(block_count) * static_cast<double>(chunk_size) /
                 static_cast<double>(file_size) * 100.0;
    return std::min(100.0, pct);
}

double UploadSession::progress_percentage() const {
    return compute_progress(block_ids.size(), chunk_size, file_size);
}

bool UploadSession::has_block(const std::string& block_id) const {
    return std::find(block_ids.begin(), block_ids.end(), block_id) != block_ids.end();
}

uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size) {
    if (file_size == 0 || chunk_size == 0) return 0;
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

uint64_t UploadSession::expected_chunks() const {
    return chunk_count(file_size, chunk_size);
}

std::vector<uint32_t> UploadSession::missing_chunks() const {
    std::unordered_set<uint32_t> present;
    for (const auto& id : block_ids) {
        auto idx = parse_block_index(upload_id, id);
        if (idx) present.insert(*idx);
    }

    uint64_t expected = std::min(expected_chunks(), constants::MAX_BLOCKS_PER_UPLOAD);
    std::vector<uint32_t> missing;
    for (uint64_t i = 0; i < expected; ++i) {
        if (present.count(static_cast<uint32_t>(i)) == 0) {
            missing.push_back(static_cast<uint32_t>(i));
        }
    }
    return missing;
}

std::string UploadSession::to_json() const {
    nlohmann::json j;
    j["upload_id"] = upload_id;
    j["filename"] = filename;
    j["object_name"] = object_name;
    j["file_size"] = file_size;
    j["chunk_size"] = chunk_size;
    j["block_ids"] = block_ids;
    j["completed"] = completed;
    j["created_at"] = created_at;
    j["updated_at"] = updated_at;
    j["version"] = version;
    return j.dump();
}

std::optional<UploadSession> UploadSession::from_json(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    try {
        UploadSession s;
        s.upload_id = j.at("upload_id").get<std::string>();
        s.filename = j.value("filename", "");
        s.object_name = j.value("object_name", s.filename);
        s.file_size = j.at("file_size").get<uint64_t>();
        s.chunk_size = j.at("chunk_size").get<uint64_t>();
        if (j.contains("block_ids")) {
            s.block_ids = j["block_ids"].get<std::vector<std::string>>();
        }
        s.completed = j.value("completed", false);
        s.created_at = j.value("created_at", int64_t(0));
        s.updated_at = j.value("updated_at", s.created_at);
        s.version = j.value("version", uint64_t(0));
        if (s.upload_id.empty()) return std::nullopt;
        return s;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::string make_upload_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed generating upload id");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

std::string make_block_id(const std::string& upload_id, uint32_t chunk_index) {
    char idx[16];
    snprintf(idx, sizeof(idx), "%0*u", constants::BLOCK_INDEX_DIGITS, chunk_index);
    return net::base64_encode(upload_id + "_" + idx);
}

std::optional<uint32_t> parse_block_index(const std::string& upload_id,
                                          const std::string& block_id) {
    auto raw = net::base64_decode(block_id);
    std::string decoded(raw.begin(), raw.end());

    const std::string prefix = upload_id + "_";
    if (decoded.size() != prefix.size() + constants::BLOCK_INDEX_DIGITS) return std::nullopt;
    if (decoded.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    uint32_t value = 0;
    for (size_t i = prefix.size(); i < decoded.size(); ++i) {
        char c = decoded[i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

bool is_valid_chunk_index(int64_t chunk_index) {
    return chunk_index >= 0 && chunk_index <= int64_t(constants::MAX_BLOCK_INDEX);
}

bool is_valid_upload_id(const std::string& upload_id) {
    if (upload_id.empty() || upload_id.size() > 64) return false;
    for (char c : upload_id) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') || c == '-';
        if (!ok) return false;
    }
    return true;
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_timestamp(int64_t epoch) {
    if (epoch <= 0) return "-";
    time_t t = static_cast<time_t>(epoch);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_val);
    return buf;
}

}  // namespace blobup
