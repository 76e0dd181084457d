#include "blobup/session_store.hpp"

#include "blobup/http.hpp"
#include "blobup/log.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace blobup {

namespace fs = std::filesystem;

const char* write_status_name(WriteStatus status) {
    switch (status) {
        case WriteStatus::Ok: return "ok";
        case WriteStatus::Conflict: return "conflict";
        case WriteStatus::NotFound: return "not_found";
        case WriteStatus::Exists: return "exists";
        case WriteStatus::Error: return "error";
    }
    return "error";
}

const char* mutation_status_name(MutationStatus status) {
    switch (status) {
        case MutationStatus::Applied: return "applied";
        case MutationStatus::Unchanged: return "unchanged";
        case MutationStatus::Completed: return "completed";
        case MutationStatus::NotFound: return "not_found";
        case MutationStatus::Conflict: return "conflict";
        case MutationStatus::Error: return "error";
    }
    return "error";
}

namespace {

MutationStatus to_mutation_status(WriteStatus status) {
    switch (status) {
        case WriteStatus::Ok: return MutationStatus::Applied;
        case WriteStatus::Conflict: return MutationStatus::Conflict;
        case WriteStatus::NotFound: return MutationStatus::NotFound;
        default: return MutationStatus::Error;
    }
}

}  // namespace

// --- Read/modify/write helpers ---

MutationResult SessionStore::append_block_id(const std::string& upload_id,
                                             const std::string& block_id) {
    MutationResult result;
    auto lookup = get(upload_id);
    if (!lookup.success) {
        result.status = MutationStatus::Error;
        result.error_message = lookup.error_message;
        return result;
    }
    if (!lookup.session) {
        result.status = MutationStatus::NotFound;
        return result;
    }

    result.session = *lookup.session;
    if (result.session.completed) {
        result.status = MutationStatus::Completed;
        return result;
    }
    if (result.session.has_block(block_id)) {
        result.status = MutationStatus::Unchanged;
        return result;
    }

    UploadSession updated = result.session;
    updated.block_ids.push_back(block_id);
    updated.updated_at = now_epoch();

    auto write = compare_and_swap(updated, result.session.version);
    result.status = to_mutation_status(write.status);
    result.error_message = write.error_message;
    if (write.ok()) {
        updated.version = write.version;
        result.session = std::move(updated);
    }
    return result;
}

MutationResult SessionStore::mark_completed(const std::string& upload_id,
                                            uint64_t expected_version) {
    MutationResult result;
    auto lookup = get(upload_id);
    if (!lookup.success) {
        result.status = MutationStatus::Error;
        result.error_message = lookup.error_message;
        return result;
    }
    if (!lookup.session) {
        result.status = MutationStatus::NotFound;
        return result;
    }

    result.session = *lookup.session;
    if (result.session.completed) {
        result.status = MutationStatus::Completed;
        return result;
    }
    if (result.session.version != expected_version) {
        result.status = MutationStatus::Conflict;
        return result;
    }

    UploadSession updated = result.session;
    updated.completed = true;
    updated.updated_at = now_epoch();

    auto write = compare_and_swap(updated, expected_version);
    result.status = to_mutation_status(write.status);
    result.error_message = write.error_message;
    if (write.ok()) {
        updated.version = write.version;
        result.session = std::move(updated);
    }
    return result;
}

SweepResult remove_idle_sessions(SessionStore& store, int64_t cutoff) {
    SweepResult result;
    auto listing = store.list();
    if (!listing.success) {
        result.error_message = listing.error_message;
        return result;
    }

    for (const auto& s : listing.sessions) {
        if (s.updated_at >= cutoff) {
            ++result.remaining;
            continue;
        }
        auto write = store.remove_if_version(s.upload_id, s.version);
        switch (write.status) {
            case WriteStatus::Ok:
                ++result.removed;
                log_info("Expired %s session %s (%s, last updated %s)",
                         s.completed ? "completed" : "incomplete",
                         s.upload_id.c_str(), s.filename.c_str(),
                         format_timestamp(s.updated_at).c_str());
                break;
            case WriteStatus::NotFound:
                break;
            case WriteStatus::Conflict:
                log_debug("Session %s was updated during the sweep, keeping it",
                          s.upload_id.c_str());
                ++result.remaining;
                break;
            default:
                log_error("Failed to expire session %s: %s",
                          s.upload_id.c_str(), write.error_message.c_str());
                ++result.remaining;
                break;
        }
    }
    result.success = true;
    return result;
}

namespace {

// ============================================================================
// FileSessionStore - one JSON file per session
// ============================================================================

class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(const fs::path& dir)
        : dir_(fs::absolute(dir)) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec || !fs::is_directory(dir_)) {
            throw std::runtime_error("Cannot create session directory " + dir_.string() +
                                     ": " + ec.message());
        }
    }

    std::string type_name() const override { return "file"; }

    WriteResult create(const UploadSession& session) override {
        WriteResult result;
        if (!is_valid_upload_id(session.upload_id)) {
            result.error_message = "invalid upload id: " + session.upload_id;
            return result;
        }

        std::lock_guard<std::mutex> lock(stripe(session.upload_id));
        auto path = path_for(session.upload_id);
        if (fs::exists(path)) {
            result.status = WriteStatus::Exists;
            return result;
        }

        UploadSession stored = session;
        stored.version = 1;
        std::string err = write_record(path, stored);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        result.status = WriteStatus::Ok;
        result.version = stored.version;
        return result;
    }

    SessionLookup get(const std::string& upload_id) const override {
        SessionLookup lookup;
        if (!is_valid_upload_id(upload_id)) {
            lookup.success = true;
            return lookup;
        }
        std::string err = read_record(path_for(upload_id), lookup.session);
        lookup.success = err.empty();
        lookup.error_message = err;
        return lookup;
    }

    WriteResult remove(const std::string& upload_id) override {
        WriteResult result;
        if (!is_valid_upload_id(upload_id)) {
            result.status = WriteStatus::Ok;
            return result;
        }

        std::lock_guard<std::mutex> lock(stripe(upload_id));
        std::error_code ec;
        fs::remove(path_for(upload_id), ec);
        if (ec) {
            result.error_message = "Failed to remove session: " + ec.message();
            return result;
        }
        result.status = WriteStatus::Ok;
        return result;
    }

    WriteResult remove_if_version(const std::string& upload_id,
                                  uint64_t expected_version) override {
        WriteResult result;
        if (!is_valid_upload_id(upload_id)) {
            result.status = WriteStatus::NotFound;
            return result;
        }

        std::lock_guard<std::mutex> lock(stripe(upload_id));
        auto path = path_for(upload_id);
        std::optional<UploadSession> current;
        std::string err = read_record(path, current);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        if (!current) {
            result.status = WriteStatus::NotFound;
            return result;
        }
        if (current->version != expected_version) {
            result.status = WriteStatus::Conflict;
            return result;
        }

        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            result.error_message = "Failed to remove session: " + ec.message();
            return result;
        }
        result.status = WriteStatus::Ok;
        return result;
    }

    WriteResult compare_and_swap(const UploadSession& session,
                                 uint64_t expected_version) override {
        WriteResult result;
        if (!is_valid_upload_id(session.upload_id)) {
            result.status = WriteStatus::NotFound;
            return result;
        }

        std::lock_guard<std::mutex> lock(stripe(session.upload_id));
        auto path = path_for(session.upload_id);

        std::optional<UploadSession> current;
        std::string err = read_record(path, current);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        if (!current) {
            result.status = WriteStatus::NotFound;
            return result;
        }
        if (current->version != expected_version) {
            result.status = WriteStatus::Conflict;
            return result;
        }

        UploadSession stored = session;
        stored.version = expected_version + 1;
        err = write_record(path, stored);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        result.status = WriteStatus::Ok;
        result.version = stored.version;
        return result;
    }

    SessionList list() const override {
        SessionList result;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir_, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
            std::optional<UploadSession> session;
            std::string err = read_record(entry.path(), session);
            if (!err.empty()) {
                log_warn("Skipping unreadable session record %s: %s",
                         entry.path().c_str(), err.c_str());
                continue;
            }
            if (session) result.sessions.push_back(std::move(*session));
        }
        if (ec) {
            result.error_message = "Failed to list sessions: " + ec.message();
            return result;
        }
        result.success = true;
        return result;
    }

    bool is_healthy() const override {
        std::error_code ec;
        return fs::is_directory(dir_, ec);
    }

private:
    static constexpr size_t STRIPES = 64;

    fs::path dir_;
    mutable std::array<std::mutex, STRIPES> stripes_;

    std::mutex& stripe(const std::string& upload_id) const {
        return stripes_[std::hash<std::string>{}(upload_id) % STRIPES];
    }

    fs::path path_for(const std::string& upload_id) const {
        return dir_ / (upload_id + ".json");
    }

    // Absent file is not an error: `out` stays empty.
    static std::string read_record(const fs::path& path, std::optional<UploadSession>& out) {
        out.reset();
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::error_code ec;
            if (!fs::exists(path, ec)) return {};
            return "Failed to open " + path.string();
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        out = UploadSession::from_json(ss.str());
        if (!out) return "Corrupt session record " + path.string();
        return {};
    }

    // Temp file + rename so readers never see a partial record
    static std::string write_record(const fs::path& path, const UploadSession& session) {
        auto temp_path = path.string() + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) return "Failed to create " + temp_path;
            file << session.to_json();
            file.flush();
            if (!file) {
                file.close();
                std::error_code ec;
                fs::remove(temp_path, ec);
                return "Failed to write " + temp_path;
            }
        }
        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            return "Failed to rename session record: " + ec.message();
        }
        return {};
    }
};

// ============================================================================
// SqliteSessionStore - single-file store, conditional UPDATE on version
// ============================================================================

constexpr const char* SESSION_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS upload_sessions (
    upload_id TEXT PRIMARY KEY,
    version INTEGER NOT NULL,
    completed INTEGER NOT NULL DEFAULT 0,
    updated_at INTEGER NOT NULL,
    record TEXT NOT NULL
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_sessions_updated
    ON upload_sessions(updated_at);
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

class SqliteSessionStore : public SessionStore {
public:
    explicit SqliteSessionStore(const fs::path& db_path) {
        std::error_code ec;
        if (db_path.has_parent_path()) fs::create_directories(db_path.parent_path(), ec);

        int rc = sqlite3_open(db_path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            close();
            throw std::runtime_error("Cannot open session database " + db_path.string() + ": " + msg);
        }

        // WAL mode for concurrent readers
        sql_exec(db_, "PRAGMA journal_mode=WAL");
        sql_exec(db_, "PRAGMA synchronous=NORMAL");
        sql_exec(db_, "PRAGMA busy_timeout=5000");
        if (!sql_exec(db_, SESSION_SCHEMA)) {
            close();
            throw std::runtime_error("Cannot create session schema in " + db_path.string());
        }

        prepare(&stmt_insert_,
            "INSERT INTO upload_sessions (upload_id, version, completed, updated_at, record) "
            "VALUES (?1, ?2, ?3, ?4, ?5)");
        prepare(&stmt_get_,
            "SELECT version, record FROM upload_sessions WHERE upload_id = ?1");
        prepare(&stmt_cas_,
            "UPDATE upload_sessions SET version = ?2, completed = ?3, updated_at = ?4, record = ?5 "
            "WHERE upload_id = ?1 AND version = ?6");
        prepare(&stmt_delete_,
            "DELETE FROM upload_sessions WHERE upload_id = ?1");
        prepare(&stmt_delete_if_,
            "DELETE FROM upload_sessions WHERE upload_id = ?1 AND version = ?2");
        prepare(&stmt_list_,
            "SELECT version, record FROM upload_sessions ORDER BY updated_at ASC");
    }

    ~SqliteSessionStore() override { close(); }

    std::string type_name() const override { return "sqlite"; }

    WriteResult create(const UploadSession& session) override {
        WriteResult result;
        UploadSession stored = session;
        stored.version = 1;
        std::string record = stored.to_json();

        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_insert_);
        sqlite3_bind_text(stmt_insert_, 1, stored.upload_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_, 2, static_cast<int64_t>(stored.version));
        sqlite3_bind_int(stmt_insert_, 3, stored.completed ? 1 : 0);
        sqlite3_bind_int64(stmt_insert_, 4, stored.updated_at);
        sqlite3_bind_text(stmt_insert_, 5, record.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sql_step_retry(stmt_insert_);
        if (rc == SQLITE_DONE) {
            result.status = WriteStatus::Ok;
            result.version = stored.version;
        } else if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            result.status = WriteStatus::Exists;
        } else {
            result.error_message = std::string("insert failed: ") + sqlite3_errmsg(db_);
        }
        sqlite3_reset(stmt_insert_);
        return result;
    }

    SessionLookup get(const std::string& upload_id) const override {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return get_locked(upload_id);
    }

    WriteResult remove(const std::string& upload_id) override {
        WriteResult result;
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_delete_);
        sqlite3_bind_text(stmt_delete_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sql_step_retry(stmt_delete_);
        if (rc == SQLITE_DONE) {
            result.status = WriteStatus::Ok;
        } else {
            result.error_message = std::string("delete failed: ") + sqlite3_errmsg(db_);
        }
        sqlite3_reset(stmt_delete_);
        return result;
    }

    WriteResult remove_if_version(const std::string& upload_id,
                                  uint64_t expected_version) override {
        WriteResult result;
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_delete_if_);
        sqlite3_bind_text(stmt_delete_if_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_delete_if_, 2, static_cast<int64_t>(expected_version));
        int rc = sql_step_retry(stmt_delete_if_);
        sqlite3_reset(stmt_delete_if_);
        if (rc != SQLITE_DONE) {
            result.error_message = std::string("delete failed: ") + sqlite3_errmsg(db_);
            return result;
        }
        if (sqlite3_changes(db_) == 1) {
            result.status = WriteStatus::Ok;
            return result;
        }

        auto lookup = get_locked(upload_id);
        if (!lookup.success) {
            result.error_message = lookup.error_message;
        } else {
            result.status = lookup.session ? WriteStatus::Conflict : WriteStatus::NotFound;
        }
        return result;
    }

    WriteResult compare_and_swap(const UploadSession& session,
                                 uint64_t expected_version) override {
        WriteResult result;
        UploadSession stored = session;
        stored.version = expected_version + 1;
        std::string record = stored.to_json();

        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_cas_);
        sqlite3_bind_text(stmt_cas_, 1, stored.upload_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_cas_, 2, static_cast<int64_t>(stored.version));
        sqlite3_bind_int(stmt_cas_, 3, stored.completed ? 1 : 0);
        sqlite3_bind_int64(stmt_cas_, 4, stored.updated_at);
        sqlite3_bind_text(stmt_cas_, 5, record.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_cas_, 6, static_cast<int64_t>(expected_version));

        int rc = sql_step_retry(stmt_cas_);
        sqlite3_reset(stmt_cas_);
        if (rc != SQLITE_DONE) {
            result.error_message = std::string("update failed: ") + sqlite3_errmsg(db_);
            return result;
        }

        if (sqlite3_changes(db_) == 1) {
            result.status = WriteStatus::Ok;
            result.version = stored.version;
            return result;
        }

        // No row matched: tell a missing session from a stale version
        auto lookup = get_locked(stored.upload_id);
        if (!lookup.success) {
            result.error_message = lookup.error_message;
        } else {
            result.status = lookup.session ? WriteStatus::Conflict : WriteStatus::NotFound;
        }
        return result;
    }

    SessionList list() const override {
        SessionList result;
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_list_);
        int rc;
        while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
            auto session = row_to_session(stmt_list_);
            if (session) result.sessions.push_back(std::move(*session));
        }
        sqlite3_reset(stmt_list_);
        if (rc != SQLITE_DONE) {
            result.error_message = std::string("list failed: ") + sqlite3_errmsg(db_);
            return result;
        }
        result.success = true;
        return result;
    }

    bool is_healthy() const override {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return db_ != nullptr;
    }

private:
    mutable std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_cas_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_delete_if_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;

    void prepare(sqlite3_stmt** stmt, const char* sql) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            close();
            throw std::runtime_error("Cannot prepare statement: " + msg);
        }
    }

    void close() {
        for (sqlite3_stmt** stmt : {&stmt_insert_, &stmt_get_, &stmt_cas_, &stmt_delete_,
                                     &stmt_delete_if_, &stmt_list_}) {
            if (*stmt) sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
        if (db_) {
            sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    // The version column is authoritative over the copy inside the record
    static std::optional<UploadSession> row_to_session(sqlite3_stmt* stmt) {
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (!text) return std::nullopt;
        auto session = UploadSession::from_json(text);
        if (session) session->version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        return session;
    }

    SessionLookup get_locked(const std::string& upload_id) const {
        SessionLookup lookup;
        sqlite3_reset(stmt_get_);
        sqlite3_bind_text(stmt_get_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sql_step_retry(stmt_get_);
        if (rc == SQLITE_ROW) {
            lookup.session = row_to_session(stmt_get_);
            if (!lookup.session) {
                lookup.error_message = "Corrupt session record " + upload_id;
            } else {
                lookup.success = true;
            }
        } else if (rc == SQLITE_DONE) {
            lookup.success = true;
        } else {
            lookup.error_message = std::string("select failed: ") + sqlite3_errmsg(db_);
        }
        sqlite3_reset(stmt_get_);
        return lookup;
    }
};

// ============================================================================
// KvSessionStore - Consul-style HTTP key/value API
// ============================================================================

// GET/PUT/DELETE <endpoint>/v1/kv/<prefix><upload_id>
// Conditional writes use ?cas=<ModifyIndex>; ?cas=0 creates only if absent.
class KvSessionStore : public SessionStore {
public:
    struct Config {
        std::string endpoint;
        std::string prefix = "blobup/sessions/";
        std::string token;
        bool verify_ssl = true;
        std::string ca_bundle;
        int timeout_secs = 10;
    };

    explicit KvSessionStore(const Config& config)
        : config_(config) {
        while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
            config_.endpoint.pop_back();
        }
        net::HttpClientConfig http_config;
        http_config.user_agent = "blobup-kv/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_config.ca_bundle = config_.ca_bundle;
        http_config.default_connect_timeout = std::chrono::seconds(config_.timeout_secs);
        http_config.default_total_timeout = std::chrono::seconds(config_.timeout_secs);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "kv"; }

    WriteResult create(const UploadSession& session) override {
        WriteResult result;
        if (!is_valid_upload_id(session.upload_id)) {
            result.error_message = "invalid upload id: " + session.upload_id;
            return result;
        }

        UploadSession stored = session;
        stored.version = 1;
        auto response = execute(net::HttpRequest::put(key_url(stored.upload_id) + "?cas=0",
                                                      stored.to_json()));
        if (!response.ok()) {
            result.error_message = "kv put failed: " + response.describe();
            return result;
        }
        if (trimmed_body(response) != "true") {
            result.status = WriteStatus::Exists;
            return result;
        }
        result.status = WriteStatus::Ok;
        result.version = stored.version;
        return result;
    }

    SessionLookup get(const std::string& upload_id) const override {
        SessionLookup lookup;
        if (!is_valid_upload_id(upload_id)) {
            lookup.success = true;
            return lookup;
        }
        uint64_t modify_index = 0;
        std::string err = fetch(upload_id, lookup.session, modify_index);
        lookup.success = err.empty();
        lookup.error_message = err;
        return lookup;
    }

    WriteResult remove(const std::string& upload_id) override {
        WriteResult result;
        if (!is_valid_upload_id(upload_id)) {
            result.status = WriteStatus::Ok;
            return result;
        }
        auto response = execute(net::HttpRequest::del(key_url(upload_id)));
        if (!response.ok() && response.status_code != 404) {
            result.error_message = "kv delete failed: " + response.describe();
            return result;
        }
        result.status = WriteStatus::Ok;
        return result;
    }

    WriteResult remove_if_version(const std::string& upload_id,
                                  uint64_t expected_version) override {
        WriteResult result;
        if (!is_valid_upload_id(upload_id)) {
            result.status = WriteStatus::NotFound;
            return result;
        }

        std::optional<UploadSession> current;
        uint64_t modify_index = 0;
        std::string err = fetch(upload_id, current, modify_index);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        if (!current) {
            result.status = WriteStatus::NotFound;
            return result;
        }
        if (current->version != expected_version) {
            result.status = WriteStatus::Conflict;
            return result;
        }

        auto url = key_url(upload_id) + "?cas=" + std::to_string(modify_index);
        auto response = execute(net::HttpRequest::del(url));
        if (!response.ok()) {
            result.error_message = "kv delete failed: " + response.describe();
            return result;
        }
        result.status = trimmed_body(response) == "true" ? WriteStatus::Ok : WriteStatus::Conflict;
        return result;
    }

    WriteResult compare_and_swap(const UploadSession& session,
                                 uint64_t expected_version) override {
        WriteResult result;
        if (!is_valid_upload_id(session.upload_id)) {
            result.status = WriteStatus::NotFound;
            return result;
        }

        std::optional<UploadSession> current;
        uint64_t modify_index = 0;
        std::string err = fetch(session.upload_id, current, modify_index);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        if (!current) {
            result.status = WriteStatus::NotFound;
            return result;
        }
        if (current->version != expected_version) {
            result.status = WriteStatus::Conflict;
            return result;
        }

        // The ModifyIndex guard rejects any write that landed since the read
        UploadSession stored = session;
        stored.version = expected_version + 1;
        auto url = key_url(stored.upload_id) + "?cas=" + std::to_string(modify_index);
        auto response = execute(net::HttpRequest::put(url, stored.to_json()));
        if (!response.ok()) {
            result.error_message = "kv put failed: " + response.describe();
            return result;
        }
        if (trimmed_body(response) != "true") {
            result.status = WriteStatus::Conflict;
            return result;
        }
        result.status = WriteStatus::Ok;
        result.version = stored.version;
        return result;
    }

    SessionList list() const override {
        SessionList result;
        // Keep the trailing '/' so sibling prefixes do not match
        std::string prefix_path = net::url_encode_path(config_.prefix);
        if (!config_.prefix.empty() && config_.prefix.back() == '/') prefix_path += '/';
        auto response = execute(net::HttpRequest::get(
            config_.endpoint + "/v1/kv/" + prefix_path + "?recurse=true"));
        if (response.status_code == 404) {
            result.success = true;
            return result;
        }
        if (!response.ok()) {
            result.error_message = "kv list failed: " + response.describe();
            return result;
        }

        auto entries = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (!entries.is_array()) {
            result.error_message = "kv list returned malformed JSON";
            return result;
        }
        for (const auto& entry : entries) {
            auto session = decode_entry(entry);
            if (session) result.sessions.push_back(std::move(*session));
        }
        result.success = true;
        return result;
    }

    bool is_healthy() const override {
        auto response = execute(net::HttpRequest::get(config_.endpoint + "/v1/status/leader"));
        return response.ok();
    }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;

    std::string key_url(const std::string& upload_id) const {
        return config_.endpoint + "/v1/kv/" + net::url_encode_path(config_.prefix + upload_id);
    }

    net::HttpResponse execute(net::HttpRequest request) const {
        if (!config_.token.empty()) {
            request.headers.set("X-Consul-Token", config_.token);
        }
        return http_client_->execute(request);
    }

    static std::string trimmed_body(const net::HttpResponse& response) {
        std::string body = response.body_string();
        while (!body.empty() && (body.back() == '\n' || body.back() == ' ')) body.pop_back();
        return body;
    }

    static std::optional<UploadSession> decode_entry(const nlohmann::json& entry) {
        if (!entry.is_object() || !entry.contains("Value") || !entry["Value"].is_string()) {
            return std::nullopt;
        }
        auto raw = net::base64_decode(entry["Value"].get<std::string>());
        return UploadSession::from_json(std::string(raw.begin(), raw.end()));
    }

    std::string fetch(const std::string& upload_id, std::optional<UploadSession>& out,
                      uint64_t& modify_index) const {
        out.reset();
        auto response = execute(net::HttpRequest::get(key_url(upload_id)));
        if (response.status_code == 404) return {};
        if (!response.ok()) return "kv get failed: " + response.describe();

        auto entries = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (!entries.is_array() || entries.empty()) return "kv get returned malformed JSON";

        const auto& entry = entries[0];
        modify_index = entry.value("ModifyIndex", uint64_t(0));
        out = decode_entry(entry);
        if (!out) return "Corrupt session record " + upload_id;
        return {};
    }
};

std::string require_param(const std::map<std::string, std::string>& params,
                          const std::string& type, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        throw std::runtime_error("Session store '" + type + "' requires '" + key + "' config");
    }
    return it->second;
}

}  // namespace

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<SessionStore> SessionStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "file") {
        return std::make_unique<FileSessionStore>(require_param(params, type, "path"));
    }

    if (type == "sqlite") {
        return std::make_unique<SqliteSessionStore>(require_param(params, type, "path"));
    }

    if (type == "kv") {
        KvSessionStore::Config kv_config;
        kv_config.endpoint = require_param(params, type, "endpoint");

        auto it = params.find("prefix");
        if (it != params.end()) {
            kv_config.prefix = it->second;
            if (!kv_config.prefix.empty() && kv_config.prefix.back() != '/') {
                kv_config.prefix += '/';
            }
        }
        if ((it = params.find("token")) != params.end()) kv_config.token = it->second;
        if ((it = params.find("ca_bundle")) != params.end()) kv_config.ca_bundle = it->second;
        if ((it = params.find("verify_ssl")) != params.end()) {
            kv_config.verify_ssl = (it->second == "true" || it->second == "1");
        }
        if ((it = params.find("timeout")) != params.end()) {
            try {
                kv_config.timeout_secs = std::stoi(it->second);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid kv timeout: " + it->second);
            }
        }
        return std::make_unique<KvSessionStore>(kv_config);
    }

    throw std::runtime_error("Unknown session store type: " + type);
}

}  // namespace blobup
