#include "blobup/upload_service.hpp"

#include "blobup/blob_backend.hpp"
#include "blobup/constants.hpp"
#include "blobup/log.hpp"
#include "blobup/metrics.hpp"
#include "blobup/session_store.hpp"
#include "blobup/upload_coordinator.hpp"
#include "blobup/worker_pool.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <optional>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

namespace blobup {

namespace {

using nlohmann::json;

// Buffered reader/writer over a connected stream socket.
class Connection {
public:
    explicit Connection(int fd) : fd_(fd) {}
    ~Connection() { close(fd_); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    enum class ReadStatus { Ok, Closed, TooLong, Error };

    // Read up to '\n' (stripped, along with a trailing '\r').
    ReadStatus read_line(std::string& line, size_t max_len) {
        line.clear();
        while (true) {
            if (pos_ == len_ && !fill()) {
                return line.empty() ? ReadStatus::Closed : ReadStatus::Error;
            }
            if (pos_ == len_) continue;
            char c = buf_[pos_++];
            if (c == '\n') {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return ReadStatus::Ok;
            }
            if (line.size() >= max_len) return ReadStatus::TooLong;
            line.push_back(c);
        }
    }

    bool read_exact(std::vector<uint8_t>& out, size_t n) {
        out.resize(n);
        size_t got = 0;
        while (got < n) {
            if (pos_ == len_ && !fill()) return false;
            size_t take = std::min(n - got, len_ - pos_);
            memcpy(out.data() + got, buf_ + pos_, take);
            pos_ += take;
            got += take;
        }
        return true;
    }

    bool write_line(const std::string& line) {
        std::string out = line + "\n";
        size_t sent = 0;
        while (sent < out.size()) {
            ssize_t n = send(fd_, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

private:
    // Returns false on EOF, timeout or error
    bool fill() {
        while (true) {
            ssize_t n = read(fd_, buf_, sizeof(buf_));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            pos_ = 0;
            len_ = static_cast<size_t>(n);
            return true;
        }
    }

    int fd_;
    char buf_[64 * 1024];
    size_t pos_ = 0;
    size_t len_ = 0;
};

bool parse_uint64(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

// Split at single spaces into at most `max_parts` pieces; the last piece
// keeps any remaining spaces (filenames may contain them).
std::vector<std::string> split_request(const std::string& line, size_t max_parts) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= line.size() && parts.size() + 1 < max_parts) {
        size_t sp = line.find(' ', start);
        if (sp == std::string::npos) break;
        parts.push_back(line.substr(start, sp - start));
        start = sp + 1;
    }
    if (start <= line.size()) parts.push_back(line.substr(start));
    return parts;
}

std::string ok_response(const json& body) {
    return "OK " + body.dump();
}

std::string error_response(UploadError error, const std::string& message) {
    json body;
    body["error"] = error_code_name(error);
    body["message"] = message;
    body["retryable"] = is_retryable(error);
    return "ERROR " + body.dump();
}

std::string invalid_request(const std::string& message) {
    return error_response(UploadError::InvalidArgument, message);
}

json session_json(const SessionView& view) {
    const auto& s = view.session;
    json j;
    j["upload_id"] = s.upload_id;
    j["filename"] = s.filename;
    j["object_name"] = s.object_name;
    j["file_size"] = s.file_size;
    j["chunk_size"] = s.chunk_size;
    j["chunks_received"] = s.block_ids.size();
    j["expected_chunks"] = s.expected_chunks();
    j["block_ids"] = s.block_ids;
    j["progress_percentage"] = view.progress;
    j["completed"] = s.completed;
    j["created_at"] = s.created_at;
    j["updated_at"] = s.updated_at;
    return j;
}

}  // namespace

UploadService::UploadService(const ServiceConfig& config)
    : config_(config) {}

UploadService::~UploadService() {
    stop();
}

std::string UploadService::start() {
    std::error_code ec;
    std::filesystem::create_directories(config_.state_dir, ec);
    if (ec) return "Failed to create state_dir: " + ec.message();

    try {
        store_ = SessionStoreFactory::create(config_.store.type, config_.store.params);
    } catch (const std::exception& e) {
        return std::string("Failed to create session store: ") + e.what();
    }
    try {
        backend_ = BlobBackendFactory::create(config_.backend.type, config_.backend.params);
    } catch (const std::exception& e) {
        return std::string("Failed to create blob backend: ") + e.what();
    }

    auto container = backend_->ensure_container();
    if (!container.success) {
        log_warn("Could not create destination container (%s): %s",
                 backend_->type_name().c_str(), container.error_message.c_str());
    }

    if (!store_->is_healthy()) {
        log_warn("Session store (%s) failed its health check", store_->type_name().c_str());
    }
    if (!backend_->is_healthy()) {
        log_warn("Blob backend (%s) failed its health check", backend_->type_name().c_str());
    }

    CoordinatorConfig coord;
    coord.chunk_size = config_.chunk_size;
    coord.max_file_size = config_.max_file_size;
    coord.retry.max_attempts = config_.retry_attempts;
    coord.retry.base_delay = std::chrono::milliseconds(config_.retry_base_delay_ms);
    coord.cas_max_attempts = config_.cas_max_attempts;
    coord.order_blocks_by_index = config_.order_blocks_by_index;
    coordinator_ = std::make_unique<UploadCoordinator>(*store_, *backend_, coord);

    if (!config_.metrics_file.empty()) {
        std::filesystem::create_directories(config_.metrics_file.parent_path(), ec);
        metrics_ = std::make_unique<MetricsExporter>(
            config_.metrics_file,
            std::chrono::seconds(config_.metrics_interval_secs),
            std::map<std::string, std::string>{{"socket", config_.socket_path.string()}});
        coordinator_->set_metrics(metrics_.get());
    }

    // Bind before returning so clients can connect as soon as start() succeeds
    const auto& sock_path = config_.socket_path;
    if (sock_path.native().size() >= sizeof(sockaddr_un::sun_path)) {
        return "socket path too long: " + sock_path.string();
    }
    if (sock_path.has_parent_path()) {
        std::filesystem::create_directories(sock_path.parent_path(), ec);
    }
    unlink(sock_path.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        return std::string("Failed to create socket: ") + strerror(errno);
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::string("Failed to bind socket: ") + strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        return err;
    }
    if (listen(server_fd_, 128) < 0) {
        std::string err = std::string("Failed to listen on socket: ") + strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        return err;
    }
    chmod(sock_path.c_str(), 0660);

    running_ = true;

    workers_ = std::make_unique<WorkerPool>(config_.worker_threads);
    if (metrics_) metrics_->start();

    server_thread_ = std::thread(&UploadService::server_loop, this);
    if (config_.session_ttl_secs > 0) {
        sweeper_thread_ = std::thread(&UploadService::sweeper_loop, this);
    }
    if (config_.stats_interval_secs > 0) {
        stats_thread_ = std::thread(&UploadService::stats_reporter_loop, this);
    }

    log_info("Upload service listening on %s (store=%s, backend=%s, workers=%zu)",
             sock_path.c_str(), store_->type_name().c_str(),
             backend_->type_name().c_str(), config_.worker_threads);
    return {};
}

void UploadService::stop() {
    if (!running_.exchange(false)) return;

    log_info("Shutting down upload service...");

    {
        std::lock_guard lock(sleep_mutex_);
    }
    sleep_cv_.notify_all();

    // Close listening socket to unblock accept()
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
        unlink(config_.socket_path.c_str());
    }

    if (server_thread_.joinable()) server_thread_.join();
    if (sweeper_thread_.joinable()) sweeper_thread_.join();
    if (stats_thread_.joinable()) stats_thread_.join();

    // In-flight requests finish and answer; idle reads return EOF
    {
        std::lock_guard lock(clients_mutex_);
        for (int fd : client_fds_) shutdown(fd, SHUT_RD);
    }
    if (workers_) workers_->shutdown(true);

    if (metrics_) metrics_->stop();

    {
        std::lock_guard lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    log_info("Upload service stopped");
}

void UploadService::wait() {
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return !running_.load(); });
}

// --- Request server ---

void UploadService::server_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("Accept failed: %s", strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        struct timeval tv;
        tv.tv_sec = constants::CLIENT_READ_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard lock(stats_mutex_);
            stats_.connections++;
        }

        if (!workers_->execute([this, client_fd]() { serve_connection(client_fd); })) {
            close(client_fd);
        }
    }
}

void UploadService::serve_connection(int client_fd) {
    Connection conn(client_fd);
    {
        std::lock_guard lock(clients_mutex_);
        client_fds_.insert(client_fd);
    }
    if (metrics_) metrics_->connections_active().Increment();

    std::string line;
    std::vector<uint8_t> payload;
    while (running_.load(std::memory_order_relaxed)) {
        auto status = conn.read_line(line, constants::MAX_REQUEST_LINE);
        if (status == Connection::ReadStatus::Closed) break;
        if (status == Connection::ReadStatus::TooLong) {
            conn.write_line(invalid_request("Request line too long"));
            break;
        }
        if (status != Connection::ReadStatus::Ok) break;
        if (line.empty()) continue;

        payload.clear();
        if (line.compare(0, 6, "CHUNK ") == 0) {
            // The length must be known before the body can be skipped, so a
            // bad header ends the connection
            auto parts = split_request(line, 4);
            uint64_t length = 0;
            if (parts.size() != 4 || !parse_uint64(parts[3], length)) {
                conn.write_line(invalid_request("Usage: CHUNK <upload_id> <chunk_index> <length>"));
                break;
            }
            if (length > config_.chunk_size) {
                conn.write_line(invalid_request(
                    "Chunk length " + std::to_string(length) +
                    " exceeds chunk size " + std::to_string(config_.chunk_size)));
                break;
            }
            if (!conn.read_exact(payload, static_cast<size_t>(length))) {
                log_warn("Client disconnected mid-chunk (%s)", line.c_str());
                break;
            }
        }

        auto response = handle_request(line, payload);
        if (!conn.write_line(response)) break;
    }

    if (metrics_) metrics_->connections_active().Decrement();
    std::lock_guard lock(clients_mutex_);
    client_fds_.erase(client_fd);
}

std::string UploadService::handle_request(const std::string& line,
                                          std::span<const uint8_t> payload) {
    auto start = std::chrono::steady_clock::now();
    auto parts = split_request(line, 2);
    const std::string command = parts.empty() ? std::string() : parts[0];

    std::string response;
    if (command == "INIT") {
        auto args = split_request(line, 3);
        uint64_t size = 0;
        if (args.size() != 3 || args[2].empty() || !parse_uint64(args[1], size)) {
            response = invalid_request("Usage: INIT <declared_size> <filename>");
        } else {
            auto r = coordinator_->init_upload(args[2], size);
            if (!r.ok()) {
                response = error_response(r.error, r.message);
            } else {
                json j;
                j["upload_id"] = r.upload_id;
                j["object_name"] = r.object_name;
                j["chunk_size"] = r.chunk_size;
                response = ok_response(j);
            }
        }
    } else if (command == "CHUNK") {
        auto args = split_request(line, 4);
        int64_t index = 0;
        uint64_t length = 0;
        if (args.size() != 4 || !parse_int64(args[2], index) || !parse_uint64(args[3], length)) {
            response = invalid_request("Usage: CHUNK <upload_id> <chunk_index> <length>");
        } else if (length != payload.size()) {
            response = invalid_request("Chunk length does not match payload");
        } else {
            auto r = coordinator_->stage_chunk(args[1], index, payload);
            if (!r.ok()) {
                response = error_response(r.error, r.message);
            } else {
                json j;
                j["upload_id"] = args[1];
                j["chunk_index"] = index;
                j["block_id"] = r.block_id;
                j["progress_percentage"] = r.progress;
                j["recorded"] = r.newly_recorded;
                response = ok_response(j);
            }
        }
    } else if (command == "COMPLETE") {
        if (parts.size() != 2 || parts[1].empty()) {
            response = invalid_request("Usage: COMPLETE <upload_id>");
        } else {
            auto r = coordinator_->complete_upload(parts[1]);
            if (!r.ok()) {
                response = error_response(r.error, r.message);
            } else {
                json j;
                j["upload_id"] = r.upload_id;
                j["filename"] = r.filename;
                j["object_name"] = r.object_name;
                j["file_size"] = r.file_size;
                j["blocks_count"] = r.block_count;
                response = ok_response(j);
            }
        }
    } else if (command == "STATUS" || command == "RESUME") {
        if (parts.size() != 2 || parts[1].empty()) {
            response = invalid_request("Usage: " + command + " <upload_id>");
        } else {
            auto view = command == "STATUS" ? coordinator_->get_status(parts[1])
                                            : coordinator_->resume_upload(parts[1]);
            if (!view.ok()) {
                response = error_response(view.error, view.message);
            } else {
                auto j = session_json(view);
                if (command == "RESUME") j["missing_chunks"] = view.missing_chunks;
                response = ok_response(j);
            }
        }
    } else if (command == "CANCEL") {
        if (parts.size() != 2 || parts[1].empty()) {
            response = invalid_request("Usage: CANCEL <upload_id>");
        } else {
            auto r = coordinator_->cancel_upload(parts[1]);
            if (!r.ok()) {
                response = error_response(r.error, r.message);
            } else {
                json j;
                j["upload_id"] = parts[1];
                j["cancelled"] = true;
                response = ok_response(j);
            }
        }
    } else if (command == "CONFIG" && parts.size() == 1) {
        auto limits = coordinator_->limits();
        json j;
        j["chunk_size"] = limits.chunk_size;
        j["max_file_size"] = limits.max_file_size;
        response = ok_response(j);
    } else {
        response = invalid_request("Unknown command: " + (command.empty() ? line : command));
    }

    bool ok = response.compare(0, 3, "OK ") == 0;
    {
        std::lock_guard lock(stats_mutex_);
        stats_.requests++;
        if (!ok) stats_.request_errors++;
    }
    if (metrics_) {
        static const char* known[] = {"INIT", "CHUNK", "COMPLETE", "STATUS", "RESUME", "CANCEL", "CONFIG"};
        std::string label = "unknown";
        for (const char* k : known) {
            if (command == k) label = k;
        }
        metrics_->record_request(label, ok);
        metrics_->request_duration().Observe(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
    }
    return response;
}

// --- Retention ---

size_t UploadService::sweep_expired(int64_t now) {
    if (config_.session_ttl_secs <= 0) return 0;

    auto sweep = remove_idle_sessions(*store_, now - config_.session_ttl_secs);
    if (!sweep.success) {
        log_error("Retention sweep failed to list sessions: %s", sweep.error_message.c_str());
        return 0;
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.sessions_expired += sweep.removed;
        stats_.active_sessions = sweep.remaining;
    }
    if (metrics_) {
        metrics_->sessions_expired().Increment(static_cast<double>(sweep.removed));
        metrics_->set_active_sessions(sweep.remaining);
    }
    return sweep.removed;
}

void UploadService::sweeper_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        sweep_expired(now_epoch());
        interruptible_sleep(config_.sweep_interval_secs);
    }
}

void UploadService::interruptible_sleep(int64_t secs) {
    std::unique_lock lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, std::chrono::seconds(secs), [this] { return !running_.load(); });
}

// --- Stats ---

UploadService::Stats UploadService::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void UploadService::stats_reporter_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        interruptible_sleep(static_cast<int64_t>(config_.stats_interval_secs));
        if (!running_.load()) break;

        auto c = coordinator_->get_stats();
        auto s = get_stats();
        log_info("[stats] sessions: %lu created, %lu completed, %lu cancelled, %lu expired, "
                 "%lu active | chunks: %lu ok, %lu fail, %.1f MB, %lu retries | commits: %lu fail | "
                 "cas conflicts: %lu | requests: %lu (%lu errors), %zu busy workers",
                 c.sessions_created, c.sessions_completed, c.sessions_cancelled,
                 s.sessions_expired, s.active_sessions,
                 c.chunks_staged, c.chunks_failed,
                 static_cast<double>(c.bytes_staged) / (1024.0 * 1024),
                 c.stage_retries, c.commits_failed, c.cas_conflicts,
                 s.requests, s.request_errors, workers_->active());
    }
}

}  // namespace blobup
