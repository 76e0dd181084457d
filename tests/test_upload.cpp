// Test suite for the blobup upload core.
//
// Tests:
//   1. Session model: progress, expected/missing chunks, JSON record
//   2. Upload and block ids
//   3. Blob name sanitization
//   4. HTTP client: headers, bodies, size cap, timeouts, encoding helpers
//   5. Session store conformance (file, sqlite, kv), including concurrent appends
//      - kv against an in-process Consul-style HTTP service
//      - retention sweep racing a late write
//   6. UploadCoordinator against a scripted fault-injecting backend
//      - init/stage/complete lifecycle
//      - stage retry with backoff, retry exhaustion
//      - idempotent staging
//      - completion and cancellation racing a stage
//      - commit ordering and commit failure

#include "blobup/blob_backend.hpp"
#include "blobup/constants.hpp"
#include "blobup/http.hpp"
#include "blobup/session_store.hpp"
#include "blobup/upload_coordinator.hpp"
#include "blobup/upload_session.hpp"
#include "loopback_http.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace blobup;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/// In-memory backend with scripted failures and hooks.
///
/// Hooks run outside the backend lock so they may call back into the
/// coordinator.
class ScriptedBlobBackend : public BlobBackend {
public:
    std::string type_name() const override { return "scripted"; }

    BlobResult stage_block(const std::string& object_name,
                           const std::string& block_id,
                           std::span<const uint8_t> data) override {
        std::function<void()> hook;
        {
            std::lock_guard lock(mutex_);
            ++stage_calls_;
            std::swap(hook, stage_hook_);
        }
        if (hook) hook();

        std::lock_guard lock(mutex_);
        if (stage_failures_ > 0) {
            --stage_failures_;
            return {false, 503, "injected stage failure"};
        }
        staged_[object_name][block_id] = std::string(data.begin(), data.end());
        return {true, 201, {}};
    }

    BlobResult commit_block_list(const std::string& object_name,
                                 const std::vector<std::string>& block_ids) override {
        std::function<void()> hook;
        {
            std::lock_guard lock(mutex_);
            ++commit_calls_;
            std::swap(hook, commit_hook_);
        }
        if (hook) hook();

        std::lock_guard lock(mutex_);
        if (commit_failures_ > 0) {
            --commit_failures_;
            return {false, 500, "injected commit failure"};
        }
        std::string content;
        for (const auto& id : block_ids) {
            auto it = staged_[object_name].find(id);
            if (it == staged_[object_name].end()) {
                return {false, 400, "InvalidBlockList"};
            }
            content += it->second;
        }
        objects_[object_name] = content;
        commits_.push_back(block_ids);
        return {true, 201, {}};
    }

    BlobResult delete_object(const std::string& object_name) override {
        std::lock_guard lock(mutex_);
        objects_.erase(object_name);
        return {true, 202, {}};
    }

    PropertiesResult get_object_properties(const std::string& object_name) const override {
        std::lock_guard lock(mutex_);
        PropertiesResult r;
        r.success = true;
        auto it = objects_.find(object_name);
        if (it != objects_.end()) {
            r.found = true;
            r.properties.size = it->second.size();
        }
        return r;
    }

    bool is_healthy() const override { return true; }

    uint64_t max_block_count() const override {
        std::lock_guard lock(mutex_);
        return max_blocks_;
    }

    // --- Scripting ---

    void set_max_blocks(uint64_t n) { std::lock_guard lock(mutex_); max_blocks_ = n; }

    void fail_next_stages(int n) { std::lock_guard lock(mutex_); stage_failures_ = n; }
    void fail_next_commits(int n) { std::lock_guard lock(mutex_); commit_failures_ = n; }
    void on_next_stage(std::function<void()> fn) { std::lock_guard lock(mutex_); stage_hook_ = std::move(fn); }
    void on_next_commit(std::function<void()> fn) { std::lock_guard lock(mutex_); commit_hook_ = std::move(fn); }

    int stage_calls() const { std::lock_guard lock(mutex_); return stage_calls_; }
    int commit_calls() const { std::lock_guard lock(mutex_); return commit_calls_; }
    std::vector<std::vector<std::string>> commits() const { std::lock_guard lock(mutex_); return commits_; }
    std::string object(const std::string& name) const {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(name);
        return it == objects_.end() ? std::string() : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> staged_;
    std::map<std::string, std::string> objects_;
    std::vector<std::vector<std::string>> commits_;
    int stage_failures_ = 0;
    int commit_failures_ = 0;
    int stage_calls_ = 0;
    int commit_calls_ = 0;
    uint64_t max_blocks_ = constants::MAX_BLOCKS_PER_UPLOAD;
    std::function<void()> stage_hook_;
    std::function<void()> commit_hook_;
};

/// Coordinator wired to a file store and a scripted backend, with recorded sleeps.
struct CoordinatorFixture {
    fs::path dir;
    std::unique_ptr<SessionStore> store;
    ScriptedBlobBackend backend;
    std::vector<std::chrono::milliseconds> sleeps;
    std::unique_ptr<UploadCoordinator> coordinator;

    explicit CoordinatorFixture(uint64_t chunk_size = 50, uint64_t max_file_size = 1000,
                                bool order_by_index = false) {
        dir = make_temp_dir("blobup-coord");
        store = SessionStoreFactory::create("file", {{"path", (dir / "sessions").string()}});

        CoordinatorConfig config;
        config.chunk_size = chunk_size;
        config.max_file_size = max_file_size;
        config.retry.max_attempts = 3;
        config.retry.base_delay = std::chrono::milliseconds(100);
        config.retry.sleep = [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
        config.cas_max_attempts = 1000;
        config.order_blocks_by_index = order_by_index;
        coordinator = std::make_unique<UploadCoordinator>(*store, backend, config);
    }

    ~CoordinatorFixture() {
        coordinator.reset();
        store.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    UploadSession session(const std::string& id) {
        auto lookup = store->get(id);
        return lookup.session ? *lookup.session : UploadSession{};
    }
};

// ---------------------------------------------------------------------------
// 1. Session model
// ---------------------------------------------------------------------------

static void test_session_model() {
    std::cout << "\n=== Session model ===" << std::endl;

    {
        TEST(progress_counts_chunks);
        UploadSession s;
        s.upload_id = "u1";
        s.file_size = 100;
        s.chunk_size = 50;
        ASSERT_EQ(s.progress_percentage(), 0.0, "empty session");
        s.block_ids.push_back(make_block_id("u1", 0));
        ASSERT_EQ(s.progress_percentage(), 50.0, "one of two chunks");
        s.block_ids.push_back(make_block_id("u1", 1));
        ASSERT_EQ(s.progress_percentage(), 100.0, "two of two chunks");
        PASS();
    }

    {
        TEST(progress_capped_at_100);
        // Short final chunk: 3 chunks of 50 cover 120 bytes
        ASSERT_EQ(compute_progress(3, 50, 120), 100.0, "capped");
        ASSERT_EQ(compute_progress(5, 50, 0), 0.0, "zero size reports 0");
        PASS();
    }

    {
        TEST(expected_and_missing_chunks);
        UploadSession s;
        s.upload_id = "u2";
        s.file_size = 250;
        s.chunk_size = 50;
        ASSERT_EQ(s.expected_chunks(), 5u, "ceil(250/50)");
        s.block_ids = {make_block_id("u2", 3), make_block_id("u2", 0)};
        auto missing = s.missing_chunks();
        ASSERT_EQ(missing.size(), 3u, "three missing");
        ASSERT_EQ(missing[0], 1u, "first missing");
        ASSERT_EQ(missing[1], 2u, "second missing");
        ASSERT_EQ(missing[2], 4u, "third missing");
        s.file_size = 251;
        ASSERT_EQ(s.expected_chunks(), 6u, "partial final chunk");
        PASS();
    }

    {
        TEST(json_record_roundtrip);
        UploadSession s;
        s.upload_id = "abc-123";
        s.filename = "dir/my file.bin";
        s.object_name = "dir/my file.bin";
        s.file_size = 12345;
        s.chunk_size = 100;
        s.block_ids = {make_block_id("abc-123", 0), make_block_id("abc-123", 7)};
        s.completed = true;
        s.created_at = 1700000000;
        s.updated_at = 1700000100;
        s.version = 4;
        auto parsed = UploadSession::from_json(s.to_json());
        ASSERT_TRUE(parsed.has_value(), "parses");
        ASSERT_EQ(parsed->upload_id, s.upload_id, "upload_id");
        ASSERT_EQ(parsed->filename, s.filename, "filename");
        ASSERT_EQ(parsed->file_size, s.file_size, "file_size");
        ASSERT_TRUE(parsed->block_ids == s.block_ids, "block ids in order");
        ASSERT_TRUE(parsed->completed, "completed");
        ASSERT_EQ(parsed->updated_at, s.updated_at, "updated_at");
        ASSERT_EQ(parsed->version, 4u, "version");
        PASS();
    }

    {
        TEST(malformed_record_rejected);
        ASSERT_TRUE(!UploadSession::from_json("not json").has_value(), "garbage");
        ASSERT_TRUE(!UploadSession::from_json("[1,2]").has_value(), "array");
        ASSERT_TRUE(!UploadSession::from_json("{\"upload_id\":\"x\"}").has_value(), "missing sizes");
        ASSERT_TRUE(!UploadSession::from_json(
            "{\"upload_id\":\"x\",\"file_size\":\"big\",\"chunk_size\":1}").has_value(),
            "wrong type");
        PASS();
    }

    {
        TEST(format_timestamp_utc);
        ASSERT_EQ(format_timestamp(0), std::string("-"), "zero");
        ASSERT_EQ(format_timestamp(1700000000), std::string("2023-11-14 22:13:20"), "epoch");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Ids
// ---------------------------------------------------------------------------

static void test_ids() {
    std::cout << "\n=== Upload and block ids ===" << std::endl;

    {
        TEST(upload_ids_are_uuid_v4);
        std::set<std::string> seen;
        for (int i = 0; i < 1000; ++i) {
            auto id = make_upload_id();
            ASSERT_EQ(id.size(), 36u, "uuid length");
            ASSERT_EQ(id[14], '4', "version nibble");
            ASSERT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b',
                        "variant nibble");
            ASSERT_TRUE(is_valid_upload_id(id), "valid id");
            seen.insert(id);
        }
        ASSERT_EQ(seen.size(), 1000u, "no repeats");
        PASS();
    }

    {
        TEST(upload_id_validation);
        ASSERT_TRUE(!is_valid_upload_id(""), "empty");
        ASSERT_TRUE(!is_valid_upload_id("../etc/passwd"), "path traversal");
        ASSERT_TRUE(!is_valid_upload_id("a b"), "space");
        ASSERT_TRUE(!is_valid_upload_id(std::string(65, 'a')), "too long");
        ASSERT_TRUE(is_valid_upload_id("Abc-123"), "alnum and dash");
        PASS();
    }

    {
        TEST(block_id_deterministic_and_fixed_width);
        auto id = make_upload_id();
        auto b0 = make_block_id(id, 0);
        ASSERT_EQ(b0, make_block_id(id, 0), "deterministic");
        ASSERT_TRUE(b0 != make_block_id(id, 1), "distinct per index");
        ASSERT_EQ(b0.size(), make_block_id(id, 999999).size(), "same length for all indices");
        ASSERT_EQ(make_block_id("u", 7), std::string("dV8wMDAwMDc="), "base64(u_000007)");
        PASS();
    }

    {
        TEST(block_index_roundtrip);
        auto id = make_upload_id();
        auto idx = parse_block_index(id, make_block_id(id, 4242));
        ASSERT_TRUE(idx.has_value(), "parses");
        ASSERT_EQ(*idx, 4242u, "index");
        ASSERT_TRUE(!parse_block_index("other", make_block_id(id, 1)).has_value(),
                    "foreign upload");
        ASSERT_TRUE(!parse_block_index(id, "!!!").has_value(), "garbage");
        PASS();
    }

    {
        TEST(chunk_index_range);
        ASSERT_TRUE(is_valid_chunk_index(0), "zero");
        ASSERT_TRUE(is_valid_chunk_index(999999), "max");
        ASSERT_TRUE(!is_valid_chunk_index(-1), "negative");
        ASSERT_TRUE(!is_valid_chunk_index(1000000), "too large");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Blob name sanitization
// ---------------------------------------------------------------------------

static size_t count_segments(const std::string& s) {
    if (s.empty()) return 0;
    size_t n = 1;
    for (char c : s) {
        if (c == '/') ++n;
    }
    return n;
}

static void test_sanitize_blob_name() {
    std::cout << "\n=== Blob name sanitization ===" << std::endl;

    {
        TEST(plain_names_unchanged);
        ASSERT_EQ(sanitize_blob_name("report.pdf"), std::string("report.pdf"), "simple");
        ASSERT_EQ(sanitize_blob_name("a/b/c.txt"), std::string("a/b/c.txt"), "nested");
        ASSERT_EQ(sanitize_blob_name("my file (1).zip"), std::string("my file (1).zip"), "spaces");
        PASS();
    }

    {
        TEST(backslashes_and_empty_segments);
        ASSERT_EQ(sanitize_blob_name("dir\\sub\\f.bin"), std::string("dir/sub/f.bin"), "backslash");
        ASSERT_EQ(sanitize_blob_name("//a///b/"), std::string("a/b"), "empty segments");
        ASSERT_EQ(sanitize_blob_name("///"), std::string(), "nothing left");
        PASS();
    }

    {
        TEST(control_chars_and_trailing_dots);
        ASSERT_EQ(sanitize_blob_name(std::string("a\tb")), std::string("a%09b"), "tab");
        ASSERT_EQ(sanitize_blob_name(std::string("x\x7Fy")), std::string("x%7Fy"), "DEL");
        ASSERT_EQ(sanitize_blob_name("dir./f.."), std::string("dir%2E/f%2E%2E"), "trailing dots");
        ASSERT_EQ(sanitize_blob_name("a.b"), std::string("a.b"), "inner dot kept");
        PASS();
    }

    {
        TEST(segment_limit);
        std::string name;
        for (int i = 0; i < 300; ++i) name += "s/";
        name += "f";
        auto out = sanitize_blob_name(name);
        ASSERT_EQ(count_segments(out), 254u, "at most 254 segments");
        PASS();
    }

    {
        TEST(length_limit);
        auto out = sanitize_blob_name(std::string(2000, 'x'));
        ASSERT_EQ(out.size(), 1024u, "at most 1024 characters");

        // Escapes are not split by the cut
        std::string dotted = std::string(1022, 'y') + "\t\t";
        out = sanitize_blob_name(dotted);
        ASSERT_TRUE(out.size() <= 1024, "bounded");
        ASSERT_TRUE(out.find('%') == std::string::npos ||
                    out.size() - out.rfind('%') == 3, "no partial escape");
        PASS();
    }

    {
        TEST(utf8_not_split);
        // 3-byte character repeated past the limit
        std::string snowman = "\xE2\x98\x83";
        std::string name;
        while (name.size() < 1100) name += snowman;
        auto out = sanitize_blob_name(name);
        ASSERT_TRUE(out.size() <= 1024, "bounded");
        ASSERT_EQ(out.size() % 3, 0u, "whole characters only");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. HTTP client
// ---------------------------------------------------------------------------

static void test_http_client() {
    std::cout << "\n=== HTTP client ===" << std::endl;

    {
        TEST(put_sends_headers_and_body);
        LoopbackHttpServer server([](const LoopbackRequest&) {
            LoopbackResponse r;
            r.status = 201;
            r.body = "stored";
            r.headers.push_back({"X-Reply", "yes"});
            return r;
        });

        net::HttpClient client;
        auto request = net::HttpRequest::put(server.base_url() + "/a%20b?x=1", std::string("hello"));
        request.headers.set("X-Test", "1");
        auto response = client.execute(request);

        ASSERT_EQ(response.status_code, 201, "status");
        ASSERT_TRUE(response.ok(), "2xx is ok");
        ASSERT_EQ(response.body_string(), std::string("stored"), "body");
        ASSERT_EQ(response.headers.get("x-reply").value_or(""), std::string("yes"), "reply header");
        ASSERT_EQ(response.headers.content_length().value_or(0), 6u, "content length");

        auto seen = server.requests();
        ASSERT_EQ(seen.size(), 1u, "one request");
        ASSERT_EQ(seen[0].method, std::string("PUT"), "method");
        ASSERT_EQ(seen[0].path, std::string("/a%20b"), "path");
        ASSERT_EQ(seen[0].param("x"), std::string("1"), "query");
        ASSERT_EQ(seen[0].body, std::string("hello"), "request body");
        ASSERT_EQ(seen[0].headers["x-test"], std::string("1"), "request header");
        ASSERT_EQ(seen[0].headers["user-agent"], std::string("blobup/1.0"), "user agent");
        PASS();
    }

    {
        TEST(empty_put_carries_zero_length);
        LoopbackHttpServer server([](const LoopbackRequest&) { return LoopbackResponse{}; });
        net::HttpClient client;
        auto response = client.execute(net::HttpRequest::put(server.base_url() + "/c", std::vector<uint8_t>{}));
        ASSERT_EQ(response.status_code, 200, "status");
        auto seen = server.requests();
        ASSERT_EQ(seen.size(), 1u, "one request");
        ASSERT_EQ(seen[0].headers["content-length"], std::string("0"), "explicit zero length");
        PASS();
    }

    {
        TEST(oversized_response_is_an_error);
        LoopbackHttpServer server([](const LoopbackRequest&) {
            LoopbackResponse r;
            r.body = std::string(64, 'x');
            return r;
        });
        net::HttpClientConfig config;
        config.max_response_size = 16;
        net::HttpClient client(config);
        auto response = client.execute(net::HttpRequest::get(server.base_url() + "/big"));
        ASSERT_EQ(response.status_code, 0, "no status on overflow");
        ASSERT_TRUE(response.error.find("exceeded 16 bytes") != std::string::npos, "size error");
        ASSERT_EQ(response.describe(), response.error, "describe shows transport error");
        PASS();
    }

    {
        TEST(client_default_timeout_applies);
        LoopbackHttpServer server([](const LoopbackRequest&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            return LoopbackResponse{};
        });
        net::HttpClientConfig config;
        config.default_total_timeout = std::chrono::milliseconds(200);
        net::HttpClient client(config);

        auto start = std::chrono::steady_clock::now();
        auto response = client.execute(net::HttpRequest::get(server.base_url() + "/slow"));
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT_EQ(response.status_code, 0, "timed out");
        ASSERT_TRUE(!response.error.empty(), "timeout reported");
        ASSERT_TRUE(elapsed < std::chrono::milliseconds(1200), "did not wait for the server");
        PASS();
    }

    {
        TEST(request_timeout_overrides_default);
        LoopbackHttpServer server([](const LoopbackRequest&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return LoopbackResponse{};
        });
        net::HttpClientConfig config;
        config.default_total_timeout = std::chrono::milliseconds(100);
        net::HttpClient client(config);

        auto request = net::HttpRequest::get(server.base_url() + "/slow");
        request.total_timeout = std::chrono::milliseconds(5000);
        auto response = client.execute(request);
        ASSERT_EQ(response.status_code, 200, "longer per-request timeout used");
        PASS();
    }

    {
        TEST(encoding_helpers);
        ASSERT_EQ(net::url_encode("a b/c~"), std::string("a%20b%2Fc~"), "url_encode");
        ASSERT_EQ(net::url_encode_path("dir one/f+1.bin"), std::string("dir%20one/f%2B1.bin"), "path");
        ASSERT_EQ(net::base64_encode(std::string("blobup")), std::string("YmxvYnVw"), "encode");
        ASSERT_EQ(net::base64_encode(std::string("ab")), std::string("YWI="), "padding");
        auto decoded = net::base64_decode("YW\nI=");
        ASSERT_EQ(std::string(decoded.begin(), decoded.end()), std::string("ab"), "decode skips noise");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Session store conformance
// ---------------------------------------------------------------------------

static UploadSession new_session(uint64_t file_size = 100, uint64_t chunk_size = 50) {
    UploadSession s;
    s.upload_id = make_upload_id();
    s.filename = "f.bin";
    s.object_name = "f.bin";
    s.file_size = file_size;
    s.chunk_size = chunk_size;
    s.created_at = now_epoch();
    s.updated_at = s.created_at;
    return s;
}

/// Consul KV semantics served over loopback HTTP: ?cas=0 creates only if
/// absent, ?cas=<ModifyIndex> writes or deletes only if unchanged, values
/// come back base64 encoded, missing keys are 404.
class FakeKvService {
public:
    FakeKvService()
        : server_([this](const LoopbackRequest& r) { return handle(r); }) {}

    std::string endpoint() const { return server_.base_url(); }

    std::vector<LoopbackRequest> requests() const { return server_.requests(); }

    /// Store `value` under `key` as another client would.
    void put_raw(const std::string& key, const std::string& value) {
        std::lock_guard lock(mutex_);
        kv_[key] = {value, ++index_};
    }

    size_t key_count() const {
        std::lock_guard lock(mutex_);
        return kv_.size();
    }

private:
    struct Entry {
        std::string value;
        uint64_t modify_index = 0;
    };

    nlohmann::json entry_json(const std::string& key, const Entry& e) const {
        return {{"Key", key}, {"Value", net::base64_encode(e.value)},
                {"CreateIndex", e.modify_index}, {"ModifyIndex", e.modify_index},
                {"LockIndex", 0}, {"Flags", 0}};
    }

    LoopbackResponse handle(const LoopbackRequest& r) {
        std::lock_guard lock(mutex_);
        if (r.path == "/v1/status/leader") return {200, "\"127.0.0.1:8300\"", {}};

        const std::string root = "/v1/kv/";
        if (r.path.rfind(root, 0) != 0) return {404, "", {}};
        std::string key = r.path.substr(root.size());
        auto it = kv_.find(key);

        if (r.method == "GET") {
            nlohmann::json out = nlohmann::json::array();
            if (r.has_param("recurse")) {
                for (const auto& [k, e] : kv_) {
                    if (k.rfind(key, 0) == 0) out.push_back(entry_json(k, e));
                }
            } else if (it != kv_.end()) {
                out.push_back(entry_json(key, it->second));
            }
            if (out.empty()) return {404, "", {}};
            return {200, out.dump(), {{"Content-Type", "application/json"}}};
        }

        bool cas_ok = true;
        if (r.has_param("cas")) {
            uint64_t cas = std::stoull(r.param("cas"));
            if (cas == 0) {
                cas_ok = it == kv_.end();
            } else {
                cas_ok = it != kv_.end() && it->second.modify_index == cas;
            }
        }

        if (r.method == "PUT") {
            if (!cas_ok) return {200, "false", {}};
            kv_[key] = {r.body, ++index_};
            return {200, "true", {}};
        }
        if (r.method == "DELETE") {
            if (!cas_ok) return {200, "false", {}};
            kv_.erase(key);
            return {200, "true", {}};
        }
        return {405, "", {}};
    }

    mutable std::mutex mutex_;
    std::map<std::string, Entry> kv_;
    uint64_t index_ = 0;
    LoopbackHttpServer server_;     // last: stops before the state goes away
};

/// Forwards to another store and runs a hook right after list() returns, to
/// land a write between a sweep's listing and its removals.
class ListHookStore : public SessionStore {
public:
    ListHookStore(SessionStore& inner, std::function<void()> after_list)
        : inner_(inner), after_list_(std::move(after_list)) {}

    std::string type_name() const override { return inner_.type_name(); }
    WriteResult create(const UploadSession& s) override { return inner_.create(s); }
    SessionLookup get(const std::string& id) const override { return inner_.get(id); }
    WriteResult remove(const std::string& id) override { return inner_.remove(id); }
    WriteResult remove_if_version(const std::string& id, uint64_t v) override {
        return inner_.remove_if_version(id, v);
    }
    WriteResult compare_and_swap(const UploadSession& s, uint64_t v) override {
        return inner_.compare_and_swap(s, v);
    }
    bool is_healthy() const override { return inner_.is_healthy(); }

    SessionList list() const override {
        auto listing = inner_.list();
        if (after_list_) after_list_();
        return listing;
    }

private:
    SessionStore& inner_;
    std::function<void()> after_list_;
};

static void run_store_conformance(const std::string& label, SessionStore& store) {
    std::cout << "  [" << label << "]" << std::endl;

    {
        TEST(create_and_get);
        auto s = new_session();
        auto w = store.create(s);
        ASSERT_TRUE(w.ok(), "create: " + w.error_message);
        ASSERT_EQ(w.version, 1u, "initial version");
        auto lookup = store.get(s.upload_id);
        ASSERT_TRUE(lookup.success, "get succeeds");
        ASSERT_TRUE(lookup.session.has_value(), "present");
        ASSERT_EQ(lookup.session->filename, s.filename, "filename");
        ASSERT_EQ(lookup.session->version, 1u, "stored version");
        ASSERT_TRUE(lookup.session->block_ids.empty(), "no blocks");
        ASSERT_TRUE(!lookup.session->completed, "not completed");
        PASS();
    }

    {
        TEST(create_existing_id);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "first create");
        auto w = store.create(s);
        ASSERT_EQ(write_status_name(w.status), std::string("exists"), "second create");
        PASS();
    }

    {
        TEST(get_unknown_and_malformed);
        auto lookup = store.get(make_upload_id());
        ASSERT_TRUE(lookup.success && !lookup.session, "unknown id is absent");
        lookup = store.get("../../etc/passwd");
        ASSERT_TRUE(lookup.success && !lookup.session, "malformed id is absent");
        PASS();
    }

    {
        TEST(compare_and_swap_versions);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        auto updated = s;
        updated.block_ids.push_back("b0");
        auto w = store.compare_and_swap(updated, 1);
        ASSERT_TRUE(w.ok(), "cas at v1: " + w.error_message);
        ASSERT_EQ(w.version, 2u, "bumped");

        updated.block_ids.push_back("b1");
        w = store.compare_and_swap(updated, 1);
        ASSERT_EQ(write_status_name(w.status), std::string("conflict"), "stale version");
        auto lookup = store.get(s.upload_id);
        ASSERT_EQ(lookup.session->block_ids.size(), 1u, "stale write not applied");

        auto ghost = new_session();
        w = store.compare_and_swap(ghost, 1);
        ASSERT_EQ(write_status_name(w.status), std::string("not_found"), "unknown id");
        ASSERT_TRUE(!store.get(ghost.upload_id).session, "not created by cas");
        PASS();
    }

    {
        TEST(append_block_id_semantics);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        auto m = store.append_block_id(s.upload_id, "b0");
        ASSERT_EQ(mutation_status_name(m.status), std::string("applied"), "first append");
        ASSERT_EQ(m.session.progress_percentage(), 50.0, "progress");
        m = store.append_block_id(s.upload_id, "b0");
        ASSERT_EQ(mutation_status_name(m.status), std::string("unchanged"), "duplicate append");
        m = store.append_block_id(s.upload_id, "b1");
        ASSERT_EQ(mutation_status_name(m.status), std::string("applied"), "second append");
        auto lookup = store.get(s.upload_id);
        ASSERT_EQ(lookup.session->block_ids.size(), 2u, "two entries");
        ASSERT_EQ(lookup.session->block_ids[0], std::string("b0"), "arrival order");
        ASSERT_EQ(lookup.session->version, 3u, "two writes");
        m = store.append_block_id(make_upload_id(), "b0");
        ASSERT_EQ(mutation_status_name(m.status), std::string("not_found"), "unknown id");
        PASS();
    }

    {
        TEST(mark_completed_semantics);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        ASSERT_TRUE(store.append_block_id(s.upload_id, "b0").status == MutationStatus::Applied,
                    "append");
        auto m = store.mark_completed(s.upload_id, 1);
        ASSERT_EQ(mutation_status_name(m.status), std::string("conflict"), "stale version");
        m = store.mark_completed(s.upload_id, 2);
        ASSERT_EQ(mutation_status_name(m.status), std::string("applied"), "current version");
        ASSERT_TRUE(m.session.completed, "completed");
        m = store.append_block_id(s.upload_id, "b1");
        ASSERT_EQ(mutation_status_name(m.status), std::string("completed"), "append after complete");
        m = store.mark_completed(s.upload_id, 3);
        ASSERT_EQ(mutation_status_name(m.status), std::string("completed"), "complete twice");
        PASS();
    }

    {
        TEST(remove_is_final);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        ASSERT_TRUE(store.remove(s.upload_id).ok(), "remove");
        ASSERT_TRUE(!store.get(s.upload_id).session, "gone");
        ASSERT_TRUE(store.remove(s.upload_id).ok(), "remove unknown is ok");
        auto m = store.append_block_id(s.upload_id, "b0");
        ASSERT_EQ(mutation_status_name(m.status), std::string("not_found"), "no resurrection");
        ASSERT_TRUE(!store.get(s.upload_id).session, "still gone");
        PASS();
    }

    {
        TEST(remove_if_version_semantics);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        ASSERT_TRUE(store.append_block_id(s.upload_id, "b0").status == MutationStatus::Applied,
                    "append");
        auto w = store.remove_if_version(s.upload_id, 1);
        ASSERT_EQ(write_status_name(w.status), std::string("conflict"), "stale version");
        ASSERT_TRUE(store.get(s.upload_id).session.has_value(), "kept on conflict");
        w = store.remove_if_version(s.upload_id, 2);
        ASSERT_TRUE(w.ok(), "current version: " + w.error_message);
        ASSERT_TRUE(!store.get(s.upload_id).session, "removed");
        w = store.remove_if_version(s.upload_id, 2);
        ASSERT_EQ(write_status_name(w.status), std::string("not_found"), "already gone");
        PASS();
    }

    {
        TEST(list_returns_sessions);
        auto s = new_session();
        ASSERT_TRUE(store.create(s).ok(), "create");
        auto listing = store.list();
        ASSERT_TRUE(listing.success, "list: " + listing.error_message);
        bool found = false;
        for (const auto& e : listing.sessions) {
            if (e.upload_id == s.upload_id) found = true;
        }
        ASSERT_TRUE(found, "created session listed");
        PASS();
    }

    {
        TEST(concurrent_appends_lose_nothing);
        auto s = new_session(64 * 50, 50);
        ASSERT_TRUE(store.create(s).ok(), "create");

        constexpr int kThreads = 8;
        constexpr int kPerThread = 8;
        std::atomic<int> errors{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    auto id = make_block_id(s.upload_id, static_cast<uint32_t>(t * kPerThread + i));
                    while (true) {
                        auto m = store.append_block_id(s.upload_id, id);
                        if (m.status == MutationStatus::Conflict) continue;
                        if (m.status != MutationStatus::Applied) errors++;
                        break;
                    }
                }
            });
        }
        for (auto& th : threads) th.join();

        ASSERT_EQ(errors.load(), 0, "no append errors");
        auto lookup = store.get(s.upload_id);
        ASSERT_EQ(lookup.session->block_ids.size(), size_t(kThreads * kPerThread), "every block recorded");
        std::set<std::string> unique(lookup.session->block_ids.begin(), lookup.session->block_ids.end());
        ASSERT_EQ(unique.size(), size_t(kThreads * kPerThread), "no duplicates");
        ASSERT_EQ(lookup.session->version, uint64_t(kThreads * kPerThread + 1), "one version per append");
        ASSERT_EQ(lookup.session->progress_percentage(), 100.0, "complete");
        PASS();
    }

    {
        TEST(healthy);
        ASSERT_TRUE(store.is_healthy(), "store reports healthy");
        PASS();
    }
}

static void test_session_stores() {
    std::cout << "\n=== Session store conformance ===" << std::endl;
    auto tmpdir = make_temp_dir("blobup-store");

    {
        auto store = SessionStoreFactory::create("file", {{"path", (tmpdir / "files").string()}});
        ASSERT_EQ(store->type_name(), std::string("file"), "file type");
        run_store_conformance("file", *store);
    }

    {
        auto store = SessionStoreFactory::create("sqlite", {{"path", (tmpdir / "db" / "sessions.db").string()}});
        ASSERT_EQ(store->type_name(), std::string("sqlite"), "sqlite type");
        run_store_conformance("sqlite", *store);
    }

    {
        FakeKvService kv;
        auto store = SessionStoreFactory::create("kv", {{"endpoint", kv.endpoint()},
                                                        {"prefix", "blobup/test"},
                                                        {"timeout", "5"}});
        ASSERT_EQ(store->type_name(), std::string("kv"), "kv type");
        run_store_conformance("kv", *store);

        TEST(kv_keys_live_under_prefix);
        bool all_prefixed = true;
        for (const auto& r : kv.requests()) {
            if (r.path.rfind("/v1/kv/", 0) == 0 &&
                r.path.rfind("/v1/kv/blobup/test/", 0) != 0) {
                all_prefixed = false;
            }
        }
        ASSERT_TRUE(all_prefixed, "every key request under the prefix");
        ASSERT_TRUE(kv.key_count() > 0, "sessions stored remotely");
        PASS();
    }

    {
        TEST(kv_listing_ignores_sibling_prefixes);
        FakeKvService kv;
        auto store = SessionStoreFactory::create("kv", {{"endpoint", kv.endpoint()},
                                                        {"prefix", "blobup/sessions/"}});
        auto s = new_session();
        ASSERT_TRUE(store->create(s).ok(), "create");
        auto other = new_session();
        kv.put_raw("blobup/sessions-archive/" + other.upload_id, other.to_json());
        auto listing = store->list();
        ASSERT_TRUE(listing.success, "list: " + listing.error_message);
        ASSERT_EQ(listing.sessions.size(), 1u, "sibling prefix not listed");
        ASSERT_EQ(listing.sessions[0].upload_id, s.upload_id, "own session");
        PASS();
    }

    {
        TEST(kv_corrupt_value_reported_and_skipped);
        FakeKvService kv;
        auto store = SessionStoreFactory::create("kv", {{"endpoint", kv.endpoint()}});
        auto good = new_session();
        ASSERT_TRUE(store->create(good).ok(), "create");
        auto bad_id = make_upload_id();
        kv.put_raw("blobup/sessions/" + bad_id, "{ truncated");
        auto lookup = store->get(bad_id);
        ASSERT_TRUE(!lookup.success, "corrupt record is an error");
        ASSERT_TRUE(lookup.error_message.find("Corrupt") != std::string::npos, "says corrupt");
        auto listing = store->list();
        ASSERT_TRUE(listing.success, "list succeeds");
        ASSERT_EQ(listing.sessions.size(), 1u, "corrupt record skipped");
        PASS();
    }

    {
        TEST(kv_sends_acl_token);
        FakeKvService kv;
        auto store = SessionStoreFactory::create("kv", {{"endpoint", kv.endpoint() + "/"},
                                                        {"token", "acl-secret"}});
        ASSERT_TRUE(store->is_healthy(), "leader reachable");
        ASSERT_TRUE(!store->get(make_upload_id()).session, "absent");
        auto seen = kv.requests();
        ASSERT_EQ(seen.size(), 2u, "two requests");
        for (const auto& r : seen) {
            auto it = r.headers.find("x-consul-token");
            ASSERT_TRUE(it != r.headers.end() && it->second == "acl-secret", "token header");
            ASSERT_TRUE(r.path.rfind("//", 0) != 0, "trailing slash trimmed from endpoint");
        }
        PASS();
    }

    {
        TEST(kv_unreachable_is_an_error);
        // Nothing listens on port 1 of the loopback interface
        auto store = SessionStoreFactory::create("kv", {{"endpoint", "http://127.0.0.1:1"},
                                                        {"timeout", "2"}});
        auto lookup = store->get(make_upload_id());
        ASSERT_TRUE(!lookup.success, "get fails");
        ASSERT_TRUE(!lookup.error_message.empty(), "reason given");
        auto w = store->create(new_session());
        ASSERT_EQ(write_status_name(w.status), std::string("error"), "create fails");
        ASSERT_TRUE(!store->is_healthy(), "unhealthy");
        PASS();
    }

    {
        TEST(sweep_keeps_session_written_after_listing);
        auto store = SessionStoreFactory::create("file", {{"path", (tmpdir / "sweep").string()}});
        int64_t now = now_epoch();

        auto idle = new_session();
        idle.updated_at = now - 7200;
        auto revived = new_session();
        revived.updated_at = now - 7200;
        ASSERT_TRUE(store->create(idle).ok(), "create idle");
        ASSERT_TRUE(store->create(revived).ok(), "create revived");

        // A chunk for `revived` lands after the sweep listed it as idle
        MutationStatus late = MutationStatus::Error;
        ListHookStore racing(*store, [&] {
            late = store->append_block_id(revived.upload_id, "b0").status;
        });
        auto sweep = remove_idle_sessions(racing, now - 3600);
        ASSERT_TRUE(sweep.success, "sweep: " + sweep.error_message);
        ASSERT_TRUE(late == MutationStatus::Applied, "late chunk recorded");
        ASSERT_EQ(sweep.removed, 1u, "only the idle session");
        ASSERT_EQ(sweep.remaining, 1u, "revived session counted as remaining");
        ASSERT_TRUE(!store->get(idle.upload_id).session, "idle removed");
        auto kept = store->get(revived.upload_id).session;
        ASSERT_TRUE(kept.has_value(), "revived kept");
        ASSERT_EQ(kept->block_ids.size(), 1u, "late chunk preserved");
        PASS();
    }

    {
        TEST(sweep_counts_concurrent_removal_once);
        auto store = SessionStoreFactory::create("file", {{"path", (tmpdir / "sweep2").string()}});
        auto idle = new_session();
        idle.updated_at = now_epoch() - 7200;
        ASSERT_TRUE(store->create(idle).ok(), "create");
        // A cancel removes the session between listing and sweep
        ListHookStore racing(*store, [&] { store->remove(idle.upload_id); });
        auto sweep = remove_idle_sessions(racing, now_epoch() - 3600);
        ASSERT_TRUE(sweep.success, "sweep");
        ASSERT_EQ(sweep.removed, 0u, "not claimed by the sweep");
        ASSERT_EQ(sweep.remaining, 0u, "nothing left");
        PASS();
    }

    {
        TEST(sqlite_survives_reopen);
        auto path = (tmpdir / "reopen.db").string();
        auto s = new_session();
        {
            auto store = SessionStoreFactory::create("sqlite", {{"path", path}});
            ASSERT_TRUE(store->create(s).ok(), "create");
            ASSERT_TRUE(store->append_block_id(s.upload_id, "b0").status == MutationStatus::Applied,
                        "append");
        }
        auto store = SessionStoreFactory::create("sqlite", {{"path", path}});
        auto lookup = store->get(s.upload_id);
        ASSERT_TRUE(lookup.session.has_value(), "present after reopen");
        ASSERT_EQ(lookup.session->block_ids.size(), 1u, "blocks persisted");
        ASSERT_EQ(lookup.session->version, 2u, "version persisted");
        PASS();
    }

    {
        TEST(file_store_skips_corrupt_records);
        auto dir = tmpdir / "corrupt";
        auto store = SessionStoreFactory::create("file", {{"path", dir.string()}});
        auto s = new_session();
        ASSERT_TRUE(store->create(s).ok(), "create");
        {
            std::ofstream ofs(dir / "deadbeef.json");
            ofs << "{ truncated";
        }
        auto listing = store->list();
        ASSERT_TRUE(listing.success, "list succeeds");
        ASSERT_EQ(listing.sessions.size(), 1u, "corrupt record skipped");
        PASS();
    }

    {
        TEST(factory_rejects_bad_config);
        bool threw = false;
        try { SessionStoreFactory::create("file", {}); } catch (const std::runtime_error&) { threw = true; }
        ASSERT_TRUE(threw, "file without path");
        threw = false;
        try { SessionStoreFactory::create("kv", {}); } catch (const std::runtime_error&) { threw = true; }
        ASSERT_TRUE(threw, "kv without endpoint");
        threw = false;
        try { SessionStoreFactory::create("redis", {{"path", "x"}}); } catch (const std::runtime_error&) { threw = true; }
        ASSERT_TRUE(threw, "unknown type");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Coordinator
// ---------------------------------------------------------------------------

static void test_coordinator_lifecycle() {
    std::cout << "\n=== Coordinator lifecycle ===" << std::endl;

    {
        TEST(init_creates_empty_session);
        CoordinatorFixture f;
        auto r = f.coordinator->init_upload("dir\\report.pdf", 100);
        ASSERT_TRUE(r.ok(), "init: " + r.message);
        ASSERT_EQ(r.chunk_size, 50u, "chunk size echoed");
        ASSERT_EQ(r.object_name, std::string("dir/report.pdf"), "sanitized name");
        auto s = f.session(r.upload_id);
        ASSERT_EQ(s.upload_id, r.upload_id, "persisted");
        ASSERT_TRUE(s.block_ids.empty(), "no blocks");
        ASSERT_TRUE(!s.completed, "not completed");
        ASSERT_EQ(s.filename, std::string("dir\\report.pdf"), "original filename kept");
        ASSERT_EQ(f.coordinator->get_stats().sessions_created, 1u, "counted");
        PASS();
    }

    {
        TEST(init_rejects_oversize);
        CoordinatorFixture f;
        auto r = f.coordinator->init_upload("big.bin", 1001);
        ASSERT_TRUE(r.error == UploadError::SizeExceeded, "size exceeded");
        ASSERT_TRUE(!is_retryable(r.error), "not retryable");
        ASSERT_TRUE(r.message.find("1001") != std::string::npos, "message names size");
        ASSERT_TRUE(f.coordinator->init_upload("exact.bin", 1000).ok(), "limit is inclusive");
        PASS();
    }

    {
        TEST(init_rejects_more_chunks_than_block_ids);
        CoordinatorFixture f(1, 2000000);
        auto r = f.coordinator->init_upload("many.bin", 1000001);
        ASSERT_TRUE(r.error == UploadError::SizeExceeded, "size exceeded");
        ASSERT_TRUE(r.message.find("1000001 chunks") != std::string::npos, "names chunk count");
        ASSERT_TRUE(r.message.find("at most 1000000") != std::string::npos, "names limit");
        ASSERT_TRUE(f.coordinator->init_upload("edge.bin", 1000000).ok(), "last index usable");
        PASS();
    }

    {
        TEST(init_respects_backend_block_limit);
        CoordinatorFixture f;
        f.backend.set_max_blocks(4);
        auto r = f.coordinator->init_upload("f.bin", 201);
        ASSERT_TRUE(r.error == UploadError::SizeExceeded, "fifth chunk refused up front");
        ASSERT_TRUE(r.message.find("at most 4") != std::string::npos, "names backend limit");
        auto ok = f.coordinator->init_upload("f.bin", 200);
        ASSERT_TRUE(ok.ok(), "four chunks fit: " + ok.message);
        ASSERT_EQ(f.coordinator->get_stats().sessions_created, 1u, "only the accepted one");
        PASS();
    }

    {
        TEST(init_rejects_unusable_name);
        CoordinatorFixture f;
        auto r = f.coordinator->init_upload("///", 10);
        ASSERT_TRUE(r.error == UploadError::InvalidArgument, "invalid argument");
        PASS();
    }

    {
        TEST(scenario_two_chunks_then_complete);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("file.bin", 100);
        ASSERT_TRUE(init.ok(), "init");

        auto c0 = bytes_of(std::string(50, 'a'));
        auto c1 = bytes_of(std::string(50, 'b'));
        auto s0 = f.coordinator->stage_chunk(init.upload_id, 0, c0);
        ASSERT_TRUE(s0.ok(), "stage 0: " + s0.message);
        ASSERT_EQ(s0.progress, 50.0, "progress after chunk 0");
        ASSERT_EQ(s0.block_id, make_block_id(init.upload_id, 0), "block id");
        auto s1 = f.coordinator->stage_chunk(init.upload_id, 1, c1);
        ASSERT_TRUE(s1.ok(), "stage 1: " + s1.message);
        ASSERT_EQ(s1.progress, 100.0, "progress after chunk 1");

        auto done = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(done.ok(), "complete: " + done.message);
        ASSERT_EQ(done.block_count, 2u, "blocks count");
        ASSERT_EQ(done.file_size, 100u, "file size");
        ASSERT_EQ(done.filename, std::string("file.bin"), "filename");

        auto commits = f.backend.commits();
        ASSERT_EQ(commits.size(), 1u, "one commit");
        ASSERT_TRUE(commits[0] == std::vector<std::string>({s0.block_id, s1.block_id}),
                    "committed in order");
        ASSERT_EQ(f.backend.object("file.bin"), std::string(50, 'a') + std::string(50, 'b'),
                  "object content");
        ASSERT_TRUE(f.session(init.upload_id).completed, "marked completed");

        auto again = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(again.error == UploadError::AlreadyCompleted, "second complete");
        ASSERT_EQ(f.backend.commit_calls(), 1, "no second commit");

        auto late = f.coordinator->stage_chunk(init.upload_id, 2, c0);
        ASSERT_TRUE(late.error == UploadError::AlreadyCompleted, "stage after complete");
        PASS();
    }

    {
        TEST(complete_with_no_chunks);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("empty.bin", 0);
        ASSERT_TRUE(init.ok(), "init");
        auto done = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(done.ok(), "complete: " + done.message);
        ASSERT_EQ(done.block_count, 0u, "zero blocks");
        ASSERT_EQ(f.backend.commits().size(), 1u, "commit issued");
        ASSERT_TRUE(f.backend.commits()[0].empty(), "empty list");
        PASS();
    }

    {
        TEST(unknown_upload_is_not_found);
        CoordinatorFixture f;
        auto id = make_upload_id();
        auto data = bytes_of("x");
        ASSERT_TRUE(f.coordinator->stage_chunk(id, 0, data).error == UploadError::SessionNotFound, "stage");
        ASSERT_TRUE(f.coordinator->complete_upload(id).error == UploadError::SessionNotFound, "complete");
        ASSERT_TRUE(f.coordinator->get_status(id).error == UploadError::SessionNotFound, "status");
        ASSERT_TRUE(f.coordinator->resume_upload(id).error == UploadError::SessionNotFound, "resume");
        ASSERT_TRUE(f.coordinator->cancel_upload(id).error == UploadError::SessionNotFound, "cancel");
        ASSERT_TRUE(f.coordinator->get_status("../x").error == UploadError::SessionNotFound, "malformed");
        ASSERT_EQ(f.backend.stage_calls(), 0, "backend untouched");
        PASS();
    }

    {
        TEST(invalid_chunk_arguments);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        auto small = bytes_of("x");
        auto big = bytes_of(std::string(51, 'z'));
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, -1, small).error == UploadError::InvalidArgument,
                    "negative index");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 1000000, small).error == UploadError::InvalidArgument,
                    "index too large");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, big).error == UploadError::InvalidArgument,
                    "payload larger than chunk size");
        ASSERT_EQ(f.backend.stage_calls(), 0, "nothing staged");
        PASS();
    }

    {
        TEST(status_and_resume);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 250);
        auto data = bytes_of("abc");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 3, data).ok(), "stage 3");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, data).ok(), "stage 0");

        auto status = f.coordinator->get_status(init.upload_id);
        ASSERT_TRUE(status.ok(), "status");
        ASSERT_EQ(status.progress, 40.0, "2 of 5 chunks");
        ASSERT_TRUE(status.missing_chunks.empty(), "status omits missing list");

        auto resume = f.coordinator->resume_upload(init.upload_id);
        ASSERT_TRUE(resume.ok(), "resume");
        ASSERT_TRUE(resume.missing_chunks == std::vector<uint32_t>({1, 2, 4}), "missing chunks");
        ASSERT_EQ(resume.session.block_ids.size(), 2u, "recorded ids");
        PASS();
    }

    {
        TEST(cancel_removes_session);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        auto data = bytes_of("abc");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, data).ok(), "stage");
        ASSERT_TRUE(f.coordinator->cancel_upload(init.upload_id).ok(), "cancel");
        ASSERT_TRUE(f.coordinator->get_status(init.upload_id).error == UploadError::SessionNotFound,
                    "gone");
        ASSERT_TRUE(f.coordinator->cancel_upload(init.upload_id).error == UploadError::SessionNotFound,
                    "second cancel");
        ASSERT_EQ(f.coordinator->get_stats().sessions_cancelled, 1u, "counted once");
        PASS();
    }

    {
        TEST(limits_reported);
        CoordinatorFixture f(64, 4096);
        auto l = f.coordinator->limits();
        ASSERT_EQ(l.chunk_size, 64u, "chunk size");
        ASSERT_EQ(l.max_file_size, 4096u, "max file size");
        PASS();
    }
}

static void test_coordinator_retry() {
    std::cout << "\n=== Coordinator retry ===" << std::endl;

    {
        TEST(backoff_schedule);
        RetryPolicy p;
        p.base_delay = std::chrono::milliseconds(1000);
        ASSERT_EQ(p.delay_after(1).count(), 1000, "first retry");
        ASSERT_EQ(p.delay_after(2).count(), 2000, "second retry");
        ASSERT_EQ(p.delay_after(3).count(), 4000, "third retry");
        PASS();
    }

    {
        TEST(stage_recovers_after_two_failures);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        f.backend.fail_next_stages(2);
        auto data = bytes_of("payload");
        auto r = f.coordinator->stage_chunk(init.upload_id, 0, data);
        ASSERT_TRUE(r.ok(), "stage: " + r.message);
        ASSERT_EQ(r.attempts, 3, "three attempts");
        ASSERT_EQ(f.backend.stage_calls(), 3, "backend called three times");
        ASSERT_EQ(f.sleeps.size(), 2u, "two sleeps");
        ASSERT_EQ(f.sleeps[0].count(), 100, "base delay");
        ASSERT_EQ(f.sleeps[1].count(), 200, "doubled delay");
        ASSERT_EQ(f.session(init.upload_id).block_ids.size(), 1u, "recorded once");
        ASSERT_EQ(f.coordinator->get_stats().stage_retries, 2u, "retries counted");
        PASS();
    }

    {
        TEST(stage_exhaustion_leaves_session_unchanged);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        auto before = f.session(init.upload_id);
        f.backend.fail_next_stages(3);
        auto data = bytes_of("payload");
        auto r = f.coordinator->stage_chunk(init.upload_id, 0, data);
        ASSERT_TRUE(r.error == UploadError::StagingFailed, "staging failed");
        ASSERT_TRUE(is_retryable(r.error), "retryable");
        ASSERT_EQ(r.message, std::string("injected stage failure"), "last error verbatim");
        ASSERT_EQ(f.sleeps.size(), 2u, "no sleep after final attempt");
        auto after = f.session(init.upload_id);
        ASSERT_TRUE(after.block_ids.empty(), "nothing recorded");
        ASSERT_EQ(after.version, before.version, "no write");
        ASSERT_EQ(f.coordinator->get_stats().chunks_failed, 1u, "failure counted");

        // A retry by the client succeeds once the backend recovers
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, data).ok(), "client retry");
        PASS();
    }

    {
        TEST(stage_is_idempotent);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        auto data = bytes_of("same");
        auto first = f.coordinator->stage_chunk(init.upload_id, 0, data);
        auto second = f.coordinator->stage_chunk(init.upload_id, 0, data);
        ASSERT_TRUE(first.ok() && second.ok(), "both succeed");
        ASSERT_TRUE(first.newly_recorded, "first records");
        ASSERT_TRUE(!second.newly_recorded, "second is a no-op");
        ASSERT_EQ(second.progress, 50.0, "progress unchanged");
        ASSERT_EQ(f.session(init.upload_id).block_ids.size(), 1u, "one entry");
        PASS();
    }

    {
        TEST(commit_failure_keeps_session_open);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        auto data = bytes_of("abc");
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, data).ok(), "stage");
        f.backend.fail_next_commits(3);
        auto r = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(r.error == UploadError::CommitFailed, "commit failed");
        ASSERT_TRUE(is_retryable(r.error), "retryable");
        ASSERT_EQ(r.message, std::string("injected commit failure"), "last error verbatim");
        ASSERT_TRUE(!f.session(init.upload_id).completed, "still open");
        ASSERT_EQ(f.coordinator->get_stats().commits_failed, 1u, "counted");

        auto retry = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(retry.ok(), "retry succeeds: " + retry.message);
        PASS();
    }

    {
        TEST(commit_recovers_after_one_failure);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("f.bin", 100);
        f.backend.fail_next_commits(1);
        auto r = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(r.ok(), "complete: " + r.message);
        ASSERT_EQ(f.backend.commit_calls(), 2, "one retry");
        ASSERT_EQ(f.sleeps.size(), 1u, "one backoff");
        PASS();
    }
}

static void test_coordinator_ordering() {
    std::cout << "\n=== Coordinator commit order ===" << std::endl;

    {
        TEST(arrival_order_by_default);
        CoordinatorFixture f(50, 1000, false);
        auto init = f.coordinator->init_upload("f.bin", 150);
        for (int idx : {2, 0, 1}) {
            auto data = bytes_of(std::string(1, static_cast<char>('a' + idx)));
            ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, idx, data).ok(), "stage");
        }
        ASSERT_TRUE(f.coordinator->complete_upload(init.upload_id).ok(), "complete");
        ASSERT_EQ(f.backend.object("f.bin"), std::string("cab"), "arrival order");
        PASS();
    }

    {
        TEST(index_order_when_configured);
        CoordinatorFixture f(50, 1000, true);
        auto init = f.coordinator->init_upload("f.bin", 150);
        for (int idx : {2, 0, 1}) {
            auto data = bytes_of(std::string(1, static_cast<char>('a' + idx)));
            ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, idx, data).ok(), "stage");
        }
        ASSERT_TRUE(f.coordinator->complete_upload(init.upload_id).ok(), "complete");
        ASSERT_EQ(f.backend.object("f.bin"), std::string("abc"), "index order");
        auto s = f.session(init.upload_id);
        ASSERT_EQ(s.block_ids[0], make_block_id(init.upload_id, 2), "record keeps arrival order");
        PASS();
    }
}

static void test_coordinator_races() {
    std::cout << "\n=== Coordinator races ===" << std::endl;

    {
        TEST(concurrent_stages_all_recorded);
        CoordinatorFixture f(10, 100000);
        auto init = f.coordinator->init_upload("par.bin", 640);
        constexpr int kThreads = 8;
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t] {
                for (int i = t; i < 64; i += kThreads) {
                    auto data = bytes_of(std::string(10, static_cast<char>('0' + t)));
                    if (!f.coordinator->stage_chunk(init.upload_id, i, data).ok()) failures++;
                }
            });
        }
        for (auto& th : threads) th.join();
        ASSERT_EQ(failures.load(), 0, "no failed stages");
        auto s = f.session(init.upload_id);
        ASSERT_EQ(s.block_ids.size(), 64u, "all 64 recorded");
        ASSERT_TRUE(s.missing_chunks().empty(), "nothing missing");
        ASSERT_EQ(s.progress_percentage(), 100.0, "full progress");
        PASS();
    }

    {
        TEST(stage_landing_during_complete_is_committed);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("race.bin", 100);
        auto c0 = bytes_of(std::string(50, 'a'));
        auto c1 = bytes_of(std::string(50, 'b'));
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, c0).ok(), "stage 0");

        // Chunk 1 is recorded after complete read the session but before it
        // marks the session completed
        StageResult late;
        f.backend.on_next_commit([&] {
            late = f.coordinator->stage_chunk(init.upload_id, 1, c1);
        });
        auto done = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(late.ok(), "late stage accepted: " + late.message);
        ASSERT_TRUE(done.ok(), "complete: " + done.message);
        ASSERT_EQ(done.block_count, 2u, "late block included");
        auto commits = f.backend.commits();
        ASSERT_EQ(commits.size(), 2u, "recommitted");
        ASSERT_EQ(commits.back().size(), 2u, "final commit lists both");
        ASSERT_EQ(f.backend.object("race.bin"), std::string(50, 'a') + std::string(50, 'b'),
                  "object has both chunks");
        ASSERT_TRUE(f.coordinator->get_stats().cas_conflicts >= 1, "conflict observed");
        PASS();
    }

    {
        TEST(stage_after_completion_is_rejected);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("race.bin", 100);
        auto c0 = bytes_of(std::string(50, 'a'));
        ASSERT_TRUE(f.coordinator->stage_chunk(init.upload_id, 0, c0).ok(), "stage 0");

        // Completion lands while chunk 1 is being staged
        CompleteResult done;
        f.backend.on_next_stage([&] {
            done = f.coordinator->complete_upload(init.upload_id);
        });
        auto c1 = bytes_of(std::string(50, 'b'));
        auto late = f.coordinator->stage_chunk(init.upload_id, 1, c1);
        ASSERT_TRUE(done.ok(), "complete: " + done.message);
        ASSERT_TRUE(late.error == UploadError::AlreadyCompleted, "late stage rejected");
        ASSERT_TRUE(!is_retryable(late.error), "not retryable");
        auto s = f.session(init.upload_id);
        ASSERT_EQ(s.block_ids.size(), 1u, "late block not recorded");
        PASS();
    }

    {
        TEST(stage_after_cancel_does_not_resurrect);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("gone.bin", 100);
        f.backend.on_next_stage([&] {
            f.coordinator->cancel_upload(init.upload_id);
        });
        auto data = bytes_of("abc");
        auto r = f.coordinator->stage_chunk(init.upload_id, 0, data);
        ASSERT_TRUE(r.error == UploadError::SessionNotFound, "stage sees cancellation");
        ASSERT_TRUE(!f.store->get(init.upload_id).session, "session stays deleted");
        PASS();
    }

    {
        TEST(cancel_during_complete);
        CoordinatorFixture f;
        auto init = f.coordinator->init_upload("gone.bin", 100);
        f.backend.on_next_commit([&] {
            f.coordinator->cancel_upload(init.upload_id);
        });
        auto r = f.coordinator->complete_upload(init.upload_id);
        ASSERT_TRUE(r.error == UploadError::SessionNotFound, "complete sees cancellation");
        ASSERT_TRUE(!f.store->get(init.upload_id).session, "session stays deleted");
        PASS();
    }
}

static void test_error_codes() {
    std::cout << "\n=== Error codes ===" << std::endl;

    {
        TEST(codes_and_retryability);
        ASSERT_EQ(std::string(error_code_name(UploadError::SizeExceeded)), std::string("size_exceeded"), "size");
        ASSERT_EQ(std::string(error_code_name(UploadError::SessionNotFound)), std::string("session_not_found"), "nf");
        ASSERT_EQ(std::string(error_code_name(UploadError::AlreadyCompleted)), std::string("already_completed"), "ac");
        ASSERT_EQ(std::string(error_code_name(UploadError::StagingFailed)), std::string("staging_failed"), "sf");
        ASSERT_EQ(std::string(error_code_name(UploadError::CommitFailed)), std::string("commit_failed"), "cf");
        ASSERT_EQ(std::string(error_code_name(UploadError::StoreUnavailable)), std::string("store_unavailable"), "su");
        ASSERT_EQ(std::string(error_code_name(UploadError::InvalidArgument)), std::string("invalid_argument"), "ia");
        ASSERT_TRUE(is_retryable(UploadError::StagingFailed), "staging retryable");
        ASSERT_TRUE(is_retryable(UploadError::CommitFailed), "commit retryable");
        ASSERT_TRUE(is_retryable(UploadError::StoreUnavailable), "store retryable");
        ASSERT_TRUE(!is_retryable(UploadError::SizeExceeded), "size not retryable");
        ASSERT_TRUE(!is_retryable(UploadError::SessionNotFound), "not found not retryable");
        ASSERT_TRUE(!is_retryable(UploadError::AlreadyCompleted), "completed not retryable");
        ASSERT_TRUE(!is_retryable(UploadError::InvalidArgument), "invalid not retryable");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "blobup upload test suite" << std::endl;
    std::cout << "========================" << std::endl;

    test_session_model();
    test_ids();
    test_sanitize_blob_name();
    test_http_client();
    test_session_stores();
    test_coordinator_lifecycle();
    test_coordinator_retry();
    test_coordinator_ordering();
    test_coordinator_races();
    test_error_codes();

    std::cout << "\n========================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
