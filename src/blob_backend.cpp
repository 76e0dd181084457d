#include "blobup/blob_backend.hpp"

#include "blobup/constants.hpp"
#include "blobup/http.hpp"
#include "blobup/log.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace blobup {

namespace fs = std::filesystem;

// ============================================================================
// Blob name sanitization
// ============================================================================

namespace {

std::string percent_byte(unsigned char c) {
    char buf[4];
    snprintf(buf, sizeof(buf), "%%%02X", c);
    return buf;
}

std::string sanitize_segment(const std::string& segment) {
    // Trailing dots are not allowed at the end of a segment
    size_t keep = segment.size();
    while (keep > 0 && segment[keep - 1] == '.') --keep;

    std::string out;
    for (size_t i = 0; i < segment.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(segment[i]);
        if (c < 0x20 || c == 0x7F || i >= keep) {
            out += percent_byte(c);
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

// Cut an encoded segment to at most `limit` bytes without splitting a %XX
// escape or a UTF-8 sequence.
std::string truncate_segment(const std::string& encoded, size_t limit) {
    size_t cut = std::min(limit, encoded.size());
    while (cut > 0 && cut < encoded.size() &&
           (static_cast<unsigned char>(encoded[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    for (size_t back = 1; back <= 2 && back <= cut; ++back) {
        if (encoded[cut - back] == '%') {
            cut -= back;
            break;
        }
    }
    std::string out = encoded.substr(0, cut);
    while (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

}  // namespace

std::string sanitize_blob_name(const std::string& filename) {
    std::string normalized = filename;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::string result;
    size_t segments = 0;
    size_t start = 0;
    while (start <= normalized.size() && segments < constants::MAX_BLOB_NAME_SEGMENTS) {
        size_t slash = normalized.find('/', start);
        if (slash == std::string::npos) slash = normalized.size();
        std::string segment = normalized.substr(start, slash - start);
        start = slash + 1;
        if (segment.empty()) continue;

        std::string encoded = sanitize_segment(segment);
        size_t sep = result.empty() ? 0 : 1;
        size_t room = constants::MAX_BLOB_NAME_LENGTH - std::min(result.size() + sep,
                                                                 constants::MAX_BLOB_NAME_LENGTH);
        if (encoded.size() > room) {
            encoded = truncate_segment(encoded, room);
            if (!encoded.empty()) {
                if (sep) result += '/';
                result += encoded;
            }
            break;
        }

        if (sep) result += '/';
        result += encoded;
        ++segments;
    }
    return result;
}

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream ss;
    for (unsigned char b : hash) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02x", b);
        ss << buf;
    }
    return ss.str();
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result.data(), &len);
    result.resize(len);
    return result;
}

int64_t file_time_to_epoch(fs::file_time_type ftime) {
    auto sys = std::chrono::file_clock::to_sys(ftime);
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

// "Wed, 21 Oct 2015 07:28:00 GMT"
int64_t parse_http_date(const std::string& value) {
    struct tm tm_val = {};
    if (strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S", &tm_val) == nullptr) return 0;
    return static_cast<int64_t>(timegm(&tm_val));
}

// Value between <tag> and </tag>, empty if absent
std::string xml_element(const std::string& xml, const std::string& tag) {
    std::string open = "<" + tag + ">";
    std::string close = "</" + tag + ">";
    auto start = xml.find(open);
    if (start == std::string::npos) return {};
    start += open.size();
    auto end = xml.find(close, start);
    if (end == std::string::npos) return {};
    return xml.substr(start, end - start);
}

// ============================================================================
// LocalBlobBackend - filesystem staging area per object
// ============================================================================

// Layout under root:
//   <object_name>                       committed objects
//   .blocks/<sha256(object_name)>/<id>  staged blocks, id url-encoded
//
// Commit concatenates the listed blocks into a temp file and renames it over
// the object. Listed blocks stay addressable for later commits; unlisted
// blocks are discarded, as the remote store does.
class LocalBlobBackend : public BlobBackend {
public:
    explicit LocalBlobBackend(const fs::path& root)
        : root_(fs::absolute(root)) {
        fs::create_directories(root_ / ".blocks");
    }

    std::string type_name() const override { return "local"; }

    BlobResult stage_block(const std::string& object_name,
                           const std::string& block_id,
                           std::span<const uint8_t> data) override {
        BlobResult result;
        std::string err = check_name(object_name);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }
        if (block_id.empty()) {
            result.error_message = "empty block id";
            return result;
        }

        auto dir = staging_dir(object_name);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            result.error_message = "Failed to create staging dir: " + ec.message();
            return result;
        }

        auto path = dir / net::url_encode(block_id);
        return write_atomic(path, data);
    }

    BlobResult commit_block_list(const std::string& object_name,
                                 const std::vector<std::string>& block_ids) override {
        BlobResult result;
        std::string err = check_name(object_name);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }

        std::lock_guard<std::mutex> lock(commit_mutex_);

        auto dir = staging_dir(object_name);
        for (const auto& id : block_ids) {
            if (!fs::exists(dir / net::url_encode(id))) {
                result.error_message = "InvalidBlockList: block not staged: " + id;
                return result;
            }
        }

        auto path = object_path(object_name);
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            result.error_message = "Failed to create object dir: " + ec.message();
            return result;
        }

        auto temp_path = path.string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                result.error_message = "Failed to create file: " + temp_path;
                return result;
            }
            for (const auto& id : block_ids) {
                std::ifstream in(dir / net::url_encode(id), std::ios::binary);
                if (!in) {
                    out.close();
                    fs::remove(temp_path, ec);
                    result.error_message = "Failed to read staged block: " + id;
                    return result;
                }
                out << in.rdbuf();
            }
            out.flush();
            if (!out) {
                out.close();
                fs::remove(temp_path, ec);
                result.error_message = "Failed to write object data";
                return result;
            }
        }

        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        discard_unlisted(dir, block_ids);
        result.success = true;
        return result;
    }

    BlobResult delete_object(const std::string& object_name) override {
        BlobResult result;
        std::string err = check_name(object_name);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }

        std::lock_guard<std::mutex> lock(commit_mutex_);
        std::error_code ec;
        fs::remove(object_path(object_name), ec);
        if (ec) {
            result.error_message = "Failed to remove object: " + ec.message();
            return result;
        }
        fs::remove_all(staging_dir(object_name), ec);
        result.success = true;
        return result;
    }

    PropertiesResult get_object_properties(const std::string& object_name) const override {
        PropertiesResult result;
        std::string err = check_name(object_name);
        if (!err.empty()) {
            result.error_message = err;
            return result;
        }

        std::error_code ec;
        auto path = object_path(object_name);
        auto status = fs::status(path, ec);
        if (ec || !fs::is_regular_file(status)) {
            result.success = true;
            result.found = false;
            return result;
        }

        result.properties.size = fs::file_size(path, ec);
        auto mtime = fs::last_write_time(path, ec);
        if (!ec) {
            result.properties.modified_at = file_time_to_epoch(mtime);
            // No portable birth time; a commit rewrites the whole file anyway
            result.properties.created_at = result.properties.modified_at;
        }
        result.success = true;
        result.found = true;
        return result;
    }

    bool is_healthy() const override {
        std::error_code ec;
        return fs::is_directory(root_, ec);
    }

private:
    fs::path root_;
    std::mutex commit_mutex_;

    static std::string check_name(const std::string& object_name) {
        if (object_name.empty()) return "empty object name";
        if (object_name.front() == '/') return "object name must be relative: " + object_name;
        for (const auto& part : fs::path(object_name)) {
            if (part == ".." || part == ".") return "invalid object name: " + object_name;
        }
        if (object_name.rfind(".blocks", 0) == 0) return "reserved object name: " + object_name;
        return {};
    }

    fs::path object_path(const std::string& object_name) const {
        return root_ / object_name;
    }

    fs::path staging_dir(const std::string& object_name) const {
        return root_ / ".blocks" / sha256_hex(object_name);
    }

    static BlobResult write_atomic(const fs::path& path, std::span<const uint8_t> data) {
        BlobResult result;
        auto temp_path = path.string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error_message = "Failed to create file: " + temp_path;
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                file.close();
                std::error_code ec;
                fs::remove(temp_path, ec);
                result.error_message = "Failed to write data";
                return result;
            }
        }

        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        result.success = true;
        return result;
    }

    static void discard_unlisted(const fs::path& dir, const std::vector<std::string>& block_ids) {
        std::vector<std::string> keep;
        keep.reserve(block_ids.size());
        for (const auto& id : block_ids) keep.push_back(net::url_encode(id));
        std::sort(keep.begin(), keep.end());

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (name.find(".tmp.") != std::string::npos) continue;  // stage in flight
            if (!std::binary_search(keep.begin(), keep.end(), name)) {
                std::error_code rm_ec;
                fs::remove(entry.path(), rm_ec);
            }
        }
    }
};

// ============================================================================
// AzureBlobBackend - Azure Blob REST API (Put Block / Put Block List)
// ============================================================================

class AzureBlobBackend : public BlobBackend {
public:
    struct Config {
        std::string account_name;
        std::string account_key;        // SharedKey auth
        std::string sas_token;          // Alternative: SAS token auth
        std::string container;
        std::string path_prefix;
        std::string endpoint;           // Empty for Azure, custom for Azurite
        bool verify_ssl = true;
        std::string ca_bundle;
        int connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        int request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit AzureBlobBackend(const Config& config)
        : config_(config) {
        if (!config_.sas_token.empty() && config_.sas_token.front() == '?') {
            config_.sas_token.erase(0, 1);
        }
        net::HttpClientConfig http_config;
        http_config.user_agent = "blobup-azure/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_config.ca_bundle = config_.ca_bundle;
        http_config.default_connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        http_config.default_total_timeout = std::chrono::seconds(config_.request_timeout_secs);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "azure"; }

    BlobResult stage_block(const std::string& object_name,
                           const std::string& block_id,
                           std::span<const uint8_t> data) override {
        auto url = build_url(object_name) + "?comp=block&blockid=" + net::url_encode(block_id);
        auto request = net::HttpRequest::put(url, std::vector<uint8_t>(data.begin(), data.end()));
        return send(request, object_name);
    }

    BlobResult commit_block_list(const std::string& object_name,
                                 const std::vector<std::string>& block_ids) override {
        std::ostringstream xml;
        xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
        xml << "<BlockList>\n";
        for (const auto& bid : block_ids) {
            xml << "  <Latest>" << bid << "</Latest>\n";
        }
        xml << "</BlockList>";
        std::string body = xml.str();

        auto url = build_url(object_name) + "?comp=blocklist";
        auto request = net::HttpRequest::put(url, body);
        request.headers.set_content_type("application/xml");
        request.headers.set("x-ms-blob-content-type", "application/octet-stream");
        return send(request, object_name);
    }

    BlobResult delete_object(const std::string& object_name) override {
        auto request = net::HttpRequest::del(build_url(object_name));
        auto result = send(request, object_name);
        if (!result.success && result.status_code == 404) {
            result.success = true;
            result.error_message.clear();
        }
        return result;
    }

    PropertiesResult get_object_properties(const std::string& object_name) const override {
        PropertiesResult result;
        auto request = net::HttpRequest::head(build_url(object_name));
        prepare(request, object_name);

        auto response = http_client_->execute(request);
        if (response.status_code == 404) {
            result.success = true;
            result.found = false;
            return result;
        }
        if (!response.ok()) {
            result.error_message = response.describe();
            return result;
        }

        result.success = true;
        result.found = true;
        result.properties.size = response.headers.content_length().value_or(0);
        result.properties.etag = response.headers.get("ETag").value_or("");
        result.properties.modified_at =
            parse_http_date(response.headers.get("Last-Modified").value_or(""));
        result.properties.created_at =
            parse_http_date(response.headers.get("x-ms-creation-time").value_or(""));
        return result;
    }

    // Get Container Properties, then Create Container on 404. A 409 means
    // another writer created it first.
    BlobResult ensure_container() override {
        auto lookup = net::HttpRequest::get(build_container_url() + "?restype=container");
        auto result = send(lookup, "");
        if (result.success || result.status_code != 404) return result;

        auto create = net::HttpRequest::put(build_container_url() + "?restype=container",
                                            std::vector<uint8_t>{});
        result = send(create, "");
        if (result.success) {
            log_info("Created container %s", config_.container.c_str());
        } else if (result.status_code == 409) {
            result.success = true;
            result.error_message.clear();
        }
        return result;
    }

    uint64_t max_block_count() const override { return constants::AZURE_MAX_BLOCKS_PER_BLOB; }

    bool is_healthy() const override {
        auto url = build_container_url() + "?restype=container&comp=list&maxresults=1";
        auto request = net::HttpRequest::get(url);
        prepare(request, "");
        return http_client_->execute(request).ok();
    }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;

    std::string blob_path(const std::string& object_name) const {
        return config_.path_prefix + object_name;
    }

    std::string build_container_url() const {
        if (!config_.endpoint.empty()) {
            std::string ep = config_.endpoint;
            while (!ep.empty() && ep.back() == '/') ep.pop_back();
            return ep + "/" + config_.container;
        }
        return "https://" + config_.account_name + ".blob.core.windows.net/" + config_.container;
    }

    std::string build_url(const std::string& object_name) const {
        return build_container_url() + "/" + net::url_encode_path(blob_path(object_name));
    }

    BlobResult send(net::HttpRequest& request, const std::string& object_name) const {
        prepare(request, object_name);
        auto response = http_client_->execute(request);

        BlobResult result;
        result.status_code = response.status_code;
        if (response.ok()) {
            result.success = true;
            return result;
        }

        result.error_message = response.describe();
        std::string body = response.body_string();
        std::string code = xml_element(body, "Code");
        if (!code.empty()) {
            result.error_message += " " + code;
            std::string message = xml_element(body, "Message");
            auto nl = message.find('\n');
            if (nl != std::string::npos) message.resize(nl);
            if (!message.empty()) result.error_message += ": " + message;
        }
        return result;
    }

    void prepare(net::HttpRequest& request, const std::string& object_name) const {
        add_common_headers(request);
        sign_request(request, object_name);
    }

    static void add_common_headers(net::HttpRequest& request) {
        // Azure requires x-ms-date and x-ms-version on all requests
        auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf;
        gmtime_r(&time_t_now, &tm_buf);
        char date_buf[64];
        strftime(date_buf, sizeof(date_buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);

        request.headers.set("x-ms-date", date_buf);
        request.headers.set("x-ms-version", "2020-10-02");
    }

    static std::string url_decode(const std::string& s) {
        std::string out;
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                int value = 0;
                if (sscanf(s.substr(i + 1, 2).c_str(), "%2x", &value) == 1) {
                    out += static_cast<char>(value);
                    i += 2;
                    continue;
                }
            }
            out += s[i];
        }
        return out;
    }

    // SharedKey signing, or SAS token appended to the query string
    void sign_request(net::HttpRequest& request, const std::string& object_name) const {
        if (!config_.sas_token.empty()) {
            auto& url = request.url;
            url += (url.find('?') != std::string::npos ? "&" : "?") + config_.sas_token;
            return;
        }

        // VERB\nContent-Encoding\nContent-Language\nContent-Length\nContent-MD5\n
        // Content-Type\nDate\nIf-Modified-Since\nIf-Match\nIf-None-Match\n
        // If-Unmodified-Since\nRange\nCanonicalizedHeaders\nCanonicalizedResource
        std::string string_to_sign;
        string_to_sign += std::string(net::http_method_to_string(request.method)) + "\n";
        string_to_sign += "\n";  // Content-Encoding
        string_to_sign += "\n";  // Content-Language
        if (!request.body.empty()) {
            string_to_sign += std::to_string(request.body.size()) + "\n";
        } else {
            string_to_sign += "\n";  // empty when zero since 2015-02-21
        }
        string_to_sign += "\n";  // Content-MD5
        string_to_sign += request.headers.content_type().value_or("") + "\n";
        string_to_sign += "\n";  // Date (x-ms-date is used)
        string_to_sign += "\n";  // If-Modified-Since
        string_to_sign += request.headers.get("If-Match").value_or("") + "\n";
        string_to_sign += request.headers.get("If-None-Match").value_or("") + "\n";
        string_to_sign += "\n";  // If-Unmodified-Since
        string_to_sign += request.headers.get("x-ms-range").value_or("") + "\n";

        // HttpHeaders stores lowercase names in sorted order
        for (const auto& [name, value] : request.headers.all()) {
            if (name.rfind("x-ms-", 0) == 0) {
                string_to_sign += name + ":" + value + "\n";
            }
        }

        string_to_sign += "/" + config_.account_name + "/" + config_.container;
        if (!object_name.empty()) {
            string_to_sign += "/" + net::url_encode_path(blob_path(object_name));
        }

        auto qpos = request.url.find('?');
        if (qpos != std::string::npos) {
            std::string query = request.url.substr(qpos + 1);
            std::map<std::string, std::string> params;
            size_t pos = 0;
            while (pos < query.size()) {
                auto amp = query.find('&', pos);
                std::string param = amp != std::string::npos ? query.substr(pos, amp - pos)
                                                             : query.substr(pos);
                auto eq = param.find('=');
                if (eq != std::string::npos) {
                    params[param.substr(0, eq)] = url_decode(param.substr(eq + 1));
                } else {
                    params[param] = "";
                }
                pos = amp != std::string::npos ? amp + 1 : query.size();
            }
            for (const auto& [pname, pval] : params) {
                string_to_sign += "\n" + pname + ":" + pval;
            }
        }

        auto signature = hmac_sha256(net::base64_decode(config_.account_key), string_to_sign);
        request.headers.set("Authorization",
                            "SharedKey " + config_.account_name + ":" + net::base64_encode(signature));
    }
};

bool parse_bool_param(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

int parse_int_param(const std::string& key, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for '" + key + "': " + value);
    }
}

}  // namespace

uint64_t max_block_count_for(const std::string& backend_type) {
    if (backend_type == "azure") return constants::AZURE_MAX_BLOCKS_PER_BLOB;
    return constants::MAX_BLOCKS_PER_UPLOAD;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<BlobBackend> BlobBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "local") {
        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("Local backend requires 'path' config");
        }
        return std::make_unique<LocalBlobBackend>(it->second);
    }

    if (type == "azure") {
        AzureBlobBackend::Config azure_config;

        auto it = params.find("container");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("Azure backend requires 'container' config");
        }
        azure_config.container = it->second;

        if ((it = params.find("account_name")) != params.end()) azure_config.account_name = it->second;
        if ((it = params.find("account_key")) != params.end()) azure_config.account_key = it->second;
        if ((it = params.find("sas_token")) != params.end()) azure_config.sas_token = it->second;
        if ((it = params.find("endpoint")) != params.end()) azure_config.endpoint = it->second;
        if ((it = params.find("path_prefix")) != params.end()) azure_config.path_prefix = it->second;
        if ((it = params.find("ca_bundle")) != params.end()) azure_config.ca_bundle = it->second;
        if ((it = params.find("verify_ssl")) != params.end()) {
            azure_config.verify_ssl = parse_bool_param(it->second);
        }
        if ((it = params.find("connect_timeout")) != params.end()) {
            azure_config.connect_timeout_secs = parse_int_param(it->first, it->second);
        }
        if ((it = params.find("request_timeout")) != params.end()) {
            azure_config.request_timeout_secs = parse_int_param(it->first, it->second);
        }

        if (azure_config.account_name.empty()) {
            throw std::runtime_error("Azure backend requires 'account_name' config");
        }
        if (azure_config.account_key.empty() && azure_config.sas_token.empty()) {
            throw std::runtime_error("Azure backend requires 'account_key' or 'sas_token'");
        }

        log_debug("azure backend: container=%s endpoint=%s auth=%s",
                  azure_config.container.c_str(),
                  azure_config.endpoint.empty() ? "(default)" : azure_config.endpoint.c_str(),
                  azure_config.sas_token.empty() ? "shared-key" : "sas");
        return std::make_unique<AzureBlobBackend>(azure_config);
    }

    throw std::runtime_error("Unknown blob backend type: " + type);
}

}  // namespace blobup
