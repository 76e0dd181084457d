#include "blobup/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace blobup::net {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

// ============================================================================
// Encoding
// ============================================================================

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";
constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

// Sextet value per byte, -1 outside the alphabet
const std::array<int8_t, 256>& base64_sextets() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t;
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(BASE64_ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

}  // namespace

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (start < path.size()) {
        size_t slash = path.find('/', start);
        size_t end = slash == std::string::npos ? path.size() : slash;
        if (!out.empty()) out += '/';
        out += url_encode(path.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t group = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += BASE64_ALPHABET[(group >> 18) & 0x3F];
        out += BASE64_ALPHABET[(group >> 12) & 0x3F];
        out += BASE64_ALPHABET[(group >> 6) & 0x3F];
        out += BASE64_ALPHABET[group & 0x3F];
    }

    size_t tail = data.size() - i;
    if (tail > 0) {
        uint32_t group = uint32_t(data[i]) << 16;
        if (tail == 2) group |= uint32_t(data[i + 1]) << 8;
        out += BASE64_ALPHABET[(group >> 18) & 0x3F];
        out += BASE64_ALPHABET[(group >> 12) & 0x3F];
        out += tail == 2 ? BASE64_ALPHABET[(group >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    const auto& sextets = base64_sextets();
    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    uint32_t acc = 0;
    int pending_bits = 0;
    for (unsigned char c : encoded) {
        int v = sextets[c];
        if (v < 0) continue;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        pending_bits += 6;
        if (pending_bits >= 8) {
            pending_bits -= 8;
            out.push_back(static_cast<uint8_t>(acc >> pending_bits));
            acc &= (1u << pending_bits) - 1;
        }
    }
    return out;
}

// ============================================================================
// Headers, requests, responses
// ============================================================================

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

}  // namespace

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lowercase(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lowercase(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::vector<std::pair<std::string, std::string>> HttpHeaders::all() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) out.emplace_back(name, value);
    }
    return out;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value) return std::nullopt;
    try {
        return std::stoull(*value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, const std::string& body) {
    return put(url, std::vector<uint8_t>(body.begin(), body.end()));
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

std::string HttpResponse::describe() const {
    if (status_code == 0) return error.empty() ? "no response" : error;
    std::string msg = "HTTP " + std::to_string(status_code);
    if (!error.empty()) msg += ": " + error;
    return msg;
}

// ============================================================================
// libcurl transfer
// ============================================================================

namespace {

// Per-transfer state shared with the libcurl callbacks
struct Transfer {
    const std::vector<uint8_t>* upload = nullptr;
    size_t upload_offset = 0;

    std::vector<uint8_t> download;
    size_t download_limit = 0;
    bool download_overflow = false;

    HttpHeaders* headers = nullptr;
};

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = std::min(size * nitems, t->upload->size() - t->upload_offset);
    if (n > 0) {
        std::memcpy(buffer, t->upload->data() + t->upload_offset, n);
        t->upload_offset += n;
    }
    return n;
}

size_t on_download(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;
    if (t->download_limit > 0 && t->download.size() + n > t->download_limit) {
        t->download_overflow = true;
        return 0;  // aborts the transfer
    }
    t->download.insert(t->download.end(), ptr, ptr + n);
    return n;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nitems;

    std::string line(buffer, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    size_t colon = line.find(':');
    if (line.empty() || line.starts_with("HTTP/") || colon == std::string::npos) return n;

    size_t value_start = line.find_first_not_of(" \t", colon + 1);
    t->headers->add(line.substr(0, colon),
                    value_start == std::string::npos ? std::string() : line.substr(value_start));
    return n;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList build_header_list(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers.all()) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    // No "Expect: 100-continue" round trip before block uploads
    list = curl_slist_append(list, "Expect:");
    return HeaderList(list);
}

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        Lease lease(*this);
        if (!lease.handle) {
            response.error = "curl_easy_init failed";
            return response;
        }
        CURL* curl = lease.handle;

        Transfer transfer;
        transfer.upload = &request.body;
        transfer.download_limit = config_.max_response_size;
        transfer.headers = &response.headers;

        HeaderList header_list = build_header_list(request.headers);
        configure(curl, request, transfer, header_list.get());

        CURLcode rc = curl_easy_perform(curl);
        if (transfer.download_overflow) {
            response.error = "response body exceeded " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
        } else {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
            response.body = std::move(transfer.download);
        }
        return response;
    }

private:
    // Borrows a handle from the pool and hands it back, reset, on scope exit
    struct Lease {
        Impl& owner;
        CURL* handle;

        explicit Lease(Impl& impl) : owner(impl), handle(impl.checkout()) {}
        ~Lease() {
            if (handle) owner.checkin(handle);
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
    };

    void configure(CURL* curl, const HttpRequest& request, Transfer& transfer,
                   curl_slist* header_list) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
                curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
                // Sent even when zero, so empty PUTs carry Content-Length: 0
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_download);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

        auto connect_timeout = request.connect_timeout.value_or(config_.default_connect_timeout);
        auto total_timeout = request.total_timeout.value_or(config_.default_total_timeout);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        if (config_.keepalive_idle.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.keepalive_idle.count()));
        }

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
    }

    CURL* checkout() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void checkin(CURL* handle) {
        // Options are cleared; the connection cache survives the reset
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

}  // namespace blobup::net
