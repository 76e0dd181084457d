#include "blobup/service_config.hpp"
#include "blobup/blob_backend.hpp"
#include "blobup/constants.hpp"
#include "blobup/upload_session.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace blobup {

namespace {

bool has_param(const std::map<std::string, std::string>& params, const char* key) {
    auto it = params.find(key);
    return it != params.end() && !it->second.empty();
}

// Map a --store-X / --backend-X suffix to its factory parameter name.
// Returns empty when the suffix is not recognized.
std::string store_param_name(const std::string& suffix) {
    if (suffix == "path") return "path";
    if (suffix == "endpoint") return "endpoint";
    if (suffix == "prefix") return "prefix";
    if (suffix == "token") return "token";
    if (suffix == "timeout") return "timeout";
    if (suffix == "ca-bundle") return "ca_bundle";
    return {};
}

std::string backend_param_name(const std::string& suffix) {
    if (suffix == "path") return "path";
    if (suffix == "endpoint") return "endpoint";
    if (suffix == "container") return "container";
    if (suffix == "account-name") return "account_name";
    if (suffix == "account-key") return "account_key";
    if (suffix == "sas-token") return "sas_token";
    if (suffix == "prefix") return "path_prefix";
    if (suffix == "connect-timeout") return "connect_timeout";
    if (suffix == "request-timeout") return "request_timeout";
    if (suffix == "ca-bundle") return "ca_bundle";
    return {};
}

// JSON block values may be strings, numbers, or booleans; factories take strings.
void load_block(const nlohmann::json& j, std::string& type,
                std::map<std::string, std::string>& params) {
    if (j.contains("type")) type = j["type"].get<std::string>();
    for (auto& [key, val] : j.items()) {
        if (key == "type") continue;
        params[key] = val.is_string() ? val.get<std::string>() : val.dump();
    }
}

void set_from_env(std::map<std::string, std::string>& params, const char* key, const char* env) {
    if (has_param(params, key)) return;
    if (const char* v = std::getenv(env)) {
        if (*v) params[key] = v;
    }
}

const char* usage_text() {
    return
        "Usage: blobup --backend-type <azure|local> [options]\n"
        "\n"
        "Service:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               State directory (default: /var/lib/blobup)\n"
        "  --socket <path>                  Request socket (default: <state-dir>/blobup.sock)\n"
        "  --workers <N>                    Connection worker threads (default: 32)\n"
        "\n"
        "Uploads:\n"
        "  --chunk-size <bytes>             Chunk size (default: 52428800)\n"
        "  --max-file-size <bytes>          Maximum declared file size (default: 1TB)\n"
        "  --retry-attempts <N>             Stage/commit attempts per call (default: 3)\n"
        "  --retry-delay-ms <ms>            Base backoff delay (default: 1000)\n"
        "  --cas-attempts <N>               Conditional write attempts (default: 32)\n"
        "  --order-by-index                 Commit blocks sorted by chunk index\n"
        "\n"
        "Retention:\n"
        "  --session-ttl <secs>             Remove sessions idle this long (default: 604800, 0 = never)\n"
        "  --sweep-interval <secs>          Sweeper period (default: 3600)\n"
        "\n"
        "Session store (--store-*):\n"
        "  --store-type <type>              file, sqlite, kv (default: file)\n"
        "  --store-path <path>              Directory (file) or database (sqlite)\n"
        "  --store-endpoint <url>           KV endpoint, e.g. http://127.0.0.1:8500 (kv)\n"
        "  --store-prefix <prefix>          Key prefix (kv, default: blobup/sessions/)\n"
        "  --store-token <token>            ACL token (kv)\n"
        "  --store-timeout <secs>           Request timeout (kv)\n"
        "  --store-ca-bundle <path>         CA certificates for TLS (kv)\n"
        "  --store-no-verify-ssl            Skip SSL verification (kv)\n"
        "\n"
        "Blob backend (--backend-*):\n"
        "  --backend-type <type>            azure or local\n"
        "  --backend-path <path>            Root directory (local)\n"
        "  --backend-container <name>       Container name (azure)\n"
        "  --backend-account-name <name>    Account name (azure, or AZURE_STORAGE_ACCOUNT env)\n"
        "  --backend-account-key <key>      Account key (azure, or AZURE_STORAGE_KEY env)\n"
        "  --backend-sas-token <token>      SAS token (azure, or AZURE_STORAGE_SAS_TOKEN env)\n"
        "  --backend-endpoint <url>         Custom endpoint, e.g. Azurite (azure)\n"
        "  --backend-prefix <prefix>        Blob name prefix (azure)\n"
        "  --backend-connect-timeout <secs> Connect timeout (azure)\n"
        "  --backend-request-timeout <secs> Request timeout (azure)\n"
        "  --backend-ca-bundle <path>       CA certificates for TLS (azure)\n"
        "  --backend-no-verify-ssl          Skip SSL verification (azure)\n"
        "\n"
        "Daemon:\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --stats-interval <secs>          Stats reporting interval (default: 60, 0 = off)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

// --- StoreConfig / BackendConfig ---

std::string StoreConfig::validate() const {
    if (type.empty()) return "store type is required";
    if (type == "file" || type == "sqlite") {
        if (!has_param(params, "path")) return type + " store requires 'path'";
    } else if (type == "kv") {
        if (!has_param(params, "endpoint")) return "kv store requires 'endpoint'";
    } else {
        return "unknown store type: " + type;
    }
    return {};
}

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "local") {
        if (!has_param(params, "path")) return "local backend requires 'path'";
    } else if (type == "azure") {
        if (!has_param(params, "container")) return "azure backend requires 'container'";
        if (!has_param(params, "account_name")) return "azure backend requires 'account_name'";
        if (!has_param(params, "account_key") && !has_param(params, "sas_token"))
            return "azure backend requires 'account_key' or 'sas_token'";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

std::map<std::string, std::string> mask_secrets(const std::map<std::string, std::string>& params) {
    auto masked = params;
    for (auto& [key, value] : masked) {
        if (key == "account_key" || key == "sas_token" || key == "token") {
            if (!value.empty()) value = "****";
        }
    }
    return masked;
}

// --- ServiceConfig ---

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--store-no-verify-ssl") {
                config.store.params["verify_ssl"] = "false";
                continue;
            }
            if (arg == "--backend-no-verify-ssl") {
                config.backend.params["verify_ssl"] = "false";
                continue;
            }

            // --store-X / --backend-X with a value
            bool is_store = arg.compare(0, 8, "--store-") == 0;
            bool is_backend = arg.compare(0, 10, "--backend-") == 0;
            if (is_store || is_backend) {
                std::string suffix = arg.substr(is_store ? 8 : 10);
                std::string key;
                if (suffix != "type") {
                    key = is_store ? store_param_name(suffix) : backend_param_name(suffix);
                    if (key.empty()) {
                        std::cerr << "Error: unknown option: " << arg << "\n";
                        return std::nullopt;
                    }
                }
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (is_store) {
                    if (key.empty()) config.store.type = v; else config.store.params[key] = v;
                } else {
                    if (key.empty()) config.backend.type = v; else config.backend.params[key] = v;
                }
                continue;
            }

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--socket") {
                auto* v = next_arg(i, "--socket");
                if (!v) return std::nullopt;
                config.socket_path = v;
            } else if (arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.worker_threads = std::stoull(v);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--max-file-size") {
                auto* v = next_arg(i, "--max-file-size");
                if (!v) return std::nullopt;
                config.max_file_size = std::stoull(v);
            } else if (arg == "--retry-attempts") {
                auto* v = next_arg(i, "--retry-attempts");
                if (!v) return std::nullopt;
                config.retry_attempts = std::stoi(v);
            } else if (arg == "--retry-delay-ms") {
                auto* v = next_arg(i, "--retry-delay-ms");
                if (!v) return std::nullopt;
                config.retry_base_delay_ms = std::stoi(v);
            } else if (arg == "--cas-attempts") {
                auto* v = next_arg(i, "--cas-attempts");
                if (!v) return std::nullopt;
                config.cas_max_attempts = std::stoi(v);
            } else if (arg == "--order-by-index") {
                config.order_blocks_by_index = true;
            } else if (arg == "--session-ttl") {
                auto* v = next_arg(i, "--session-ttl");
                if (!v) return std::nullopt;
                config.session_ttl_secs = std::stoll(v);
            } else if (arg == "--sweep-interval") {
                auto* v = next_arg(i, "--sweep-interval");
                if (!v) return std::nullopt;
                config.sweep_interval_secs = std::stoll(v);
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << usage_text();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("socket_path")) socket_path = j["socket_path"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("max_file_size")) max_file_size = j["max_file_size"].get<uint64_t>();
        if (j.contains("retry_attempts")) retry_attempts = j["retry_attempts"].get<int>();
        if (j.contains("retry_base_delay_ms")) retry_base_delay_ms = j["retry_base_delay_ms"].get<int>();
        if (j.contains("cas_max_attempts")) cas_max_attempts = j["cas_max_attempts"].get<int>();
        if (j.contains("order_blocks_by_index")) order_blocks_by_index = j["order_blocks_by_index"].get<bool>();
        if (j.contains("worker_threads")) worker_threads = j["worker_threads"].get<size_t>();
        if (j.contains("session_ttl_secs")) session_ttl_secs = j["session_ttl_secs"].get<int64_t>();
        if (j.contains("sweep_interval_secs")) sweep_interval_secs = j["sweep_interval_secs"].get<int64_t>();
        if (j.contains("stats_interval_secs")) stats_interval_secs = j["stats_interval_secs"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs")) metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();
        if (j.contains("daemonize")) daemonize = j["daemonize"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        if (j.contains("store") && j["store"].is_object()) {
            load_block(j["store"], store.type, store.params);
        }
        if (j.contains("backend") && j["backend"].is_object()) {
            load_block(j["backend"], backend.type, backend.params);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (state_dir.empty()) state_dir = constants::DEFAULT_STATE_DIR;
    if (socket_path.empty()) socket_path = state_dir / constants::DEFAULT_SOCKET_NAME;

    if (chunk_size == 0) chunk_size = constants::DEFAULT_CHUNK_SIZE;
    if (max_file_size == 0) max_file_size = constants::DEFAULT_MAX_FILE_SIZE;
    if (retry_attempts == 0) retry_attempts = constants::DEFAULT_RETRY_ATTEMPTS;
    if (retry_base_delay_ms < 0) retry_base_delay_ms = constants::DEFAULT_RETRY_BASE_DELAY_MS;
    if (cas_max_attempts == 0) cas_max_attempts = constants::DEFAULT_CAS_MAX_ATTEMPTS;
    if (worker_threads == 0) worker_threads = constants::DEFAULT_WORKER_THREADS;
    if (session_ttl_secs < 0) session_ttl_secs = constants::DEFAULT_SESSION_TTL_SECONDS;
    if (sweep_interval_secs == 0) sweep_interval_secs = constants::DEFAULT_SWEEP_INTERVAL_SECONDS;

    if (store.empty()) store.type = "file";
    if (store.type == "file" && !has_param(store.params, "path")) {
        store.params["path"] = (state_dir / "sessions").string();
    } else if (store.type == "sqlite" && !has_param(store.params, "path")) {
        store.params["path"] = (state_dir / "sessions.db").string();
    }

    if (backend.type == "azure") {
        set_from_env(backend.params, "account_name", "AZURE_STORAGE_ACCOUNT");
        // Env credentials apply only when none were configured explicitly
        if (!has_param(backend.params, "sas_token")) {
            set_from_env(backend.params, "account_key", "AZURE_STORAGE_KEY");
        }
        if (!has_param(backend.params, "account_key")) {
            set_from_env(backend.params, "sas_token", "AZURE_STORAGE_SAS_TOKEN");
        }
    }
}

std::string ServiceConfig::validate() const {
    if (state_dir.empty()) return "state_dir is required (--state-dir)";
    if (socket_path.empty()) return "socket_path is required (--socket)";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (max_file_size == 0) return "max_file_size must be > 0";
    if (retry_attempts < 1) return "retry_attempts must be >= 1";
    if (retry_base_delay_ms < 0) return "retry_base_delay_ms must be >= 0";
    if (cas_max_attempts < 1) return "cas_max_attempts must be >= 1";
    if (worker_threads == 0) return "worker_threads must be > 0";
    if (session_ttl_secs < 0) return "session_ttl_secs must be >= 0";
    if (sweep_interval_secs <= 0) return "sweep_interval_secs must be > 0";
    if (metrics_interval_secs == 0) return "metrics_interval_secs must be > 0";

    auto err = store.validate();
    if (!err.empty()) return "store: " + err;
    if (backend.empty()) return "backend type is required (--backend-type)";
    err = backend.validate();
    if (!err.empty()) return "backend: " + err;

    uint64_t chunks = chunk_count(max_file_size, chunk_size);
    uint64_t max_blocks = max_block_count_for(backend.type);
    if (chunks > max_blocks) {
        return "max_file_size " + std::to_string(max_file_size) + " needs " +
               std::to_string(chunks) + " chunks of chunk_size " + std::to_string(chunk_size) +
               "; the " + backend.type + " backend allows " + std::to_string(max_blocks);
    }
    return {};
}

}  // namespace blobup
