#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blobup {

/// Selects and parameterizes a session store ("file", "sqlite", "kv").
struct StoreConfig {
    std::string type;
    std::map<std::string, std::string> params;  // Passed to SessionStoreFactory

    bool empty() const { return type.empty(); }

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Selects and parameterizes a blob backend ("azure", "local").
struct BackendConfig {
    std::string type;
    std::map<std::string, std::string> params;  // Passed to BlobBackendFactory

    bool empty() const { return type.empty(); }

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Copy of params with credential values replaced, for logging.
std::map<std::string, std::string> mask_secrets(const std::map<std::string, std::string>& params);

/// Configuration for the blobup daemon and the blobup-sessions tool.
struct ServiceConfig {
    std::filesystem::path state_dir;    // Default: /var/lib/blobup
    std::filesystem::path socket_path;  // Default: <state_dir>/blobup.sock

    // Upload limits
    uint64_t chunk_size = 0;        // 0 = default (50MB)
    uint64_t max_file_size = 0;     // 0 = default (1TB)

    // Retry and conflict budgets
    int retry_attempts = 0;         // 0 = default
    int retry_base_delay_ms = -1;   // -1 = default
    int cas_max_attempts = 0;       // 0 = default

    // Commit block ids sorted by chunk index instead of arrival order
    bool order_blocks_by_index = false;

    size_t worker_threads = 0;      // 0 = default

    // Retention (0 disables the sweeper)
    int64_t session_ttl_secs = -1;  // -1 = default (7 days)
    int64_t sweep_interval_secs = 0;

    StoreConfig store;
    BackendConfig backend;

    // Reporting
    size_t stats_interval_secs = 60;
    std::filesystem::path metrics_file;   // e.g. /var/lib/node_exporter/textfile/blobup.prom
    size_t metrics_interval_secs = 15;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults for unset fields and credentials from the environment.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace blobup
