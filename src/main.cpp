#include "blobup/log.hpp"
#include "blobup/service_config.hpp"
#include "blobup/upload_service.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    if (open("/dev/null", O_RDONLY) < 0) return false;

    return true;
}

bool write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << getpid() << "\n";
    return ofs.good();
}

void print_params(const char* prefix, const std::map<std::string, std::string>& params) {
    for (auto& [k, v] : blobup::mask_secrets(params)) {
        std::cout << "  " << prefix << "-" << k << ": " << v << std::endl;
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = blobup::ServiceConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Failed to open log file: " << config.log_file << std::endl;
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    blobup::set_verbose_logging(config.verbose);

    std::cout << "blobup starting..." << std::endl;
    std::cout << "  state-dir: " << config.state_dir << std::endl;
    std::cout << "  socket: " << config.socket_path << std::endl;
    std::cout << "  store-type: " << config.store.type << std::endl;
    print_params("store", config.store.params);
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    print_params("backend", config.backend.params);
    std::cout << "  chunk-size: " << config.chunk_size << std::endl;
    std::cout << "  max-file-size: " << config.max_file_size << std::endl;
    std::cout << "  retry: " << config.retry_attempts << " attempts, "
              << config.retry_base_delay_ms << " ms base delay" << std::endl;
    std::cout << "  workers: " << config.worker_threads << std::endl;
    if (config.session_ttl_secs > 0) {
        std::cout << "  session-ttl: " << config.session_ttl_secs << "s (sweep every "
                  << config.sweep_interval_secs << "s)" << std::endl;
    } else {
        std::cout << "  session-ttl: disabled" << std::endl;
    }
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        if (!write_pid_file(config.pid_file)) {
            std::cerr << "Warning: cannot write PID file " << config.pid_file << std::endl;
        }
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    blobup::UploadService service(config);

    err = service.start();
    if (!err.empty()) {
        std::cerr << "Failed to start upload service: " << err << std::endl;
        if (!config.pid_file.empty()) unlink(config.pid_file.c_str());
        return 1;
    }

    std::cout << "blobup running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop();
    service.wait();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "blobup exited cleanly" << std::endl;
    return 0;
}
