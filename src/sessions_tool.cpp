// blobup-sessions: Standalone inspection tool for blobup session state.
//
// Opens the session store and blob backend named in the daemon's JSON config.
//
// Usage: blobup-sessions --config <path> <subcommand> [args]
//
// Subcommands:
//   list                         All sessions with progress and state
//   get <upload_id>              One session record as JSON
//   stale --before <time>        Sessions not updated since a given time
//   purge --before <time>        Remove those sessions
//   object <name>                Properties of a committed object
//   delete-object <name>         Delete a committed object

#include "blobup/blob_backend.hpp"
#include "blobup/service_config.hpp"
#include "blobup/session_store.hpp"
#include "blobup/upload_session.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

/// Parse a duration string like "30d", "6h", "90m", "3600s" or a raw epoch.
/// Returns epoch timestamp (seconds since epoch), nullopt when malformed.
std::optional<int64_t> parse_before_time(const char* arg) {
    size_t len = strlen(arg);
    if (len == 0) return std::nullopt;

    char* end = nullptr;
    char unit = arg[len - 1];
    if (unit == 'd' || unit == 'h' || unit == 'm' || unit == 's') {
        int64_t val = strtoll(arg, &end, 10);
        if (end != arg + len - 1 || val < 0) return std::nullopt;
        int64_t seconds = 0;
        switch (unit) {
            case 'd': seconds = val * 86400; break;
            case 'h': seconds = val * 3600; break;
            case 'm': seconds = val * 60; break;
            case 's': seconds = val; break;
        }
        return blobup::now_epoch() - seconds;
    }

    // Raw epoch seconds
    int64_t epoch = strtoll(arg, &end, 10);
    if (*end != '\0' || epoch < 0) return std::nullopt;
    return epoch;
}

void print_usage() {
    fprintf(stderr,
        "Usage: blobup-sessions --config <path> <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  list                          All sessions with progress and state\n"
        "  get <upload_id>               One session record as JSON\n"
        "  stale --before <time>         Sessions not updated since a given time\n"
        "  purge --before <time>         Remove sessions not updated since a given time\n"
        "  object <name>                 Properties of a committed object\n"
        "  delete-object <name>          Delete a committed object\n"
        "\n"
        "Options:\n"
        "  --config <path>               blobup JSON config (store and backend blocks)\n"
        "  --before <time>               Epoch seconds or duration (30d, 6h, 90m, 3600s)\n"
        "  --format csv|tsv              Row separator for list/stale (default: tsv)\n"
        "  --limit <N>                   Max sessions to output\n"
        "  --help                        Show this help\n"
    );
}

void print_session_row(FILE* out, const blobup::UploadSession& s, const char* sep) {
    fprintf(out, "%s%s%s%s%" PRIu64 "%s%zu/%" PRIu64 "%s%.1f%s%s%s%s\n",
            s.upload_id.c_str(), sep,
            s.object_name.c_str(), sep,
            s.file_size, sep,
            s.block_ids.size(), s.expected_chunks(), sep,
            s.progress_percentage(), sep,
            s.completed ? "completed" : "pending", sep,
            blobup::format_timestamp(s.updated_at).c_str());
}

// Sessions not updated since `threshold`, oldest first
std::vector<blobup::UploadSession> select_stale(std::vector<blobup::UploadSession> sessions,
                                                int64_t threshold) {
    std::vector<blobup::UploadSession> stale;
    for (auto& s : sessions) {
        if (s.updated_at < threshold) stale.push_back(std::move(s));
    }
    std::sort(stale.begin(), stale.end(), [](const auto& a, const auto& b) {
        return a.updated_at < b.updated_at;
    });
    return stale;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string subcommand;
    std::string target;
    std::string before_str;
    std::string format_str = "tsv";
    uint64_t limit = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (++i >= argc) { fprintf(stderr, "--config requires argument\n"); return 1; }
            config_path = argv[i];
        } else if (arg == "--before") {
            if (++i >= argc) { fprintf(stderr, "--before requires argument\n"); return 1; }
            before_str = argv[i];
        } else if (arg == "--limit") {
            if (++i >= argc) { fprintf(stderr, "--limit requires argument\n"); return 1; }
            limit = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--format") {
            if (++i >= argc) { fprintf(stderr, "--format requires argument\n"); return 1; }
            format_str = argv[i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (arg[0] != '-' && target.empty() &&
                   (subcommand == "get" || subcommand == "object" || subcommand == "delete-object")) {
            target = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty() || config_path.empty()) {
        print_usage();
        return 1;
    }

    blobup::ServiceConfig config;
    if (!config.load_json(config_path)) return 1;
    config.apply_defaults();

    const char* sep = (format_str == "csv") ? "," : "\t";

    // --- Blob backend subcommands ---

    if (subcommand == "object" || subcommand == "delete-object") {
        if (target.empty()) {
            fprintf(stderr, "Usage: blobup-sessions %s <name>\n", subcommand.c_str());
            return 1;
        }
        auto err = config.backend.validate();
        if (!err.empty()) {
            fprintf(stderr, "Backend configuration error: %s\n", err.c_str());
            return 1;
        }
        std::unique_ptr<blobup::BlobBackend> backend;
        try {
            backend = blobup::BlobBackendFactory::create(config.backend.type, config.backend.params);
        } catch (const std::exception& e) {
            fprintf(stderr, "Cannot open blob backend: %s\n", e.what());
            return 1;
        }

        if (subcommand == "object") {
            auto props = backend->get_object_properties(target);
            if (!props.success) {
                fprintf(stderr, "get_object_properties: %s\n", props.error_message.c_str());
                return 1;
            }
            if (!props.found) {
                printf("NOTFOUND\n");
                return 1;
            }
            printf("name:        %s\n", target.c_str());
            printf("size:        %" PRIu64 "\n", props.properties.size);
            printf("created:     %s\n", blobup::format_timestamp(props.properties.created_at).c_str());
            printf("modified:    %s\n", blobup::format_timestamp(props.properties.modified_at).c_str());
            if (!props.properties.etag.empty()) {
                printf("etag:        %s\n", props.properties.etag.c_str());
            }
            return 0;
        }

        auto result = backend->delete_object(target);
        if (!result.success) {
            fprintf(stderr, "delete_object: %s\n", result.error_message.c_str());
            return 1;
        }
        printf("deleted %s\n", target.c_str());
        return 0;
    }

    // --- Session store subcommands ---

    auto err = config.store.validate();
    if (!err.empty()) {
        fprintf(stderr, "Store configuration error: %s\n", err.c_str());
        return 1;
    }
    std::unique_ptr<blobup::SessionStore> store;
    try {
        store = blobup::SessionStoreFactory::create(config.store.type, config.store.params);
    } catch (const std::exception& e) {
        fprintf(stderr, "Cannot open session store: %s\n", e.what());
        return 1;
    }

    if (subcommand == "get") {
        if (target.empty()) {
            fprintf(stderr, "Usage: blobup-sessions get <upload_id>\n");
            return 1;
        }
        auto lookup = store->get(target);
        if (!lookup.success) {
            fprintf(stderr, "get: %s\n", lookup.error_message.c_str());
            return 1;
        }
        if (!lookup.session) {
            printf("NOTFOUND\n");
            return 1;
        }
        printf("%s\n", lookup.session->to_json().c_str());
        return 0;
    }

    if (subcommand != "list" && subcommand != "stale" && subcommand != "purge") {
        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        return 1;
    }

    std::optional<int64_t> threshold;
    if (subcommand != "list") {
        if (before_str.empty()) {
            fprintf(stderr, "Usage: blobup-sessions %s --before <time>\n", subcommand.c_str());
            return 1;
        }
        threshold = parse_before_time(before_str.c_str());
        if (!threshold) {
            fprintf(stderr, "Error: invalid --before value: %s\n", before_str.c_str());
            return 1;
        }
    }

    auto listing = store->list();
    if (!listing.success) {
        fprintf(stderr, "list: %s\n", listing.error_message.c_str());
        return 1;
    }

    if (subcommand == "list") {
        std::sort(listing.sessions.begin(), listing.sessions.end(), [](const auto& a, const auto& b) {
            return a.created_at < b.created_at;
        });
        uint64_t count = 0;
        for (const auto& s : listing.sessions) {
            print_session_row(stdout, s, sep);
            if (limit > 0 && ++count >= limit) break;
        }
        return 0;
    }

    auto stale = select_stale(std::move(listing.sessions), *threshold);

    if (subcommand == "stale") {
        uint64_t count = 0;
        for (const auto& s : stale) {
            print_session_row(stdout, s, sep);
            if (limit > 0 && ++count >= limit) break;
        }
        return 0;
    }

    // purge
    uint64_t removed = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
    for (const auto& s : stale) {
        if (limit > 0 && removed >= limit) break;
        auto write = store->remove_if_version(s.upload_id, s.version);
        if (write.status == blobup::WriteStatus::Conflict ||
            write.status == blobup::WriteStatus::NotFound) {
            // Touched or removed by the daemon since the listing
            ++skipped;
            continue;
        }
        if (!write.ok()) {
            fprintf(stderr, "remove %s: %s\n", s.upload_id.c_str(), write.error_message.c_str());
            ++failed;
            continue;
        }
        ++removed;
    }
    printf("purged %" PRIu64 " sessions", removed);
    if (skipped > 0) printf(" (%" PRIu64 " changed, kept)", skipped);
    if (failed > 0) printf(" (%" PRIu64 " failed)", failed);
    printf("\n");
    return failed > 0 ? 1 : 0;
}
