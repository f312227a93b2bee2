// katafetch-status: read-only viewer for the katafetch download ledger.
//
// Loads the ledger JSON and never writes it, so it is safe to run while a
// download is in progress.
//
// Usage: katafetch-status [--ledger <path>] <subcommand> [args]
//
// Subcommands:
//   summary                      Entry counts per status, bytes, last download
//   list [--status <s>]          One line per entry
//   get <id>                     Full state of one entry
//   verify [--dir <path>]        Check completed archives against the ledger

#include "katafetch/calendar.hpp"
#include "katafetch/digest.hpp"
#include "katafetch/errors.hpp"
#include "katafetch/status_ledger.hpp"
#include "katafetch/target_enumerator.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

void print_usage() {
    fprintf(stderr,
        "Usage: katafetch-status [--ledger <path>] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  summary                       Entry counts per status, bytes, last download\n"
        "  list [--status <s>]           One line per entry (pending, in_progress,\n"
        "                                completed, failed)\n"
        "  get <id>                      Full state of one entry (id is YYYY-MM-DD)\n"
        "  verify [--dir <path>]         Check completed archives: present, expected\n"
        "                                size, SHA-256 when recorded\n"
        "\n"
        "Options:\n"
        "  --ledger <path>               Ledger file (default: $KATAFETCH_DIR/download_status.json\n"
        "                                or katago_games/download_status.json)\n"
        "  --dir <path>                  Archive directory (default: the ledger's directory)\n"
        "  --format csv|tsv              Separator for list output (default: tsv)\n"
        "  --help                        Show this help\n"
    );
}

std::string format_total(const std::optional<uint64_t>& total) {
    return total ? std::to_string(*total) : std::string("?");
}

std::filesystem::path archive_path(const std::filesystem::path& dir, const std::string& id) {
    if (auto date = katafetch::parse_date(id)) return dir / katafetch::archive_name(*date);
    return dir / (id + "sgfs.tar.bz2");
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string ledger_path;
    std::string dir_path;
    std::string subcommand;
    std::string get_id;
    std::string status_filter;
    std::string format_str = "tsv";

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--ledger") {
            if (++i >= argc) { fprintf(stderr, "--ledger requires argument\n"); return 1; }
            ledger_path = argv[i];
        } else if (arg == "--dir") {
            if (++i >= argc) { fprintf(stderr, "--dir requires argument\n"); return 1; }
            dir_path = argv[i];
        } else if (arg == "--status") {
            if (++i >= argc) { fprintf(stderr, "--status requires argument\n"); return 1; }
            status_filter = argv[i];
        } else if (arg == "--format") {
            if (++i >= argc) { fprintf(stderr, "--format requires argument\n"); return 1; }
            format_str = argv[i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (subcommand == "get" && get_id.empty()) {
            get_id = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }

    // Resolve default ledger path
    if (ledger_path.empty()) {
        const char* dir_env = getenv("KATAFETCH_DIR");
        ledger_path = std::string(dir_env ? dir_env : "katago_games") + "/download_status.json";
    }

    std::optional<katafetch::TransferStatus> wanted;
    if (!status_filter.empty()) {
        wanted = katafetch::parse_transfer_status(status_filter);
        if (!wanted) {
            fprintf(stderr, "Unknown status: %s\n", status_filter.c_str());
            return 1;
        }
    }

    if (!std::filesystem::exists(ledger_path)) {
        fprintf(stderr, "No ledger at %s\n", ledger_path.c_str());
        return 1;
    }

    katafetch::StatusLedger ledger(ledger_path);
    try {
        ledger.load();
    } catch (const katafetch::CorruptLedgerError& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const char* sep = (format_str == "csv") ? "," : "\t";

    // --- Subcommands ---

    if (subcommand == "summary") {
        auto c = ledger.counts();
        fprintf(stdout, "ledger:       %s\n", ledger_path.c_str());
        fprintf(stdout, "entries:      %zu\n", ledger.entries().size());
        fprintf(stdout, "pending:      %zu\n", c.pending);
        fprintf(stdout, "in_progress:  %zu\n", c.in_progress);
        fprintf(stdout, "completed:    %zu\n", c.completed);
        fprintf(stdout, "failed:       %zu\n", c.failed);
        fprintf(stdout, "completed_sz: %" PRIu64 " bytes (%.2f GB)\n", c.completed_bytes,
                static_cast<double>(c.completed_bytes) / (1024.0 * 1024 * 1024));
        fprintf(stdout, "downloaded:   %" PRIu64 " bytes (%.2f GB)\n", ledger.downloaded_bytes(),
                static_cast<double>(ledger.downloaded_bytes()) / (1024.0 * 1024 * 1024));
        fprintf(stdout, "last:         %s\n",
                ledger.last_download().empty() ? "never" : ledger.last_download().c_str());
    } else if (subcommand == "list") {
        for (const auto& [id, state] : ledger.entries()) {
            if (wanted && state.status != *wanted) continue;
            fprintf(stdout, "%s%s%s%s%" PRIu64 "%s%s%s%u%s%s\n",
                    id.c_str(), sep, katafetch::to_string(state.status), sep,
                    state.bytes_downloaded, sep, format_total(state.total_bytes).c_str(), sep,
                    state.retry_count, sep, state.last_error.value_or("").c_str());
        }
    } else if (subcommand == "get") {
        if (get_id.empty()) {
            fprintf(stderr, "Usage: katafetch-status get <id>\n");
            return 1;
        }
        if (!ledger.contains(get_id)) {
            fprintf(stdout, "NOTFOUND\n");
            return 1;
        }
        auto state = ledger.get(get_id);
        fprintf(stdout, "id:               %s\n", get_id.c_str());
        fprintf(stdout, "status:           %s\n", katafetch::to_string(state.status));
        fprintf(stdout, "bytes_downloaded: %" PRIu64 "\n", state.bytes_downloaded);
        fprintf(stdout, "total_bytes:      %s\n", format_total(state.total_bytes).c_str());
        fprintf(stdout, "retry_count:      %u\n", state.retry_count);
        fprintf(stdout, "last_error:       %s\n", state.last_error.value_or("-").c_str());
        fprintf(stdout, "sha256:           %s\n", state.sha256.empty() ? "-" : state.sha256.c_str());
        fprintf(stdout, "updated_at:       %s\n",
                state.updated_at.empty() ? "-" : state.updated_at.c_str());
    } else if (subcommand == "verify") {
        std::filesystem::path dir = dir_path;
        if (dir.empty()) {
            dir = std::filesystem::path(ledger_path).parent_path();
            if (dir.empty()) dir = ".";
        }

        uint64_t checked = 0;
        uint64_t bad = 0;
        for (const auto& [id, state] : ledger.entries()) {
            if (state.status != katafetch::TransferStatus::Completed) continue;
            ++checked;

            auto path = archive_path(dir, id);
            std::error_code ec;
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                fprintf(stdout, "MISSING  %s (%s)\n", id.c_str(), path.c_str());
                ++bad;
                continue;
            }
            if (!state.total_bytes || size != *state.total_bytes) {
                fprintf(stdout, "SIZE     %s: file %" PRIu64 " bytes, ledger %s\n", id.c_str(),
                        static_cast<uint64_t>(size), format_total(state.total_bytes).c_str());
                ++bad;
                continue;
            }
            if (!state.sha256.empty()) {
                auto digest = katafetch::sha256_file(path);
                if (!digest) {
                    fprintf(stdout, "UNREAD   %s (%s)\n", id.c_str(), path.c_str());
                    ++bad;
                    continue;
                }
                if (*digest != state.sha256) {
                    fprintf(stdout, "SHA256   %s: %s != %s\n", id.c_str(), digest->c_str(),
                            state.sha256.c_str());
                    ++bad;
                    continue;
                }
            }
            fprintf(stdout, "OK       %s\n", id.c_str());
        }
        fprintf(stdout, "verified %" PRIu64 " completed archive(s), %" PRIu64 " problem(s)\n",
                checked, bad);
        if (bad > 0) return 1;
    } else {
        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        return 1;
    }

    return 0;
}
