/**
 * TexFill — Per-request scratch directories implementation
 */

#include "workspace.h"
#include "errors.h"

static string random_suffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
    return string(buf, 12);
}

bool safe_remove_dir(const fs::path& dir, const WorkspaceOptions& opts) noexcept {
    int attempts = std::max(1, opts.cleanup_retries);

    for (int i = 1; i <= attempts; i++) {
        std::error_code ec;

        try {
            if (opts.remover) opts.remover(dir, ec);
            else fs::remove_all(dir, ec);
        } catch (const std::exception& e) {
            cerr << TEXFILL_LOG "Cleanup raised: " << e.what() << endl;
            ec = std::make_error_code(std::errc::io_error);
        }

        if (!ec) {
            cout << TEXFILL_LOG "Cleaned up " << dir.string() << endl;
            return true;
        }

        if (i < attempts) {
            cerr << TEXFILL_LOG "Retry cleanup (" << i << "/" << attempts << "): " << ec.message() << endl;
            std::this_thread::sleep_for(opts.retry_delay);
        } else {
            cerr << TEXFILL_LOG "WARNING: could not remove " << dir.string() << ": " << ec.message() << endl;
        }
    }

    return false;
}

Workspace::Workspace(const WorkspaceOptions& opts) : opts_(opts) {
    std::error_code ec;
    fs::path root = opts_.root;

    if (root.empty()) root = fs::temp_directory_path(ec);
    if (ec) {
        throw PipelineError(ErrorKind::WorkspaceError,
            "No temporary directory available: " + ec.message());
    }

    fs::create_directories(root, ec);

    // create_directory reports false when the name is taken, so collisions just retry
    for (int i = 0; i < 16; i++) {
        fs::path candidate = root / (opts_.prefix + random_suffix());
        ec.clear();

        if (fs::create_directory(candidate, ec) && !ec) {
            // Scratch files may hold credentials: owner-only access
            fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
            if (ec) {
                string reason = ec.message();
                safe_remove_dir(candidate, opts_);
                throw PipelineError(ErrorKind::WorkspaceError,
                    "Could not restrict workspace permissions: " + reason);
            }

            dir_ = candidate;
            return;
        }
    }

    throw PipelineError(ErrorKind::WorkspaceError,
        "Could not create a workspace under " + root.string() + (ec ? ": " + ec.message() : ""));
}

Workspace::~Workspace() {
    if (!dir_.empty()) safe_remove_dir(dir_, opts_);
}
