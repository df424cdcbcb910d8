#pragma once
/**
 * TexFill — Per-request scratch directories
 *
 * A Workspace owns one uniquely-named, owner-only (0700) directory for the lifetime
 * of the object.
 * The destructor removes it recursively, retrying a few times on failure, and
 * never throws: a failed cleanup is logged and otherwise ignored.
 */

#include "common.h"

// Removal primitive; the default is fs::remove_all. Tests substitute one that fails.
using DirRemover = function<void(const fs::path&, std::error_code&)>;

struct WorkspaceOptions {
    fs::path root;                       // empty = system temp directory
    string   prefix          = "latex-";
    int      cleanup_retries = 3;        // total removal attempts
    std::chrono::milliseconds retry_delay{1000};
    DirRemover remover;                  // empty = fs::remove_all
};

// Removes `dir` with up to `opts.cleanup_retries` attempts. Returns true when the
// directory is gone. Never throws.
bool safe_remove_dir(const fs::path& dir, const WorkspaceOptions& opts) noexcept;

class Workspace {
public:
    explicit Workspace(const WorkspaceOptions& opts = {});
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const fs::path& dir() const { return dir_; }
    fs::path file(const string& name) const { return dir_ / name; }

private:
    WorkspaceOptions opts_;
    fs::path         dir_;
};

// Runs fn(Workspace&) inside a fresh workspace; the directory is released on every
// exit path, including exceptions thrown by fn.
template<typename Fn>
auto with_workspace(const WorkspaceOptions& opts, Fn&& fn) -> decltype(fn(std::declval<Workspace&>())) {
    Workspace ws(opts);
    return fn(ws);
}
