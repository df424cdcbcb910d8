#pragma once
/**
 * TexFill — Process configuration
 *
 * Built once at start-up from the environment and handed to every component by
 * const reference. Nothing reads the environment after load_config() returns.
 */

#include "common.h"
#include "compiler.h"
#include "model_client.h"
#include "workspace.h"

struct AppConfig {
    string host    = "0.0.0.0";
    int    port    = 3001;
    int    workers = 8;
    size_t max_template_bytes = 200 * 1024;
    int    request_timeout_sec = 60;

    ModelSettings      model;
    CompilerSettings   compiler;
    vector<EngineSpec> engines;
    WorkspaceOptions   workspace;

    string stats_db_path = "texfill_stats.db";
    string discord_webhook;
    string attachment_name = "resume.pdf";
};

using EnvLookup = function<const char*(const char*)>;

// Reads configuration through `env` (std::getenv by default). `bin_dir` locates
// the bundled tectonic binary.
AppConfig load_config(const fs::path& bin_dir, const EnvLookup& env = {});

// Orders/filters `engines` by a comma-separated name list; unknown names are
// ignored with a warning. An empty list keeps everything.
vector<EngineSpec> select_engines(const vector<EngineSpec>& engines, const string& names);

// Directory of the running executable, falling back to the working directory.
fs::path executable_dir(const char* argv0);

// Problems that make the configuration unusable; the server refuses to start when
// this is non-empty. Compile attempts must be time-bounded, so a missing coreutils
// `timeout` is one.
vector<string> config_errors(const AppConfig& cfg);

void log_config(const AppConfig& cfg);
