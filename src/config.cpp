/**
 * TexFill — Process configuration implementation
 */

#include "config.h"

static string env_str(const EnvLookup& env, const char* key, const string& def = "") {
    const char* v = env(key);
    return (v && *v) ? string(v) : def;
}

static int env_int(const EnvLookup& env, const char* key, int def, int min_value) {
    const char* v = env(key);
    if (!v || !*v) return def;

    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used == std::char_traits<char>::length(v) && n >= min_value) return n;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range fall through to the warning below
    }

    cerr << TEXFILL_LOG "WARNING: ignoring invalid " << key << "=" << v << ", using " << def << endl;
    return def;
}

vector<EngineSpec> select_engines(const vector<EngineSpec>& engines, const string& names) {
    if (trim(names).empty()) return engines;

    vector<EngineSpec> out;
    std::istringstream ss(names);
    string name;

    while (std::getline(ss, name, ',')) {
        name = trim(name);
        if (name.empty()) continue;

        auto it = std::find_if(engines.begin(), engines.end(),
            [&](const EngineSpec& e) { return e.name == name; });

        if (it == engines.end()) {
            cerr << TEXFILL_LOG "WARNING: unknown engine '" << name << "' in TEXFILL_ENGINES" << endl;
            continue;
        }

        bool dup = std::any_of(out.begin(), out.end(), [&](const EngineSpec& e) { return e.name == name; });
        if (!dup) out.push_back(*it);
    }

    if (out.empty()) {
        cerr << TEXFILL_LOG "WARNING: TEXFILL_ENGINES selected nothing, using the default chain" << endl;
        return engines;
    }

    return out;
}

fs::path executable_dir(const char* argv0) {
    std::error_code ec;
#ifndef _WIN32
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) return self.parent_path();
#endif
    if (argv0 && *argv0) {
        fs::path p = fs::absolute(argv0, ec);
        if (!ec) return p.parent_path();
    }

    return fs::current_path(ec);
}

AppConfig load_config(const fs::path& bin_dir, const EnvLookup& env_fn) {
    EnvLookup env = env_fn ? env_fn : EnvLookup([](const char* k) { return std::getenv(k); });
    AppConfig cfg;

    cfg.host    = env_str(env, "TEXFILL_HOST", cfg.host);
    cfg.port    = env_int(env, "PORT", cfg.port, 1);
    cfg.workers = env_int(env, "TEXFILL_WORKERS", cfg.workers, 1);

    cfg.model.api_key     = env_str(env, "GEMINI_API_KEY");
    cfg.model.model       = env_str(env, "GEMINI_MODEL", cfg.model.model);
    cfg.model.endpoint    = env_str(env, "TEXFILL_MODEL_ENDPOINT", cfg.model.endpoint);
    cfg.model.timeout_sec = env_int(env, "TEXFILL_MODEL_TIMEOUT", cfg.model.timeout_sec, 1);

    cfg.compiler.timeout_sec = env_int(env, "TEXFILL_COMPILE_TIMEOUT", cfg.compiler.timeout_sec, 1);
#ifndef _WIN32
    cfg.compiler.timeout_tool = find_executable("timeout", {"/usr/bin/timeout", "/bin/timeout"});
#endif

#ifdef _WIN32
    fs::path tectonic = bin_dir / "tectonic.exe";
#else
    fs::path tectonic = bin_dir / "tectonic";
#endif
    tectonic = env_str(env, "TEXFILL_TECTONIC", tectonic.string());
    cfg.engines = select_engines(default_engines(tectonic), env_str(env, "TEXFILL_ENGINES"));

    string tmp = env_str(env, "TEXFILL_TMPDIR");
    if (!tmp.empty()) cfg.workspace.root = tmp;

    cfg.stats_db_path   = env_str(env, "TEXFILL_STATS_DB", cfg.stats_db_path);
    cfg.discord_webhook = env_str(env, "DISCORD_WEBHOOK_URL");

    return cfg;
}

void log_config(const AppConfig& cfg) {
    cout << TEXFILL_LOG "Model: " << cfg.model.model << " (" << cfg.model.endpoint << ")" << endl;

    if (cfg.model.api_key.empty()) {
        cerr << TEXFILL_LOG "WARNING: GEMINI_API_KEY not set. Template upload will be unavailable." << endl;
    } else {
        cout << TEXFILL_LOG "API key loaded" << endl;
    }

    string chain;
    for (const auto& e : cfg.engines) chain += (chain.empty() ? "" : " -> ") + e.name;
    cout << TEXFILL_LOG "Compiler chain: " << chain << endl;
}

vector<string> config_errors(const AppConfig& cfg) {
    vector<string> errors;

#ifndef _WIN32
    if (cfg.compiler.timeout_tool.empty()) {
        errors.push_back("coreutils `timeout` not found; compile attempts cannot be time-bounded");
    }
#endif

    if (cfg.engines.empty()) errors.push_back("no LaTeX engine configured");

    return errors;
}
