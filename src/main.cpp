/**
 * TexFill — LaTeX template to PDF service
 * C++ Backend Server using cpp-httplib + tectonic / TeX Live
 */

#include "common.h"
#include "config.h"
#include "discord.h"
#include "routes.h"
#include "stats.h"

int main(int argc, char** argv) {
    AppConfig cfg = load_config(executable_dir(argc > 0 ? argv[0] : nullptr));
    log_config(cfg);

    vector<string> problems = config_errors(cfg);
    if (!problems.empty()) {
        for (const auto& p : problems) cerr << TEXFILL_LOG "ERROR: " << p << endl;
        cerr << TEXFILL_LOG "Refusing to start." << endl;
        return 1;
    }

    // ── Probe the compiler chain ────────────────────────────────────────────
    vector<string> engine_names;
    size_t available = 0;

    for (const auto& p : probe_engines(cfg.engines)) {
        engine_names.push_back(p.name);
        if (p.available) {
            available++;
            cout << TEXFILL_LOG << p.name << " found: " << p.version << endl;
        } else {
            cerr << TEXFILL_LOG "WARNING: " << p.name << " not available" << endl;
        }
    }

    if (available == 0) {
        cerr << TEXFILL_LOG "WARNING: no LaTeX engine is available. PDF generation will fail." << endl;
        cerr << TEXFILL_LOG "Install TeX Live or place a tectonic binary next to the server." << endl;
    }

    // ── Stats & notifications ───────────────────────────────────────────────
    if (!stat_init_db(cfg.stats_db_path)) {
        cerr << TEXFILL_LOG "WARNING: usage statistics disabled" << endl;
    }
    discord_init(cfg.discord_webhook);

    CurlChatClient model(cfg.model, cfg.workspace);

    // ── HTTP server ─────────────────────────────────────────────────────────
    httplib::Server svr;

    int workers = cfg.workers;
    svr.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    svr.set_payload_max_length(cfg.max_template_bytes * 2);
    svr.set_read_timeout(cfg.request_timeout_sec, 0);
    svr.set_write_timeout(cfg.request_timeout_sec, 0);

    register_cors(svr);
    register_latex_routes(svr, cfg, model);
    register_stats_routes(svr);

    // ── Start the server ────────────────────────────────────────────────────
    cout << R"(
  ╔╦╗╔═╗═╗ ╦╔═╗╦╦  ╦
   ║ ║╣ ╔╩╦╝╠╣ ║║  ║
   ╩ ╚═╝╩ ╚═╚  ╩╩═╝╩═╝
    LaTeX template to PDF
)" << endl;

    cout << TEXFILL_LOG "Server starting on http://" << cfg.host << ":" << cfg.port << endl;
    cout << TEXFILL_LOG "Workers: " << cfg.workers << endl;
    cout << TEXFILL_LOG "Press Ctrl+C to stop" << endl;

    discord_log_server_start(cfg.port, engine_names, model.configured());

    if (!svr.listen(cfg.host, cfg.port)) {
        cerr << TEXFILL_LOG "Failed to start server on port " << cfg.port << endl;
        stat_close_db();
        return 1;
    }

    stat_close_db();
    return 0;
}
