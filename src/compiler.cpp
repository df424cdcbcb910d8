/**
 * TexFill — LaTeX compiler fallback chain implementation
 */

#include "compiler.h"

// Exit codes of coreutils `timeout` when the limit fired (TERM, then KILL)
static constexpr int TIMEOUT_EXIT      = 124;
static constexpr int TIMEOUT_KILL_EXIT = 137;

static json technical_details(const vector<CompilationAttempt>& attempts) {
    json processors = json::array();
    for (const auto& a : attempts) processors.push_back(a.engine);

    return {
        {"attempts", attempts_to_json(attempts)},
        {"technical", {{"processors", processors}}}
    };
}

CompilationFailed::CompilationFailed(vector<CompilationAttempt> attempts)
    : PipelineError(ErrorKind::CompilationFailed, "PDF generation failed with all compilers",
                    compile_troubleshooting(attempts), technical_details(attempts)),
      attempts_(std::move(attempts)) {}

// ─── Engine table ───────────────────────────────────────────────────────────

vector<EngineSpec> default_engines(const fs::path& bundled_tectonic) {
    return {
        { "tectonic-local",  "Tectonic (local executable)",  bundled_tectonic.string(),
          "--outdir {outdir} {texfile}", "--version", true },
        { "tectonic-system", "Tectonic (system installation)", "tectonic",
          "--outdir {outdir} {texfile}", "--version", false },
        { "pdflatex", "pdfLaTeX (traditional)", "pdflatex",
          "-output-directory={outdir} -interaction=nonstopmode {texfile}", "--version", false },
        { "xelatex", "XeLaTeX", "xelatex",
          "-output-directory={outdir} -interaction=nonstopmode {texfile}", "--version", false },
        { "lualatex", "LuaLaTeX", "lualatex",
          "-output-directory={outdir} -interaction=nonstopmode {texfile}", "--version", false },
    };
}

static void replace_all(string& s, const string& from, const string& to) {
    size_t pos = 0;

    while ((pos = s.find(from, pos)) != string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

string build_engine_command(const EngineSpec& engine, const fs::path& outdir, const fs::path& texfile) {
    string args = engine.args;
    replace_all(args, "{outdir}", escape_arg(outdir.string()));
    replace_all(args, "{texfile}", escape_arg(texfile.string()));
    return escape_arg(engine.program) + (args.empty() ? "" : " " + args);
}

// cd into the workspace so byproducts land there, and bound the run with `timeout`
static string wrap_for_workspace(const CompilerSettings& settings, const fs::path& dir, const string& cmd) {
#ifdef _WIN32
    return "cd /d " + escape_arg(dir.string()) + " && " + cmd;
#else
    string wrapped = "cd " + escape_arg(dir.string()) + " && ";

    if (!settings.timeout_tool.empty()) {
        wrapped += escape_arg(settings.timeout_tool) +
                   " --kill-after=" + to_string(settings.kill_grace_sec) + " " +
                   to_string(settings.timeout_sec) + " ";
    }

    return wrapped + cmd;
#endif
}

static void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);

    if (ec) cerr << TEXFILL_LOG "Could not remove " << p.string() << ": " << ec.message() << endl;
}

static bool artifact_ready(const fs::path& pdf) {
    std::error_code ec;
    if (!fs::exists(pdf, ec)) return false;
    auto size = fs::file_size(pdf, ec);
    return !ec && size > 0;
}

// ─── Chain ──────────────────────────────────────────────────────────────────

CompileResult compile_document(const CompilerSettings& settings, const vector<EngineSpec>& engines,
                               const Workspace& ws, const string& document) {
    fs::path tex_path = ws.file(settings.job_name + ".tex");
    fs::path pdf_path = ws.file(settings.job_name + ".pdf");
    fs::path log_path = ws.file(settings.job_name + ".log");

    if (!write_file_binary(tex_path, document)) {
        throw PipelineError(ErrorKind::WorkspaceError, "Failed to write LaTeX file",
            {"Check that the temporary directory is writable"},
            {{"path", tex_path.string()}});
    }

    cout << TEXFILL_LOG "Working directory: " << ws.dir().string() << endl;

    CompileResult result;

    for (size_t i = 0; i < engines.size(); i++) {
        const auto& engine = engines[i];
        CompilationAttempt attempt;
        attempt.engine  = engine.name;
        attempt.command = build_engine_command(engine, ws.dir(), tex_path);

        remove_quietly(pdf_path);
        remove_quietly(log_path);

        std::error_code ec;
        if (engine.bundled && !fs::exists(engine.program, ec)) {
            attempt.error = "Executable not found: " + engine.program;
            cout << TEXFILL_LOG "Skipping " << engine.description << ": " << attempt.error << endl;
            result.attempts.push_back(attempt);
            continue;
        }

        cout << TEXFILL_LOG "Trying " << engine.description << "..." << endl;

        int code = 0;
        string output = exec_command(wrap_for_workspace(settings, ws.dir(), attempt.command), code);

        string full_log = output;
        if (fs::exists(log_path, ec)) full_log = read_file_binary(log_path) + "\n" + output;
        attempt.log = tail_chars(full_log, settings.log_tail_chars);

        bool timed_out = !settings.timeout_tool.empty() &&
                         (code == TIMEOUT_EXIT || code == TIMEOUT_KILL_EXIT);

        if (code == 0 && artifact_ready(pdf_path)) {
            attempt.succeeded = true;
            result.pdf = read_file_binary(pdf_path);
            result.attempts.push_back(attempt);
            cout << TEXFILL_LOG "Successfully compiled with " << engine.name << endl;
            return result;
        }

        if (timed_out)      attempt.error = "Timed out after " + to_string(settings.timeout_sec) + "s";
        else if (code != 0) attempt.error = "Command failed with exit code " + to_string(code);
        else                attempt.error = "No PDF produced";

        cerr << TEXFILL_LOG << engine.name << " failed: " << attempt.error << endl;

        // A stale PDF must not satisfy the next engine's success check
        remove_quietly(pdf_path);
        result.attempts.push_back(attempt);

        if (i + 1 < engines.size()) std::this_thread::sleep_for(settings.backoff);
    }

    cerr << TEXFILL_LOG "All LaTeX compilation attempts failed" << endl;
    throw CompilationFailed(std::move(result.attempts));
}

// ─── Diagnostics ────────────────────────────────────────────────────────────

vector<string> compile_troubleshooting(const vector<CompilationAttempt>& attempts) {
    bool latex_error = false, missing_file = false, emergency = false;

    for (const auto& a : attempts) {
        if (a.log.find("! LaTeX Error") != string::npos) latex_error = true;
        if (a.log.find("File") != string::npos && a.log.find("not found") != string::npos) missing_file = true;
        if (a.log.find("Emergency stop") != string::npos) emergency = true;
    }

    vector<string> tips;
    if (emergency)    tips.push_back("Critical LaTeX error - check document structure");
    if (missing_file) tips.push_back("Missing LaTeX package - install required packages");
    if (latex_error)  tips.push_back("LaTeX syntax error detected - check your template");

    tips.insert(tips.end(), {
        "Install a LaTeX distribution (TeX Live, MiKTeX, or Tectonic)",
        "Make sure LaTeX executables are in your system PATH",
        "Check that all required packages are available",
        "Verify your template syntax is correct",
        "Try simplifying your template to test basic functionality"
    });
    return tips;
}

json attempt_to_json(const CompilationAttempt& a) {
    json j = {
        {"compiler", a.engine},
        {"command",  a.command},
        {"success",  a.succeeded},
        {"log",      a.log}
    };
    j["error"] = a.error.empty() ? json(nullptr) : json(a.error);
    return j;
}

json attempts_to_json(const vector<CompilationAttempt>& attempts) {
    json arr = json::array();
    for (const auto& a : attempts) arr.push_back(attempt_to_json(a));
    return arr;
}

// ─── Availability probe ─────────────────────────────────────────────────────

vector<EngineProbe> probe_engines(const vector<EngineSpec>& engines) {
    vector<EngineProbe> probes;

    for (const auto& engine : engines) {
        EngineProbe p;
        p.name = engine.name;
        p.description = engine.description;

        std::error_code ec;
        if (engine.bundled && !fs::exists(engine.program, ec)) {
            probes.push_back(p);
            continue;
        }

        int code = 0;
        string out = exec_command(escape_arg(engine.program) + " " + engine.version_args, code);

        if (code == 0) {
            p.available = true;
            auto nl = out.find('\n');
            p.version = truncate_preview(trim(out.substr(0, nl)), 80);
        }

        probes.push_back(p);
    }

    return probes;
}

json probes_to_json(const vector<EngineProbe>& probes) {
    json arr = json::array();

    for (const auto& p : probes) {
        arr.push_back({
            {"name", p.name},
            {"description", p.description},
            {"available", p.available},
            {"version", p.version}
        });
    }

    return arr;
}
