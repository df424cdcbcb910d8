#pragma once
/**
 * TexFill — LaTeX compiler fallback chain
 *
 * The document is written to <workspace>/<job>.tex and each engine is tried in
 * order, one attempt per engine, until one exits cleanly AND leaves a non-empty
 * <job>.pdf behind. Every attempt is recorded; when all fail the full attempt
 * list is raised in a CompilationFailed error.
 */

#include "common.h"
#include "errors.h"
#include "workspace.h"

struct EngineSpec {
    string name;                      // "pdflatex"
    string description;               // "pdfLaTeX (traditional)"
    string program;                   // executable path, or a bare name resolved through PATH
    string args;                      // shell argument template; {outdir} and {texfile} expand to quoted paths
    string version_args = "--version";
    bool   bundled      = false;      // shipped next to the server; recorded as failed when missing
};

struct CompilerSettings {
    string job_name       = "resume";
    int    timeout_sec    = 45;
    int    kill_grace_sec = 5;
    std::chrono::milliseconds backoff{1000};
    size_t log_tail_chars = 3000;
    string timeout_tool;              // coreutils `timeout`; the server refuses to start without it, tests may clear it
};

struct CompilationAttempt {
    string engine;
    string command;
    bool   succeeded = false;
    string error;                     // empty on success
    string log;                       // tail of <job>.log + console output
};

struct CompileResult {
    string                     pdf;
    vector<CompilationAttempt> attempts;
};

class CompilationFailed : public PipelineError {
public:
    explicit CompilationFailed(vector<CompilationAttempt> attempts);
    const vector<CompilationAttempt>& attempts() const { return attempts_; }

private:
    vector<CompilationAttempt> attempts_;
};

struct EngineProbe {
    string name;
    string description;
    bool   available = false;
    string version;
};

// Local tectonic first, then system installs of decreasing preference.
vector<EngineSpec> default_engines(const fs::path& bundled_tectonic);

string build_engine_command(const EngineSpec& engine, const fs::path& outdir, const fs::path& texfile);

CompileResult compile_document(const CompilerSettings& settings, const vector<EngineSpec>& engines,
                               const Workspace& ws, const string& document);

// Generic advice plus targeted tips for failure signatures found in attempt logs.
vector<string> compile_troubleshooting(const vector<CompilationAttempt>& attempts);

json attempt_to_json(const CompilationAttempt& a);
json attempts_to_json(const vector<CompilationAttempt>& attempts);

vector<EngineProbe> probe_engines(const vector<EngineSpec>& engines);
json probes_to_json(const vector<EngineProbe>& probes);
