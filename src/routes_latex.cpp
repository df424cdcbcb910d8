/**
 * TexFill — Template route handlers
 * Schema extraction, validation and PDF generation endpoints.
 */

#include "routes.h"
#include "discord.h"
#include "errors.h"
#include "extractor.h"
#include "pipeline.h"
#include "stats.h"
#include "validate.h"

static void send_json(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, const PipelineError& e, const string& context) {
    cerr << TEXFILL_LOG << context << " failed [" << error_kind_name(e.kind()) << "]: " << e.what() << endl;
    send_json(res, error_payload(e), http_status_for(e.kind()));
}

void register_cors(httplib::Server& svr) {
    svr.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });
}

void register_latex_routes(httplib::Server& svr, const AppConfig& cfg, ModelClient& model) {

    // ── GET /health ─────────────────────────────────────────────────────────
    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"status", "ok"}, {"timestamp", iso_now()}});
    });

    // ── GET /test-model — one short completion as a connectivity check ──────
    svr.Get("/test-model", [&model](const httplib::Request&, httplib::Response& res) {
        if (!model.configured()) {
            send_json(res, {{"success", false}, {"error", "GEMINI_API_KEY is not set"}}, 503);
            return;
        }

        cout << TEXFILL_LOG "Testing " << model.name() << "..." << endl;
        auto start = std::chrono::steady_clock::now();

        try {
            string text = model.complete("Say 'Hello, connection test successful!'", 64);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            cout << TEXFILL_LOG << model.name() << " responded in " << ms << "ms" << endl;
            send_json(res, {
                {"success", true},
                {"model", model.name()},
                {"response", text},
                {"responseTime", to_string(ms) + "ms"}
            });
        } catch (const ModelTimeout& e) {
            cerr << TEXFILL_LOG "Model test timed out: " << e.what() << endl;
            send_json(res, {{"success", false}, {"error", e.what()}}, 504);
        } catch (const ModelError& e) {
            cerr << TEXFILL_LOG "Model test failed: " << e.what() << endl;
            send_json(res, {{"success", false}, {"error", e.what()}}, 500);
        }
    });

    // ── GET /engines — which compilers of the chain are runnable here ───────
    svr.Get("/engines", [&cfg](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"engines", probes_to_json(probe_engines(cfg.engines))}});
    });

    // ── POST /validate-latex — static structure checks ──────────────────────
    svr.Post("/validate-latex", [&cfg](const httplib::Request& req, httplib::Response& res) {
        string latex = trim(req.body);

        if (latex.empty()) {
            send_json(res, {{"error", "No LaTeX provided"}}, 400);
            return;
        }
        if (latex.size() > cfg.max_template_bytes) {
            send_json(res, {{"error", "Template too large"}}, 413);
            return;
        }

        LatexValidation v = validate_latex(latex);
        cout << TEXFILL_LOG "LaTeX validation: " << (v.valid ? "PASS" : "FAIL") << endl;
        send_json(res, validation_to_json(v));
    });

    // ── POST /upload-tex — extract the field schema ─────────────────────────
    svr.Post("/upload-tex", [&cfg, &model](const httplib::Request& req, httplib::Response& res) {
        try {
            if (req.body.size() > cfg.max_template_bytes) {
                throw PipelineError(ErrorKind::BadRequest,
                    "Template too large (limit " + to_string(cfg.max_template_bytes / 1024) + " KB)");
            }

            cout << TEXFILL_LOG "Processing LaTeX template (" << req.body.size() << " chars)" << endl;
            ExtractionResult r = extract_schema(req.body, model, cfg.model.max_output_tokens);

            stat_record("extract", r.model, true);
            discord_log_extraction(r.model, r.schema.size(), r.total_found);
            send_json(res, extraction_to_json(r));
        } catch (const PipelineError& e) {
            stat_record("extract", error_kind_name(e.kind()), false);
            if (e.kind() != ErrorKind::BadRequest) discord_log_error("upload-tex", error_kind_name(e.kind()), e.what());
            send_error(res, e, "Schema extraction");
        } catch (const std::exception& e) {
            stat_record("extract", error_kind_name(ErrorKind::Internal), false);
            discord_log_error("upload-tex", error_kind_name(ErrorKind::Internal), e.what());
            send_error(res, internal_error(e), "Schema extraction");
        }
    });

    // ── POST /generate-pdf — inject values and run the compiler chain ───────
    svr.Post("/generate-pdf", [&cfg](const httplib::Request& req, httplib::Response& res) {
        try {
            json body = json::parse(req.body);
            GenerationRequest gen = parse_generation_request(body, cfg.max_template_bytes);
            CompileResult out = generate_pdf(cfg, gen);

            const string& engine = out.attempts.back().engine;
            cout << TEXFILL_LOG "PDF generated with " << engine << " (" << out.pdf.size() << " bytes)" << endl;

            stat_record("generate", engine, true);
            discord_log_generation(engine, out.attempts.size(), out.pdf.size());

            res.set_header("Content-Disposition", "attachment; filename=\"" + cfg.attachment_name + "\"");
            res.set_content(out.pdf, "application/pdf");
        } catch (const json::parse_error& e) {
            send_error(res, PipelineError(ErrorKind::BadRequest, "Invalid payload",
                {"Send a JSON body of the form {\"template\": \"...\", \"values\": {\"id\": \"value\"}}"},
                {{"details", e.what()}}), "PDF generation");
        } catch (const PipelineError& e) {
            stat_record("generate", error_kind_name(e.kind()), false);
            if (e.kind() != ErrorKind::BadRequest) discord_log_error("generate-pdf", error_kind_name(e.kind()), e.what());
            send_error(res, e, "PDF generation");
        } catch (const std::exception& e) {
            stat_record("generate", error_kind_name(ErrorKind::Internal), false);
            discord_log_error("generate-pdf", error_kind_name(ErrorKind::Internal), e.what());
            send_error(res, internal_error(e), "PDF generation");
        }
    });
}
