/**
 * TexFill — Generation pipeline implementation
 */

#include "pipeline.h"
#include "injector.h"

GenerationRequest parse_generation_request(const json& body, size_t max_template_bytes) {
    if (!body.is_object() || !body.contains("template") || !body["template"].is_string() ||
        !body.contains("values")) {
        throw PipelineError(ErrorKind::BadRequest, "Invalid payload",
            {"Send a JSON body of the form {\"template\": \"...\", \"values\": {\"id\": \"value\"}}"});
    }

    GenerationRequest req;
    req.tpl = body["template"].get<string>();

    if (req.tpl.size() > max_template_bytes) {
        throw PipelineError(ErrorKind::BadRequest,
            "Template too large (" + to_string(req.tpl.size()) + " bytes, limit " + to_string(max_template_bytes) + ")");
    }

    req.values = value_map_from_json(body["values"]);

    if (body.contains("schema") && body["schema"].is_array()) {
        req.values = complete_values(schema_from_json(body["schema"]), req.values);
    }

    return req;
}

CompileResult generate_pdf(const AppConfig& cfg, const GenerationRequest& req) {
    cout << TEXFILL_LOG "Generating PDF (" << req.values.size() << " values)..." << endl;
    string processed = inject_values(req.tpl, req.values);

    return with_workspace(cfg.workspace, [&](Workspace& ws) {
        return compile_document(cfg.compiler, cfg.engines, ws, processed);
    });
}
