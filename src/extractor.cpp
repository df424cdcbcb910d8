/**
 * TexFill — Field schema extraction implementation
 */

#include "extractor.h"
#include "errors.h"

static constexpr size_t DIAGNOSTIC_PREVIEW = 500;

// ─── Prompt ─────────────────────────────────────────────────────────────────

string build_extraction_prompt(const string& latex) {
    return R"PROMPT(You are a LaTeX template analysis assistant. Analyze this LaTeX template and extract ALL user-fillable fields.

Look for these patterns:
1. \newcommand{\fieldname}{default value}
2. \def\fieldname{default value}
3. {PLACEHOLDER} or {fieldname}, [fieldname]
4. \VAR{fieldname}
5. <<fieldname>>
6. Any obvious placeholder text like "Your Name", "your.email@domain.com", etc.

For each field found, create a JSON object with:
- id: machine-readable key (lowercase, underscores for spaces, no special chars)
- label: human-readable label (proper case, spaces allowed)
- default: the current value/placeholder text

Return ONLY a valid JSON array. Be comprehensive - extract every fillable field you can identify.

Example output:
[
  {"id": "name", "label": "Full Name", "default": "John Doe"},
  {"id": "email", "label": "Email Address", "default": "john@example.com"},
  {"id": "phone", "label": "Phone Number", "default": "(555) 123-4567"}
]

### LATEX TEMPLATE START ###
)PROMPT" + latex + R"PROMPT(
### LATEX TEMPLATE END ###

Return JSON array:)PROMPT";
}

// ─── Output cleaning ────────────────────────────────────────────────────────

string strip_code_fences(const string& raw) {
    string text = trim(raw);
    auto open = text.find("```");

    if (open != string::npos) {
        // Skip the fence line, including any language tag
        auto body = text.find('\n', open + 3);
        body = (body == string::npos) ? open + 3 : body + 1;
        auto close = text.find("```", body);
        text = text.substr(body, close == string::npos ? string::npos : close - body);
    }

    text = trim(text);
    while (!text.empty() && text.front() == '`') text.erase(text.begin());
    while (!text.empty() && text.back() == '`') text.pop_back();
    return trim(text);
}

string find_json_array(const string& text) {
    auto start = text.find('[');
    if (start == string::npos) return "";

    int  depth = 0;
    bool in_string = false;

    for (size_t i = start; i < text.size(); i++) {
        char c = text[i];

        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
            continue;
        }

        if (c == '"') in_string = true;
        else if (c == '[') depth++;
        else if (c == ']' && --depth == 0) return text.substr(start, i - start + 1);
    }

    return "";
}

static vector<string> invalid_output_tips() {
    return {
        "The AI response was malformed",
        "Try uploading the template again",
        "Make sure your template has clear placeholder patterns",
        "Simplify your LaTeX template structure"
    };
}

json parse_model_output(const string& raw) {
    string cleaned = strip_code_fences(raw);
    string array_text = find_json_array(cleaned);

    if (array_text.empty()) {
        cerr << TEXFILL_LOG "Invalid JSON structure from AI" << endl;
        throw PipelineError(ErrorKind::InvalidModelOutput, "AI returned invalid JSON format",
            invalid_output_tips(),
            {{"raw", truncate_preview(raw, DIAGNOSTIC_PREVIEW)},
             {"cleaned", truncate_preview(cleaned, DIAGNOSTIC_PREVIEW)}});
    }

    try {
        return json::parse(array_text);
    } catch (const json::parse_error& e) {
        cerr << TEXFILL_LOG "JSON parse error: " << e.what() << endl;
        throw PipelineError(ErrorKind::InvalidModelOutput, "Failed to parse AI response as JSON",
            invalid_output_tips(),
            {{"parseError", e.what()},
             {"raw", truncate_preview(raw, DIAGNOSTIC_PREVIEW)},
             {"cleaned", truncate_preview(array_text, DIAGNOSTIC_PREVIEW)}});
    }
}

// ─── Extraction ─────────────────────────────────────────────────────────────

static string call_model(const string& prompt, ModelClient& model, int max_tokens) {
    try {
        return model.complete(prompt, max_tokens);
    } catch (const ModelTimeout& e) {
        throw PipelineError(ErrorKind::ExtractionTimeout, string("AI extraction failed: ") + e.what(),
            {"Request timed out - try a shorter template",
             "Check your internet connection",
             "Try a simpler LaTeX template"});
    } catch (const ModelError& e) {
        throw PipelineError(ErrorKind::ModelUnavailable, string("AI extraction failed: ") + e.what(),
            {"AI API error - check your API key and quota",
             "Check your internet connection",
             "Verify GEMINI_API_KEY is set correctly",
             "Make sure the template is complete and valid"});
    }
}

ExtractionResult extract_schema(const string& latex, ModelClient& model, int max_tokens) {
    string source = trim(latex);

    if (source.empty()) {
        throw PipelineError(ErrorKind::BadRequest, "No LaTeX provided");
    }

    if (source.find("\\documentclass") == string::npos) {
        throw PipelineError(ErrorKind::MalformedTemplate, "Invalid LaTeX template: Missing \\documentclass",
            {"Make sure your template starts with \\documentclass{...}",
             "Include complete LaTeX document structure",
             "Check that you pasted the entire template"});
    }

    if (!model.configured()) {
        throw PipelineError(ErrorKind::ModelUnavailable, "AI features are not configured on this server.",
            {"Set GEMINI_API_KEY in the server environment"});
    }

    cout << TEXFILL_LOG "Calling " << model.name() << " for schema extraction..." << endl;
    string raw = call_model(build_extraction_prompt(source), model, max_tokens);
    cout << TEXFILL_LOG "Raw AI response preview: " << truncate_preview(raw, 200) << endl;

    json parsed = parse_model_output(raw);

    if (!parsed.is_array()) {
        throw PipelineError(ErrorKind::InvalidModelOutput, "Expected JSON array from AI",
            {"AI returned unexpected format", "Try a different template or retry the request"},
            {{"receivedType", parsed.type_name()}});
    }

    ExtractionResult result;
    result.schema       = schema_from_json(parsed);
    result.total_found  = parsed.size();
    result.model        = model.name();
    result.extracted_at = iso_now();

    if (result.schema.empty()) {
        throw PipelineError(ErrorKind::NoFieldsFound, "No valid fields found in template",
            {"Your template might not have clear placeholder patterns",
             "Try adding \\newcommand definitions for fillable fields",
             "Make sure placeholders are clearly marked"},
            {{"rawSchema", parsed}});
    }

    string ids;
    for (const auto& f : result.schema) ids += (ids.empty() ? "" : ", ") + f.id;
    cout << TEXFILL_LOG "Successfully parsed " << result.schema.size() << " fields: " << ids << endl;

    return result;
}

json extraction_to_json(const ExtractionResult& r) {
    return {
        {"schema", schema_to_json(r.schema)},
        {"meta", {
            {"totalFound", r.total_found},
            {"validFields", r.schema.size()},
            {"model", r.model},
            {"extractedAt", r.extracted_at}
        }}
    };
}
