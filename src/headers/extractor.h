#pragma once
/**
 * TexFill — Field schema extraction
 *
 * The template is embedded in a fixed prompt, the model is asked for a JSON array
 * of {id, label, default} objects, and the reply is treated as untrusted text:
 * fences stripped, first top-level array cut out, parsed, then filtered entry by
 * entry. Nothing here retries; one model call per extraction.
 */

#include "common.h"
#include "model_client.h"
#include "schema.h"

struct ExtractionResult {
    FieldSchema schema;
    size_t      total_found = 0;    // entries in the model's array before filtering
    string      model;
    string      extracted_at;
};

string build_extraction_prompt(const string& latex);

// Removes a surrounding ``` / ```json fence and stray backticks.
string strip_code_fences(const string& raw);

// First top-level [...] in `text`, matched bracket by bracket with JSON strings
// skipped. Empty when there is no balanced array.
string find_json_array(const string& text);

// Fence stripping + array location + json::parse. Throws PipelineError(InvalidModelOutput)
// carrying the raw and cleaned text.
json parse_model_output(const string& raw);

ExtractionResult extract_schema(const string& latex, ModelClient& model, int max_tokens);

json extraction_to_json(const ExtractionResult& r);
