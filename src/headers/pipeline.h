#pragma once
/**
 * TexFill — Generation pipeline
 *
 * inject values -> fresh workspace -> compiler chain -> PDF bytes.
 * The workspace is released whether compilation succeeds or throws.
 */

#include "common.h"
#include "config.h"
#include "compiler.h"
#include "schema.h"

struct GenerationRequest {
    string   tpl;
    ValueMap values;
};

// Validates a /generate-pdf body: {"template": string, "values": object, "schema"?: array}.
// With a schema, values are restricted to its ids and missing ones become "".
GenerationRequest parse_generation_request(const json& body, size_t max_template_bytes);

CompileResult generate_pdf(const AppConfig& cfg, const GenerationRequest& req);
