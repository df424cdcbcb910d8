#pragma once
/**
 * TexFill — Value injection into LaTeX templates
 *
 * Placeholder conventions, applied per field id in this order:
 *   1. \newcommand{\id}{...}   (also \renewcommand, starred, \newcommand\id{...})
 *   2. \def\id{...}
 *   3. {id} or [id] as a bare token
 *   4. \VAR{id}
 *   5. <<id>>
 * Conventions 1 and 2 replace only the definition body; 3-5 replace the whole token.
 */

#include "common.h"
#include "schema.h"

// Escapes text for LaTeX text mode in a single pass, so nothing produced for one
// character is escaped again by the rule for another.
string escape_latex(const string& text);

// Backslash-escapes every ECMAScript regex metacharacter.
string escape_regex(const string& text);

// Converts the JSON "values" object of a request. Throws PipelineError(BadRequest)
// when `values` is not an object. null becomes "", non-strings are stringified.
ValueMap value_map_from_json(const json& values);

// Restricts `values` to the ids of `schema`; schema ids without a value map to "".
ValueMap complete_values(const FieldSchema& schema, const ValueMap& values);

// Substitutes every value into `tpl`. Each value is written once and never rescanned
// for other fields' placeholders. Keys that are not usable field ids (empty after
// normalization, or longer than MAX_FIELD_ID_LENGTH) are ignored. Throws PipelineError(MissingStructure) when the
// result lacks \documentclass or \begin{document}.
string inject_values(const string& tpl, const ValueMap& values);
