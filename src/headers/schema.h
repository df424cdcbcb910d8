#pragma once
/**
 * TexFill — Field schema types
 *
 * A FieldSchema is the ordered list of fillable fields found in a template.
 * Wire shape: [ { "id": "name", "label": "Full Name", "default": "John Doe" }, ... ]
 */

#include "common.h"

struct FieldDescriptor {
    string id;        // [a-z0-9_]+, unique within a schema
    string label;     // non-empty display text
    string def;       // default value, may be empty
};

// Longer ids are rejected by the schema and ignored by the injector
constexpr size_t MAX_FIELD_ID_LENGTH = 64;

using FieldSchema = vector<FieldDescriptor>;
using ValueMap    = map<string, string>;

// Lowercases and drops every character outside [a-z0-9_]. "Full Name!" -> "fullname"
string normalize_field_id(const string& raw);

// Validates one raw schema entry. Returns false (entry dropped) when `id` or
// `label` is missing, not a string, or empty after normalization/trimming, or when
// the id is longer than MAX_FIELD_ID_LENGTH.
bool field_from_json(const json& item, FieldDescriptor& out);

// Keeps the valid entries of a JSON array in order, dropping duplicate ids.
FieldSchema schema_from_json(const json& arr);

json field_to_json(const FieldDescriptor& f);
json schema_to_json(const FieldSchema& schema);
