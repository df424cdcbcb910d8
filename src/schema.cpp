/**
 * TexFill — Field schema types implementation
 */

#include "schema.h"

string normalize_field_id(const string& raw) {
    string out;
    out.reserve(raw.size());

    for (unsigned char c : raw) {
        char lc = static_cast<char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '_') out += lc;
    }

    return out;
}

static string default_to_string(const json& item) {
    if (!item.contains("default")) return "";
    const json& d = item["default"];

    if (d.is_string()) return trim(d.get<string>());
    if (d.is_null()) return "";
    return trim(d.dump());
}

bool field_from_json(const json& item, FieldDescriptor& out) {
    if (!item.is_object()) return false;

    string id    = json_str(item, "id");
    string label = json_str(item, "label");

    if (id.empty() || label.empty()) return false;

    FieldDescriptor f;
    f.id    = normalize_field_id(id);
    f.label = trim(label);
    f.def   = default_to_string(item);

    if (f.id.empty() || f.id.size() > MAX_FIELD_ID_LENGTH || f.label.empty()) return false;

    out = std::move(f);
    return true;
}

FieldSchema schema_from_json(const json& arr) {
    FieldSchema schema;
    if (!arr.is_array()) return schema;

    set<string> seen;

    for (const auto& item : arr) {
        FieldDescriptor f;
        if (!field_from_json(item, f)) continue;
        if (!seen.insert(f.id).second) continue;
        schema.push_back(std::move(f));
    }

    return schema;
}

json field_to_json(const FieldDescriptor& f) {
    return {{"id", f.id}, {"label", f.label}, {"default", f.def}};
}

json schema_to_json(const FieldSchema& schema) {
    json arr = json::array();
    for (const auto& f : schema) arr.push_back(field_to_json(f));
    return arr;
}
