/**
 * TexFill — Value injection into LaTeX templates
 */

#include "injector.h"
#include "errors.h"

#include <cctype>

// Commands whose brace argument is never a fillable token
static const set<string> PROTECTED_COMMANDS = {
    "\\begin", "\\end", "\\documentclass", "\\usepackage", "\\RequirePackage",
    "\\VAR", "\\input", "\\include"
};

// ─── Escaping ───────────────────────────────────────────────────────────────

string escape_latex(const string& text) {
    string out;
    out.reserve(text.size() + text.size() / 4);

    for (char c : text) {
        switch (c) {
            case '\\': out += "\\textbackslash{}"; break;
            case '{':  out += "\\{"; break;
            case '}':  out += "\\}"; break;
            case '$': case '&': case '%': case '#': case '_':
                out += '\\';
                out += c;
                break;
            case '^':  out += "\\textasciicircum{}"; break;
            case '~':  out += "\\textasciitilde{}"; break;
            default:   out += c;
        }
    }

    return out;
}

string escape_regex(const string& text) {
    static const string SPECIAL = ".*+?^${}()|[]\\";
    string out;

    for (char c : text) {
        if (SPECIAL.find(c) != string::npos) out += '\\';
        out += c;
    }

    return out;
}

// regex_replace treats '$' in the format string as a back-reference marker
static string format_literal(const string& value) {
    string out;

    for (char c : value) {
        if (c == '$') out += "$$";
        else out += c;
    }

    return out;
}

// ─── Value maps ─────────────────────────────────────────────────────────────

ValueMap value_map_from_json(const json& values) {
    if (!values.is_object()) {
        throw PipelineError(ErrorKind::BadRequest, "Invalid payload: \"values\" must be an object",
            {"Send a JSON body of the form {\"template\": \"...\", \"values\": {\"id\": \"value\"}}"});
    }

    ValueMap out;

    for (auto& [key, val] : values.items()) {
        if (val.is_null())        out[key] = "";
        else if (val.is_string()) out[key] = val.get<string>();
        else                      out[key] = val.dump();
    }

    return out;
}

ValueMap complete_values(const FieldSchema& schema, const ValueMap& values) {
    ValueMap out;

    for (const auto& f : schema) {
        auto it = values.find(f.id);
        out[f.id] = (it != values.end()) ? it->second : "";
    }

    return out;
}

// ─── Conventions 1 & 2: definition bodies ───────────────────────────────────

// Index of the brace closing the group whose body starts at `pos`, honouring
// nesting and backslash escapes. npos when unbalanced.
static size_t find_closing_brace(const string& s, size_t pos) {
    int depth = 1;

    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];

        if (c == '\\') { i++; continue; }
        if (c == '{') depth++;
        else if (c == '}' && --depth == 0) return i;
    }

    return string::npos;
}

// `head` must match up to and including the opening brace of the body.
static string replace_definition_bodies(const string& doc, const regex& head, const string& value) {
    string out;
    size_t pos = 0;
    std::smatch m;

    while (pos < doc.size() && std::regex_search(doc.cbegin() + pos, doc.cend(), m, head)) {
        size_t body_start = pos + m.position(0) + m.length(0);
        size_t close = find_closing_brace(doc, body_start);

        if (close == string::npos) break;   // unbalanced: leave the rest untouched

        out.append(doc, pos, body_start - pos);
        out += value;
        out += '}';
        pos = close + 1;
    }

    out.append(doc, pos, string::npos);
    return out;
}

// ─── Convention 3: bare {id} / [id] tokens ──────────────────────────────────

static bool preceded_by_escape(const string& doc, size_t pos) {
    size_t n = 0;
    while (pos > n && doc[pos - n - 1] == '\\') n++;
    return n % 2 == 1;
}

// For a token directly after `]` or `}`, walks back over the preceding argument
// groups and returns the command they belong to ("" when there is none).
// "\documentclass[11pt]{id}" -> "\documentclass"
static string owning_command(const string& doc, size_t pos) {
    size_t i = pos;

    while (i > 0 && (doc[i - 1] == ']' || doc[i - 1] == '}') && !preceded_by_escape(doc, i - 1)) {
        char close = doc[i - 1];
        char open  = close == ']' ? '[' : '{';
        int  depth = 0;
        bool found = false;
        size_t j = i;

        while (j > 0) {
            j--;
            if (preceded_by_escape(doc, j)) continue;
            if (doc[j] == close) depth++;
            else if (doc[j] == open && --depth == 0) { found = true; break; }
        }

        if (!found) return "";
        i = j;
    }

    if (i == pos) return "";

    size_t end = i;
    if (end > 0 && doc[end - 1] == '*') end--;

    size_t s = end;
    while (s > 0 && (std::isalpha(static_cast<unsigned char>(doc[s - 1])) || doc[s - 1] == '@')) s--;

    if (s == end || s == 0 || doc[s - 1] != '\\') return "";
    return doc.substr(s - 1, end - (s - 1));
}

static string replace_bare_tokens(const string& doc, const string& key, const string& value) {
    regex token(R"((\\[A-Za-z@]+\*?)?(\{)" + key + R"(\}|\[)" + key + R"(\]))");
    string out;
    size_t last = 0;

    for (auto it = std::sregex_iterator(doc.begin(), doc.end(), token); it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        size_t start = static_cast<size_t>(m.position(0));
        string cmd = m[1].matched ? m[1].str() : "";
        string tok = m[2].str();
        bool brace = tok[0] == '{';

        // A token following other arguments ("\cmd[opt]{id}", "\href{url}{id}") still belongs to \cmd
        string owner = cmd.empty() ? owning_command(doc, start) : cmd;
        if (!owner.empty() && owner.back() == '*') owner.pop_back();

        out.append(doc, last, start - last);

        if (cmd.empty() && preceded_by_escape(doc, start)) {
            out += m.str(0);                      // \{id} is literal text
        } else if (owner.empty()) {
            out += value;
        } else if (!brace || PROTECTED_COMMANDS.count(owner)) {
            out += m.str(0);                      // optional argument or structural command
        } else {
            out += cmd + "{" + value + "}";
        }

        last = start + static_cast<size_t>(m.length(0));
    }

    out.append(doc, last, string::npos);
    return out;
}

// ─── Injection ──────────────────────────────────────────────────────────────

static string inject_field(const string& doc, const string& id, const string& value) {
    string key = escape_regex(id);
    string processed = doc;

    regex newcommand(R"(\\(?:re)?newcommand\*?\s*(?:\{\s*\\)" + key + R"(\s*\}|\\)" + key +
                     R"((?![A-Za-z@])))" R"(\s*(?:\[\d\]\s*)?(?:\[[^\]]*\]\s*)?\{)");
    processed = replace_definition_bodies(processed, newcommand, value);

    regex def(R"(\\def\\)" + key + R"((?![A-Za-z@])\s*\{)");
    processed = replace_definition_bodies(processed, def, value);

    processed = replace_bare_tokens(processed, key, value);

    regex var(R"(\\VAR\{)" + key + R"(\})");
    processed = std::regex_replace(processed, var, format_literal(value));

    regex angle("<<" + key + ">>");
    processed = std::regex_replace(processed, angle, format_literal(value));

    return processed;
}

// Placeholders are first rewritten to markers; markers become values in one final
// pass, so text inside an injected value is never matched against another field.
static constexpr char MARKER = '\x1A';

static string marker_for(size_t index) {
    return string(1, MARKER) + to_string(index) + MARKER;
}

// Doubles marker characters already present in the template
static string quote_markers(const string& tpl) {
    string out;
    out.reserve(tpl.size());

    for (char c : tpl) {
        out += c;
        if (c == MARKER) out += MARKER;
    }

    return out;
}

static string expand_markers(const string& doc, const vector<string>& values) {
    string out;
    out.reserve(doc.size());

    for (size_t i = 0; i < doc.size(); i++) {
        if (doc[i] != MARKER) { out += doc[i]; continue; }

        if (i + 1 < doc.size() && doc[i + 1] == MARKER) {   // quoted template character
            out += MARKER;
            i++;
            continue;
        }

        size_t end = i + 1;
        while (end < doc.size() && std::isdigit(static_cast<unsigned char>(doc[end]))) end++;

        if (end > i + 1 && end - i - 1 <= 9 && end < doc.size() && doc[end] == MARKER) {
            size_t index = std::stoul(doc.substr(i + 1, end - i - 1));
            if (index < values.size()) {
                out += values[index];
                i = end;
                continue;
            }
        }

        out += MARKER;
    }

    return out;
}

// Keys that could never be a field id are ignored like any other unknown id
static bool injectable_id(const string& id) {
    return !id.empty() && id.size() <= MAX_FIELD_ID_LENGTH &&
           id.find(MARKER) == string::npos && !normalize_field_id(id).empty();
}

string inject_values(const string& tpl, const ValueMap& values) {
    string processed = quote_markers(tpl);
    vector<string> escaped;

    for (const auto& [id, raw] : values) {
        if (!injectable_id(id)) {
            cerr << TEXFILL_LOG "Ignoring value for invalid field id (" << id.size() << " chars)" << endl;
            continue;
        }

        escaped.push_back(escape_latex(raw));
        processed = inject_field(processed, id, marker_for(escaped.size() - 1));
    }

    processed = expand_markers(processed, escaped);

    if (processed.find("\\documentclass") == string::npos) {
        throw PipelineError(ErrorKind::MissingStructure, "Invalid LaTeX template: Missing \\documentclass",
            {"Make sure your template starts with \\documentclass{...}",
             "Include \\begin{document} and \\end{document}",
             "Check that the template is complete LaTeX code"},
            {{"missing", "\\documentclass"}});
    }

    if (processed.find("\\begin{document}") == string::npos) {
        throw PipelineError(ErrorKind::MissingStructure, "Invalid LaTeX template: Missing \\begin{document}",
            {"Add \\begin{document} after your preamble",
             "Make sure to include \\end{document} at the end",
             "Verify the template structure is correct"},
            {{"missing", "\\begin{document}"}});
    }

    return processed;
}
