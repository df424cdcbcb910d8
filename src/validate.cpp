/**
 * TexFill — Static template checks
 */

#include "validate.h"

// Counts unescaped occurrences of `ch` (\{ and \} are literal braces in LaTeX).
static int count_unescaped(const string& src, char ch) {
    int n = 0;

    for (size_t i = 0; i < src.size(); i++) {
        if (src[i] == '\\') { i++; continue; }
        if (src[i] == ch) n++;
    }

    return n;
}

LatexValidation validate_latex(const string& src) {
    LatexValidation v;
    v.structure.has_document_class = src.find("\\documentclass") != string::npos;
    v.structure.has_begin_document = src.find("\\begin{document}") != string::npos;
    v.structure.has_end_document   = src.find("\\end{document}") != string::npos;
    v.structure.has_new_commands   = src.find("\\newcommand") != string::npos;
    v.structure.has_def_commands   = src.find("\\def\\") != string::npos;

    if (!v.structure.has_document_class) v.errors.push_back("Missing \\documentclass declaration");
    if (!v.structure.has_begin_document) v.errors.push_back("Missing \\begin{document}");
    if (!v.structure.has_end_document)   v.errors.push_back("Missing \\end{document}");
    v.valid = v.errors.empty();

    if (!v.structure.has_new_commands && !v.structure.has_def_commands) {
        v.warnings.push_back("No \\newcommand or \\def found - template might not have fillable fields");
    }

    int open  = count_unescaped(src, '{');
    int close = count_unescaped(src, '}');

    if (open != close) {
        v.warnings.push_back("Unbalanced braces: " + to_string(open) + " open, " + to_string(close) + " close");
    }

    return v;
}

json validation_to_json(const LatexValidation& v) {
    return {
        {"valid", v.valid},
        {"errors", v.errors},
        {"warnings", v.warnings},
        {"structure", {
            {"hasDocumentClass", v.structure.has_document_class},
            {"hasBeginDocument", v.structure.has_begin_document},
            {"hasEndDocument",   v.structure.has_end_document},
            {"hasNewCommands",   v.structure.has_new_commands},
            {"hasDefCommands",   v.structure.has_def_commands}
        }}
    };
}
