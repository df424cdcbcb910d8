#pragma once
/**
 * TexFill — Static template checks for the /validate-latex endpoint
 */

#include "common.h"

struct LatexStructure {
    bool has_document_class = false;
    bool has_begin_document = false;
    bool has_end_document   = false;
    bool has_new_commands   = false;
    bool has_def_commands   = false;
};

struct LatexValidation {
    bool           valid = true;
    LatexStructure structure;
    vector<string> errors;
    vector<string> warnings;
};

LatexValidation validate_latex(const string& src);
json validation_to_json(const LatexValidation& v);
