#pragma once
/**
 * TexFill — Pipeline error taxonomy
 *
 * Every terminal failure of an extraction or generation request is raised as a
 * PipelineError and rendered to the client as:
 *   { "error": "<message>", "kind": "<ErrorKind>", "troubleshooting": [...], ...details }
 */

#include "common.h"

enum class ErrorKind {
    MalformedTemplate,
    ExtractionTimeout,
    InvalidModelOutput,
    NoFieldsFound,
    ModelUnavailable,
    MissingStructure,
    CompilationFailed,
    WorkspaceError,
    BadRequest,
    Internal
};

const char* error_kind_name(ErrorKind kind);
int http_status_for(ErrorKind kind);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const string& message,
                  vector<string> troubleshooting = {}, json details = json::object());

    ErrorKind kind() const { return kind_; }
    const vector<string>& troubleshooting() const { return troubleshooting_; }
    const json& details() const { return details_; }

private:
    ErrorKind      kind_;
    vector<string> troubleshooting_;
    json           details_;
};

json error_payload(const PipelineError& e);

// Wraps an exception no pipeline stage anticipated, so handlers still answer with
// the structured payload.
PipelineError internal_error(const std::exception& e);
