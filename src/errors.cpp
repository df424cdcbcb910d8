/**
 * TexFill — Pipeline error taxonomy implementation
 */

#include "errors.h"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedTemplate:  return "MalformedTemplate";
        case ErrorKind::ExtractionTimeout:  return "ExtractionTimeout";
        case ErrorKind::InvalidModelOutput: return "InvalidModelOutput";
        case ErrorKind::NoFieldsFound:      return "NoFieldsFound";
        case ErrorKind::ModelUnavailable:   return "ModelUnavailable";
        case ErrorKind::MissingStructure:   return "MissingStructure";
        case ErrorKind::CompilationFailed:  return "CompilationFailed";
        case ErrorKind::WorkspaceError:     return "WorkspaceError";
        case ErrorKind::BadRequest:         return "BadRequest";
        case ErrorKind::Internal:           return "Internal";
    }
    return "Unknown";
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedTemplate:
        case ErrorKind::NoFieldsFound:
        case ErrorKind::MissingStructure:
        case ErrorKind::BadRequest:
            return 400;
        case ErrorKind::ModelUnavailable:
            return 503;
        case ErrorKind::ExtractionTimeout:
            return 504;
        case ErrorKind::InvalidModelOutput:
        case ErrorKind::CompilationFailed:
        case ErrorKind::WorkspaceError:
        case ErrorKind::Internal:
            return 500;
    }
    return 500;
}

PipelineError::PipelineError(ErrorKind kind, const string& message,
                             vector<string> troubleshooting, json details)
    : std::runtime_error(message),
      kind_(kind),
      troubleshooting_(std::move(troubleshooting)),
      details_(details.is_object() ? std::move(details) : json::object()) {}

json error_payload(const PipelineError& e) {
    json out = e.details();
    out["error"] = e.what();
    out["kind"]  = error_kind_name(e.kind());
    out["troubleshooting"] = e.troubleshooting();
    return out;
}

PipelineError internal_error(const std::exception& e) {
    return PipelineError(ErrorKind::Internal, string("Internal server error: ") + e.what(),
        {"Retry the request", "If the problem persists, check the server logs"});
}
