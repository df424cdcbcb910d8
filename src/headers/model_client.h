#pragma once
/**
 * TexFill — Language-model client
 *
 * The extractor only sees ModelClient: a prompt goes in, response text comes out.
 * CurlChatClient talks to any OpenAI-compatible chat/completions endpoint (Gemini's
 * OpenAI-compat endpoint by default) through curl.
 */

#include "common.h"
#include "workspace.h"

class ModelTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ModelClient {
public:
    virtual ~ModelClient() = default;

    // Single blocking completion. Throws ModelTimeout past the configured budget,
    // ModelError for any other failure.
    virtual string complete(const string& prompt, int max_tokens) = 0;

    virtual string name() const = 0;
    virtual bool configured() const { return true; }
};

struct ModelSettings {
    string endpoint    = "https://generativelanguage.googleapis.com/v1beta/openai/chat/completions";
    string api_key;
    string model       = "gemini-2.0-flash";
    int    max_output_tokens = 4000;
    double temperature = 0.1;
    double top_p       = 0.8;
    int    timeout_sec = 45;
    string curl_path   = "curl";
};

class CurlChatClient : public ModelClient {
public:
    CurlChatClient(ModelSettings settings, WorkspaceOptions scratch);

    string complete(const string& prompt, int max_tokens) override;
    string name() const override { return settings_.model; }
    bool configured() const override { return !settings_.api_key.empty(); }

    // Pulls choices[0].message.content out of a chat/completions response body.
    static string content_from_response(const json& rj);

private:
    ModelSettings    settings_;
    WorkspaceOptions scratch_;
};
