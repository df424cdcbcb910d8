/**
 * TexFill — Language-model client implementation
 *
 * Same transport as every other outbound call in the server: the payload and the
 * auth header go to files in a private scratch directory (so the key never shows
 * up in a process listing) and curl posts them.
 */

#include "model_client.h"

// curl's exit code for "operation timed out"
static constexpr int CURL_TIMEOUT_EXIT = 28;

CurlChatClient::CurlChatClient(ModelSettings settings, WorkspaceOptions scratch)
    : settings_(std::move(settings)), scratch_(std::move(scratch)) {
    scratch_.prefix = "model-";
}

string CurlChatClient::content_from_response(const json& rj) {
    if (rj.contains("error") && rj["error"].is_object()) {
        throw ModelError(json_str(rj["error"], "message", "Model API error"));
    }

    if (!rj.contains("choices") || !rj["choices"].is_array() || rj["choices"].empty()) {
        throw ModelError("Model response contained no choices");
    }

    const json& choice = rj["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw ModelError("Model response contained no message");
    }

    string content = json_str(choice["message"], "content");
    if (content.empty()) throw ModelError("Model returned an empty response");
    return content;
}

string CurlChatClient::complete(const string& prompt, int max_tokens) {
    if (settings_.api_key.empty()) throw ModelError("Model API key is not configured");

    json payload = {
        {"model", settings_.model},
        {"messages", json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"max_tokens", max_tokens},
        {"temperature", settings_.temperature},
        {"top_p", settings_.top_p}
    };

    return with_workspace(scratch_, [&](Workspace& ws) -> string {
        fs::path pf = ws.file("payload.json");
        fs::path hf = ws.file("headers.txt");
        fs::path rf = ws.file("response.json");

        { ofstream f(hf); f << "Authorization: Bearer " << settings_.api_key << "\r\nContent-Type: application/json"; }
        { ofstream f(pf); f << payload.dump(-1, ' ', false, json::error_handler_t::replace); }

        string cmd = escape_arg(settings_.curl_path) +
                     " -s -S --max-time " + to_string(settings_.timeout_sec) +
                     " -X POST " + escape_arg(settings_.endpoint) +
                     " -H @" + escape_arg(hf.string()) +
                     " -d @" + escape_arg(pf.string()) +
                     " -o " + escape_arg(rf.string()) +
                     " -w " + escape_arg("%{http_code}");

        auto start = std::chrono::steady_clock::now();
        int rc = 0;
        string out = trim(exec_command(cmd, rc));
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (rc == CURL_TIMEOUT_EXIT) {
            throw ModelTimeout("Timeout after " + to_string(settings_.timeout_sec) + "s");
        }
        if (rc != 0) {
            throw ModelError("Model request failed (curl exit " + to_string(rc) + "): " + truncate_preview(out, 200));
        }

        string body = read_file_binary(rf);
        if (body.empty()) throw ModelError("Empty response from model provider");

        json rj;
        try {
            rj = json::parse(body);
        } catch (const json::parse_error& e) {
            throw ModelError(string("Model provider returned non-JSON response: ") + e.what());
        }

        string http_code = out.size() >= 3 ? out.substr(out.size() - 3) : out;
        cout << TEXFILL_LOG "Model " << settings_.model << " answered HTTP " << http_code
             << " in " << ms << "ms" << endl;

        if (!http_code.empty() && http_code[0] != '2' && !(rj.contains("error") && rj["error"].is_object())) {
            throw ModelError("Model provider returned HTTP " + http_code);
        }

        return content_from_response(rj);
    });
}
