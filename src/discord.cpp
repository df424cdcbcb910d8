/**
 * TexFill — Discord webhook logging implementation
 * Sends rich embeds to a Discord channel via webhook + curl.
 */

#include "discord.h"
#include "workspace.h"

static mutex  g_discord_mutex;
static string g_webhook_url;

static string webhook_url() {
    lock_guard<mutex> lk(g_discord_mutex);
    return g_webhook_url;
}

// ─── Internal: fire-and-forget POST via curl ────────────────────────────────

static void discord_send(const json& payload) {
    string url = webhook_url();
    if (url.empty()) return;

    thread([payload, url]() {
        try {
            WorkspaceOptions opts;
            opts.prefix = "discord-";

            with_workspace(opts, [&](Workspace& ws) {
                fs::path body = ws.file("payload.json");
                if (!write_file_binary(body, payload.dump())) {
                    cerr << TEXFILL_LOG "[discord] Could not write payload" << endl;
                    return;
                }

                string cmd = "curl -s -o /dev/null --max-time 10 -X POST -H \"Content-Type: application/json\" -d @" +
                    escape_arg(body.string()) + " " + escape_arg(url);
                int code = 0;
                exec_command(cmd, code);
                if (code != 0) cerr << TEXFILL_LOG "[discord] Webhook POST failed (curl exit " << code << ")" << endl;
            });
        } catch (const std::exception& e) {
            cerr << TEXFILL_LOG "[discord] " << e.what() << endl;
        }
    }).detach();
}

// ─── Public API ─────────────────────────────────────────────────────────────

void discord_init(const string& webhook_url) {
    lock_guard<mutex> lk(g_discord_mutex);
    g_webhook_url = webhook_url;
}

void discord_log(const string& title, const string& description, int color) {
    json embed = {
        {"title",       title},
        {"description", description},
        {"color",       color},
        {"timestamp",   iso_now()},
        {"footer",      {{"text", "📄 TexFill"}}}
    };
    json payload = {{"embeds", json::array({embed})}};
    discord_send(payload);
}

void discord_log_extraction(const string& model, size_t fields, size_t total_found) {
    string desc = "🧠 **Model** › `" + model + "`\n"
                  "🔢 **Fields** › `" + to_string(fields) + "` of `" + to_string(total_found) + "` proposed";
    discord_log("🔎 Schema Extracted", desc, 0xA855F7);  // Purple
}

void discord_log_generation(const string& engine, size_t attempts, size_t pdf_bytes) {
    string desc = "⚙️ **Engine** › `" + engine + "`\n"
                  "🔁 **Attempts** › `" + to_string(attempts) + "`\n"
                  "📦 **Size** › `" + to_string(pdf_bytes / 1024) + " KB`";
    discord_log("📄 PDF Generated", desc, 0x57F287);
}

void discord_log_error(const string& context, const string& kind, const string& error) {
    string desc = "🔍 **Context** › `" + context + "`\n"
                  "🏷️ **Kind** › `" + kind + "`\n"
                  "💥 **Error** › " + truncate_preview(error, 500);
    discord_log("❌ Operation Failed", desc, 0xED4245);  // Discord red
}

void discord_log_server_start(int port, const vector<string>& engines, bool model_ready) {
    string desc = "🌐 **Port** › `" + to_string(port) + "`\n";
    desc += (model_ready ? "✅" : "❌") + string(" Model API key\n");

    desc += "\n**⚙️ Compiler chain**\n";
    for (const auto& e : engines) desc += "• `" + e + "`\n";

    discord_log("🚀 Server Online", desc, 0x5865F2);  // Discord blurple
}
