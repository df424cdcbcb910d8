#pragma once
/**
 * TexFill — Discord webhook logging
 *
 * Fire-and-forget embeds for operators. Disabled when no webhook URL is configured.
 * Only ids, counts and engine names are sent, never template or value content.
 */

#include "common.h"

void discord_init(const string& webhook_url);

// Send a rich embed to the configured Discord webhook
void discord_log(const string& title, const string& description, int color = 0x7C5CFF);

// Convenience helpers
void discord_log_extraction(const string& model, size_t fields, size_t total_found);
void discord_log_generation(const string& engine, size_t attempts, size_t pdf_bytes);
void discord_log_error(const string& context, const string& kind, const string& error);
void discord_log_server_start(int port, const vector<string>& engines, bool model_ready);
